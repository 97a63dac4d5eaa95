//--------------------------------------------------------------------------
// Copyright (C) 2014-2024 Cisco and/or its affiliates. All rights reserved.
//
// This program is free software; you can redistribute it and/or modify it
// under the terms of the GNU General Public License Version 2 as published
// by the Free Software Foundation.  You may not use, modify or distribute
// this program under any other version of the GNU General Public License.
//
// This program is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
// General Public License for more details.
//
// You should have received a copy of the GNU General Public License along
// with this program; if not, write to the Free Software Foundation, Inc.,
// 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
//--------------------------------------------------------------------------
// network_object.cc derived from ports/port_object.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "network_object.h"

#include <algorithm>

using namespace fwcap;

Capacity PrefixList::capacity() const
{
    Capacity n = 0;

    for ( const auto& item : items )
        n += item.capacity();

    return n;
}

Capacity NetworkGroup::capacity() const
{
    Capacity n = 0;

    for ( const auto& pl : lists )
        n += pl.capacity();

    return n;
}

void NetworkObjectItem::collect(std::vector<PrefixListItem>& leaves) const
{
    if ( !group )
    {
        leaves.insert(leaves.end(), prefix_list.items.begin(), prefix_list.items.end());
        return;
    }

    for ( const auto& pl : net_group.lists )
        leaves.insert(leaves.end(), pl.items.begin(), pl.items.end());
}

Capacity NetworkObjectOptimized::capacity() const
{
    Capacity n = 0;

    for ( const auto& op : prefixes )
        n += op.capacity;

    return n;
}

Capacity NetworkObject::capacity() const
{
    Capacity n = 0;

    for ( const auto& item : items )
        n += item.capacity();

    return n;
}

unsigned NetworkObject::item_count() const
{
    std::vector<PrefixListItem> leaves;

    for ( const auto& item : items )
        item.collect(leaves);

    return leaves.size();
}

NetworkObjectOptimized NetworkObject::optimize() const
{
    NetworkObjectOptimized opt;
    opt.label = label;

    std::vector<PrefixListItem> leaves;

    for ( const auto& item : items )
        item.collect(leaves);

    // equal starts keep their input order
    std::stable_sort(leaves.begin(), leaves.end(),
        [](const PrefixListItem& a, const PrefixListItem& b)
        { return a.get_start() < b.get_start(); });

    merge_prefixes(leaves, opt.prefixes);
    return opt;
}

