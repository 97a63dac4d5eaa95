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
// protocol_object.cc derived from ports/port_object.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "protocol_object.h"

using namespace fwcap;

void ProtocolObjectItem::collect(std::vector<ProtocolListItem>& leaves) const
{
    if ( !group )
    {
        leaves.insert(leaves.end(), proto_list.items.begin(), proto_list.items.end());
        return;
    }

    for ( const auto& pl : proto_group.lists )
        leaves.insert(leaves.end(), pl.items.begin(), pl.items.end());
}

unsigned ProtocolObject::item_count() const
{
    std::vector<ProtocolListItem> leaves;

    for ( const auto& item : items )
        item.collect(leaves);

    return leaves.size();
}

std::vector<OptimizedProtocol> ProtocolObject::optimize() const
{
    std::vector<ProtocolListItem> leaves;

    for ( const auto& item : items )
        item.collect(leaves);

    std::vector<OptimizedProtocol> out;
    unique_l3(leaves, out);
    merge_l4(leaves, out);
    return out;
}
