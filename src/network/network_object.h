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
// network_object.h derived from ports/port_object.h

#ifndef NETWORK_OBJECT_H
#define NETWORK_OBJECT_H

#include <string>
#include <utility>
#include <vector>

#include "network/network_merge.h"
#include "network/prefix_item.h"

//-------------------------------------------------------------------------
// NetworkObject is the value of a Source or Destination Networks field:
// a flat sequence of groups and prefix lists.  groups hold prefix lists
// only, never other groups.  every node owns its children.
//-------------------------------------------------------------------------

namespace fwcap
{
struct PrefixList
{
    PrefixList() = default;
    explicit PrefixList(const std::string& s) : label(s) { }

    Capacity capacity() const;

    std::string label;
    std::vector<PrefixListItem> items;
};

struct NetworkGroup
{
    NetworkGroup() = default;
    explicit NetworkGroup(const std::string& s) : label(s) { }

    Capacity capacity() const;

    std::string label;
    std::vector<PrefixList> lists;
};

class NetworkObjectItem
{
public:
    explicit NetworkObjectItem(NetworkGroup&& g) : group(true), net_group(std::move(g)) { }
    explicit NetworkObjectItem(PrefixList&& p) : group(false), prefix_list(std::move(p)) { }

    bool is_group() const
    { return group; }

    // only one of these is populated, see is_group()
    const NetworkGroup& get_group() const
    { return net_group; }

    const PrefixList& get_prefix_list() const
    { return prefix_list; }

    const std::string& get_label() const
    { return group ? net_group.label : prefix_list.label; }

    Capacity capacity() const
    { return group ? net_group.capacity() : prefix_list.capacity(); }

    // append every leaf item in order
    void collect(std::vector<PrefixListItem>&) const;

private:
    bool group;
    NetworkGroup net_group;
    PrefixList prefix_list;
};

struct NetworkObjectOptimized
{
    Capacity capacity() const;

    std::string label;
    std::vector<OptimizedPrefix> prefixes;
};

struct NetworkObject
{
    NetworkObject() = default;
    explicit NetworkObject(const std::string& s) : label(s) { }

    Capacity capacity() const;
    unsigned item_count() const;

    NetworkObjectOptimized optimize() const;

    std::string label;
    std::vector<NetworkObjectItem> items;
};
}
#endif

