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
// protocol_object.h derived from ports/port_object.h

#ifndef PROTOCOL_OBJECT_H
#define PROTOCOL_OBJECT_H

#include <string>
#include <utility>
#include <vector>

#include "protocol/protocol_item.h"
#include "protocol/protocol_merge.h"

//-------------------------------------------------------------------------
// ProtocolObject is the value of a Source or Destination Ports field.  it
// has the same shape as a NetworkObject: groups of protocol lists and
// bare protocol lists.  a protocol list is one line of text which is one
// item, or two when "protocol any" stands for both tcp and udp.
//-------------------------------------------------------------------------

namespace fwcap
{
struct ProtocolList
{
    ProtocolList() = default;
    explicit ProtocolList(const std::string& s) : label(s) { }

    std::string label;
    std::vector<ProtocolListItem> items;
};

struct ProtocolGroup
{
    ProtocolGroup() = default;
    explicit ProtocolGroup(const std::string& s) : label(s) { }

    std::string label;
    std::vector<ProtocolList> lists;
};

class ProtocolObjectItem
{
public:
    explicit ProtocolObjectItem(ProtocolGroup&& g) : group(true), proto_group(std::move(g)) { }
    explicit ProtocolObjectItem(ProtocolList&& p) : group(false), proto_list(std::move(p)) { }

    bool is_group() const
    { return group; }

    const ProtocolGroup& get_group() const
    { return proto_group; }

    const ProtocolList& get_protocol_list() const
    { return proto_list; }

    const std::string& get_label() const
    { return group ? proto_group.label : proto_list.label; }

    void collect(std::vector<ProtocolListItem>&) const;

private:
    bool group;
    ProtocolGroup proto_group;
    ProtocolList proto_list;
};

struct ProtocolObject
{
    ProtocolObject() = default;
    explicit ProtocolObject(const std::string& s) : label(s) { }

    unsigned item_count() const;

    // unique l3 entries first, then merged l4 entries
    std::vector<OptimizedProtocol> optimize() const;

    std::string label;
    std::vector<ProtocolObjectItem> items;
};
}
#endif

