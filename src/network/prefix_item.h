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
// prefix_item.h derived from ports/port_item.h

#ifndef PREFIX_ITEM_H
#define PREFIX_ITEM_H

#include <string>

#include "ip/ip_addr.h"

//-------------------------------------------------------------------------
// Prefix List Item supports
// a.b.c.d/n, a.b.c.d, a.b.c.d-e.f.g.h, hostname
//
// so it indicates a CIDR block, an inclusive address range or a single
// resolved host.  capacity is the number of CIDR blocks it takes to
// express the item: 1 for a prefix or a host, the minimal decomposition
// count for a range.
//-------------------------------------------------------------------------

namespace fwcap
{
class HostResolver;

enum PrefixItemType
{
    PIT_PREFIX,
    PIT_RANGE,
    PIT_HOSTNAME
};

class PrefixListItem
{
public:
    PrefixListItem() = default;

    // the label is the text as written
    IpRet set_prefix(const char* text);
    IpRet set_prefix(const std::string& label, const Ip4& addr, unsigned bits);

    IpRet set_range(const char* text);
    IpRet set_range(const std::string& label, const Ip4& start, const Ip4& end);

    IpRet set_hostname(const char* name, HostResolver&);
    void set_hostname(const std::string& name, const Ip4& addr);

    PrefixItemType get_type() const
    { return type; }

    const std::string& get_label() const
    { return label; }

    // a prefix starts at its address as written, not at the network
    const Ip4& get_start() const
    { return start; }

    const Ip4& get_end() const
    { return end; }

    unsigned get_bits() const
    { return bits; }

    Capacity capacity() const
    { return blocks; }

    const char* get_type_str() const;

private:
    PrefixItemType type = PIT_PREFIX;
    std::string label;
    Ip4 start;
    Ip4 end;
    uint8_t bits = IP4_MAX_BITS;
    Capacity blocks = 1;
};
}
#endif

