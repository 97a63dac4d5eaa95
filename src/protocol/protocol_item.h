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
// protocol_item.h derived from ports/port_item.h

#ifndef PROTOCOL_ITEM_H
#define PROTOCOL_ITEM_H

#include <string>

#include "main/fwcap_types.h"

//-------------------------------------------------------------------------
// Protocol List Item supports
// tcp or udp with a port range, icmp or icmpv6 with an optional type and
// code, and any other ip protocol number.  two items are the same l3 item
// when protocol, type and code match; labels are never compared.
//-------------------------------------------------------------------------

namespace fwcap
{
enum ProtocolItemType
{
    PRT_TCP_UDP,
    PRT_ICMP,
    PRT_OTHER
};

class ProtocolListItem
{
public:
    ProtocolListItem() = default;

    // false when proto is not tcp/udp or lo > hi
    bool set_tcp_udp(const std::string& label, uint8_t proto, Port lo, Port hi);

    // type and code are -1 when absent; a code requires a type
    bool set_icmp(const std::string& label, uint8_t proto, int type = -1, int code = -1);

    // false for tcp, udp and icmp which have their own forms
    bool set_other(const std::string& label, uint8_t proto);

    ProtocolItemType get_type() const
    { return type; }

    const std::string& get_label() const
    { return label; }

    void set_label(const std::string& s)
    { label = s; }

    uint8_t get_protocol() const
    { return protocol; }

    // 0-0 for items without ports
    Port get_port_start() const
    { return port_start; }

    Port get_port_end() const
    { return port_end; }

    int get_icmp_type() const
    { return icmp_type; }

    int get_icmp_code() const
    { return icmp_code; }

    bool is_l4() const
    { return type == PRT_TCP_UDP; }

    bool same_l3(const ProtocolListItem&) const;

    // "label (protocol 6, port 80-81)"
    std::string to_string() const;

private:
    ProtocolItemType type = PRT_OTHER;
    std::string label;
    uint8_t protocol = 0;
    Port port_start = 0;
    Port port_end = 0;
    int icmp_type = -1;
    int icmp_code = -1;
};
}
#endif

