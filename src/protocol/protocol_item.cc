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
// protocol_item.cc derived from ports/port_item.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "protocol_item.h"

#include <cstdio>

#include "protocol/protocol_ids.h"

using namespace fwcap;

bool ProtocolListItem::set_tcp_udp(const std::string& s, uint8_t proto, Port lo, Port hi)
{
    if ( !is_l4_protocol(proto) or lo > hi )
        return false;

    type = PRT_TCP_UDP;
    label = s;
    protocol = proto;
    port_start = lo;
    port_end = hi;
    icmp_type = icmp_code = -1;
    return true;
}

bool ProtocolListItem::set_icmp(const std::string& s, uint8_t proto, int t, int c)
{
    if ( !is_icmp_protocol(proto) )
        return false;

    if ( t > 255 or c > 255 or (c >= 0 and t < 0) )
        return false;

    type = PRT_ICMP;
    label = s;
    protocol = proto;
    port_start = port_end = 0;
    icmp_type = t < 0 ? -1 : t;
    icmp_code = c < 0 ? -1 : c;
    return true;
}

bool ProtocolListItem::set_other(const std::string& s, uint8_t proto)
{
    if ( is_l4_protocol(proto) or is_icmp_protocol(proto) )
        return false;

    type = PRT_OTHER;
    label = s;
    protocol = proto;
    port_start = port_end = 0;
    icmp_type = icmp_code = -1;
    return true;
}

bool ProtocolListItem::same_l3(const ProtocolListItem& rhs) const
{
    return protocol == rhs.protocol and icmp_type == rhs.icmp_type and
        icmp_code == rhs.icmp_code;
}

std::string ProtocolListItem::to_string() const
{
    char buf[64] = "";

    switch ( type )
    {
    case PRT_TCP_UDP:
        if ( port_start == port_end )
            snprintf(buf, sizeof(buf), "protocol %u, port %u", protocol, port_start);
        else
            snprintf(buf, sizeof(buf), "protocol %u, port %u-%u", protocol, port_start, port_end);
        break;

    case PRT_ICMP:
        if ( icmp_code >= 0 )
            snprintf(buf, sizeof(buf), "protocol %u, type %d, code %d", protocol, icmp_type, icmp_code);
        else if ( icmp_type >= 0 )
            snprintf(buf, sizeof(buf), "protocol %u, type %d", protocol, icmp_type);
        else
            snprintf(buf, sizeof(buf), "protocol %u", protocol);
        break;

    case PRT_OTHER:
        snprintf(buf, sizeof(buf), "protocol %u", protocol);
        break;
    }

    std::string s = label;
    s += " (";
    s += buf;
    s += ")";
    return s;
}
