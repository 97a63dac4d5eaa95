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
// protocol_ids.h derived from protocols/protocol_ids.h

#ifndef PROTOCOL_IDS_H
#define PROTOCOL_IDS_H

#include <cstdint>
#include <type_traits>

//  Convert enum to a value cast to the enum's underlying type.
template<typename E>
inline constexpr typename std::underlying_type<E>::type to_utype(E enumerator)
{
    return static_cast<typename std::underlying_type<E>::type>(enumerator);
}

/*
 * Below is a partial list of protocol numbers for the IP protocols.
 *  Defined at:
 * http://www.iana.org/assignments/protocol-numbers/protocol-numbers.xhtml
 */
enum class IpProtocol : std::uint8_t
{
    HOPOPTS = 0,
    ICMPV4 = 1,
    IGMP = 2,
    IPIP = 4,
    TCP = 6,
    UDP = 17,
    GRE = 47,
    ESP = 50,
    AUTH = 51,
    ICMPV6 = 58,
    PIM = 103,
    RESERVED = 255,
};

#define MAX_PORT 65535

// only tcp and udp carry ports
inline bool is_l4_protocol(uint8_t proto)
{ return proto == to_utype(IpProtocol::TCP) or proto == to_utype(IpProtocol::UDP); }

inline bool is_icmp_protocol(uint8_t proto)
{ return proto == to_utype(IpProtocol::ICMPV4) or proto == to_utype(IpProtocol::ICMPV6); }

#endif

