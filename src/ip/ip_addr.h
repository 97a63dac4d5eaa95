//--------------------------------------------------------------------------
// Copyright (C) 2014-2024 Cisco and/or its affiliates. All rights reserved.
// Copyright (C) 1998-2013 Sourcefire, Inc.
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
// ip_addr.h derived from sfip/sf_ip.h

#ifndef IP_ADDR_H
#define IP_ADDR_H

#include <arpa/inet.h>

#include <cstdint>

#include "main/fwcap_types.h"

#define IP4_MAX_BITS 32
#define IP4_MAX_VALUE 0xffffffffu

enum IpRet
{
    IP_SUCCESS = 0,
    IP_FAILURE,
    IP_ARG_ERR,
    IP_INET_PARSE_ERR,
    IP_INVALID_MASK,
    IP_RANGE_ERR,
    IP_OVERFLOW,
    IP_RESOLVE_ERR,
    IP_NOT_IPV4,
    IP_MAX
};

typedef char IpString[INET_ADDRSTRLEN];

namespace fwcap
{
const char* ip_ret_str(IpRet);

// an IPv4 address held in host byte order so that integer comparison
// matches dotted decimal ordering
struct Ip4
{
    Ip4() = default;
    explicit Ip4(uint32_t v) : value(v) { }

    /* dotted quad, exactly four decimal octets 0-255 */
    IpRet set(const char* src);
    void set(uint32_t v)
    { value = v; }

    uint32_t get_value() const
    { return value; }

    /* host bits cleared or set for the given prefix length */
    Ip4 network(unsigned bits) const;
    Ip4 broadcast(unsigned bits) const;

    /* the next address; IP_OVERFLOW at 255.255.255.255 leaves next alone */
    IpRet successor(Ip4& next) const;

    bool is_aligned(unsigned bits) const
    { return network(bits).value == value; }

    bool equals(const Ip4& rhs) const
    { return value == rhs.value; }

    bool less_than(const Ip4& rhs) const
    { return value < rhs.value; }

    bool greater_than(const Ip4& rhs) const
    { return value > rhs.value; }

    const char* ntop(IpString) const;

private:
    uint32_t value = 0;
};

inline uint32_t ip4_mask(unsigned bits)
{
    if ( !bits )
        return 0;

    if ( bits >= IP4_MAX_BITS )
        return IP4_MAX_VALUE;

    return IP4_MAX_VALUE << (IP4_MAX_BITS - bits);
}

inline Ip4 Ip4::network(unsigned bits) const
{ return Ip4(value & ip4_mask(bits)); }

inline Ip4 Ip4::broadcast(unsigned bits) const
{ return Ip4(value | ~ip4_mask(bits)); }

inline bool operator==(const Ip4& lhs, const Ip4& rhs)
{ return lhs.equals(rhs); }

inline bool operator!=(const Ip4& lhs, const Ip4& rhs)
{ return !lhs.equals(rhs); }

inline bool operator<(const Ip4& lhs, const Ip4& rhs)
{ return lhs.less_than(rhs); }

inline bool operator>(const Ip4& lhs, const Ip4& rhs)
{ return lhs.greater_than(rhs); }

inline bool operator<=(const Ip4& lhs, const Ip4& rhs)
{ return !lhs.greater_than(rhs); }

inline bool operator>=(const Ip4& lhs, const Ip4& rhs)
{ return !lhs.less_than(rhs); }
}
#endif

