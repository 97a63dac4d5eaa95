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
// ip_addr.cc derived from sfip/sf_ip.cc

/* IPv4 address arithmetic for capacity analysis. */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "ip_addr.h"

#include <cctype>
#include <cstdio>

using namespace fwcap;

static const char* const ret_strs[IP_MAX] =
{
    "success",
    "failure",
    "invalid argument",
    "invalid IPv4 address",
    "invalid mask length (expected 0 to 32)",
    "range start is greater than range end",
    "address overflow",
    "failed to resolve name",
    "name does not resolve to an IPv4 address",
};

namespace fwcap
{
const char* ip_ret_str(IpRet r)
{
    if ( r < IP_SUCCESS or r >= IP_MAX )
        return "unknown";

    return ret_strs[r];
}
}

// leading zeros are accepted (010 is 10) but every octet needs at least
// one digit and the whole string must be consumed
IpRet Ip4::set(const char* src)
{
    if ( !src )
        return IP_ARG_ERR;

    const char* s = src;
    uint32_t addr = 0;
    unsigned octets = 0;

    while ( true )
    {
        unsigned octet = 0;
        unsigned digits = 0;

        while ( isdigit(*s) )
        {
            octet = octet * 10 + (*s++ - '0');
            ++digits;

            if ( octet > 255 )
                return IP_INET_PARSE_ERR;
        }

        if ( !digits )
            return IP_INET_PARSE_ERR;

        addr = (addr << 8) | octet;
        ++octets;

        if ( *s == '.' and octets < 4 )
        {
            ++s;
            continue;
        }
        break;
    }

    if ( *s or octets != 4 )
        return IP_INET_PARSE_ERR;

    value = addr;
    return IP_SUCCESS;
}

IpRet Ip4::successor(Ip4& next) const
{
    if ( value == IP4_MAX_VALUE )
        return IP_OVERFLOW;

    next.value = value + 1;
    return IP_SUCCESS;
}

const char* Ip4::ntop(IpString buf) const
{
    snprintf(buf, INET_ADDRSTRLEN, "%u.%u.%u.%u",
        (value >> 24) & 0xff, (value >> 16) & 0xff, (value >> 8) & 0xff, value & 0xff);

    return buf;
}

