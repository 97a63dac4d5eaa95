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
// prefix_item.cc derived from ports/port_item.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "prefix_item.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

#include "ip/ip_range.h"

#include "host_resolver.h"

using namespace fwcap;

/*
 * a.b.c.d/n or a.b.c.d which is a /32
 */
IpRet PrefixListItem::set_prefix(const char* text)
{
    if ( !text )
        return IP_ARG_ERR;

    const char* slash = strchr(text, '/');
    std::string addr = slash ? std::string(text, slash - text) : std::string(text);

    Ip4 ip;
    IpRet ret = ip.set(addr.c_str());

    if ( ret != IP_SUCCESS )
        return ret;

    unsigned len = IP4_MAX_BITS;

    if ( slash )
    {
        const char* s = slash + 1;
        size_t n = strlen(s);

        if ( !n or n > 2 or !isdigit(s[0]) or (n == 2 and !isdigit(s[1])) )
            return IP_INVALID_MASK;

        len = (unsigned)atoi(s);
    }
    return set_prefix(text, ip, len);
}

IpRet PrefixListItem::set_prefix(const std::string& s, const Ip4& addr, unsigned len)
{
    if ( len > IP4_MAX_BITS )
        return IP_INVALID_MASK;

    type = PIT_PREFIX;
    label = s;
    start = addr;
    end = addr.broadcast(len);
    bits = len;
    blocks = 1;

    return IP_SUCCESS;
}

/*
 * a.b.c.d-e.f.g.h inclusive
 */
IpRet PrefixListItem::set_range(const char* text)
{
    if ( !text )
        return IP_ARG_ERR;

    const char* dash = strchr(text, '-');

    if ( !dash )
        return IP_INET_PARSE_ERR;

    std::string lo(text, dash - text);
    Ip4 first, last;

    IpRet ret = first.set(lo.c_str());

    if ( ret != IP_SUCCESS )
        return ret;

    if ( (ret = last.set(dash + 1)) != IP_SUCCESS )
        return ret;

    return set_range(text, first, last);
}

IpRet PrefixListItem::set_range(const std::string& s, const Ip4& first, const Ip4& last)
{
    if ( first > last )
        return IP_RANGE_ERR;

    type = PIT_RANGE;
    label = s;
    start = first;
    end = last;
    bits = IP4_MAX_BITS;
    blocks = range_block_count(first, last);

    return IP_SUCCESS;
}

IpRet PrefixListItem::set_hostname(const char* name, HostResolver& resolver)
{
    if ( !name or !*name )
        return IP_ARG_ERR;

    Ip4 ip;
    IpRet ret = resolver.resolve(name, ip);

    if ( ret != IP_SUCCESS )
        return ret;

    set_hostname(name, ip);
    return IP_SUCCESS;
}

void PrefixListItem::set_hostname(const std::string& name, const Ip4& addr)
{
    type = PIT_HOSTNAME;
    label = name;
    start = end = addr;
    bits = IP4_MAX_BITS;
    blocks = 1;
}

const char* PrefixListItem::get_type_str() const
{
    switch ( type )
    {
    case PIT_PREFIX:
        return "prefix";
    case PIT_RANGE:
        return "range";
    case PIT_HOSTNAME:
        return "host";
    }
    return "?";
}

