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

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "host_resolver.h"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <cstring>

#include "log/messages.h"

using namespace fwcap;

IpRet DnsResolver::resolve(const char* name, Ip4& ip)
{
    struct addrinfo hints;
    struct addrinfo *result, *rp;
    int s;

    memset(&hints, 0, sizeof(struct addrinfo));
    hints.ai_family = AF_UNSPEC;    /* IPv6 answers are seen so they can be rejected */
    hints.ai_socktype = SOCK_STREAM;

    if ( (s = getaddrinfo(name, nullptr, &hints, &result)) != 0 )
    {
        TraceMessage("getaddrinfo %s: %s\n", name, gai_strerror(s));
        return IP_RESOLVE_ERR;
    }

    IpRet ret = IP_RESOLVE_ERR;

    for ( rp = result; rp != nullptr; rp = rp->ai_next )
    {
        if ( rp->ai_family == AF_INET6 )
        {
            ret = IP_NOT_IPV4;
            continue;
        }
        if ( rp->ai_family != AF_INET )
            continue;

        const struct sockaddr_in* sin = (const struct sockaddr_in*)rp->ai_addr;
        ip.set(ntohl(sin->sin_addr.s_addr));
        ret = IP_SUCCESS;
        break;
    }

    freeaddrinfo(result);
    return ret;
}

IpRet StaticResolver::add(const char* name, const char* addr)
{
    Ip4 ip;
    IpRet ret = ip.set(addr);

    if ( ret != IP_SUCCESS )
        return ret;

    add(name, ip);
    return IP_SUCCESS;
}

void StaticResolver::add(const char* name, const Ip4& addr)
{
    hosts[name] = addr;
}

IpRet StaticResolver::resolve(const char* name, Ip4& ip)
{
    auto it = hosts.find(name);

    if ( it != hosts.end() )
    {
        ip = it->second;
        return IP_SUCCESS;
    }

    if ( fallback )
        return fallback->resolve(name, ip);

    return IP_RESOLVE_ERR;
}

