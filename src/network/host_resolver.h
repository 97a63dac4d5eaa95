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

#ifndef HOST_RESOLVER_H
#define HOST_RESOLVER_H

// hostname items are resolved once while the policy is parsed; the
// resolver is passed in so tests can supply a fixed mapping

#include <string>
#include <unordered_map>

#include "ip/ip_addr.h"

namespace fwcap
{
class HostResolver
{
public:
    virtual ~HostResolver() = default;

    // IP_SUCCESS with the first IPv4 address, IP_NOT_IPV4 when the name
    // only has IPv6 addresses, IP_RESOLVE_ERR otherwise
    virtual IpRet resolve(const char* name, Ip4&) = 0;

protected:
    HostResolver() = default;
};

// blocking getaddrinfo() lookup; no timeout and no retry
class DnsResolver : public HostResolver
{
public:
    IpRet resolve(const char* name, Ip4&) override;
};

class StaticResolver : public HostResolver
{
public:
    // names not in the map go to the fallback when there is one
    StaticResolver(HostResolver* fallback = nullptr) : fallback(fallback) { }

    IpRet add(const char* name, const char* addr);
    void add(const char* name, const Ip4& addr);

    IpRet resolve(const char* name, Ip4&) override;

    size_t size() const
    { return hosts.size(); }

private:
    std::unordered_map<std::string, Ip4> hosts;
    HostResolver* fallback;
};
}
#endif

