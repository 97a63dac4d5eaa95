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

#include <catch2/catch.hpp>

#include "network/host_resolver.h"

using namespace fwcap;

TEST_CASE("static resolver", "[host_resolver]")
{
    StaticResolver hosts;
    Ip4 ip;

    SECTION("add")
    {
        CHECK(hosts.add("a.example", "192.0.2.1") == IP_SUCCESS);
        CHECK(hosts.add("b.example", "192.0.2.256") == IP_INET_PARSE_ERR);
        CHECK(hosts.size() == 1);
    }

    SECTION("resolve")
    {
        REQUIRE(hosts.add("a.example", "192.0.2.1") == IP_SUCCESS);

        CHECK(hosts.resolve("a.example", ip) == IP_SUCCESS);
        CHECK(ip.get_value() == 0xc0000201);

        CHECK(hosts.resolve("A.EXAMPLE", ip) == IP_RESOLVE_ERR);
    }

    SECTION("replace")
    {
        REQUIRE(hosts.add("a.example", "192.0.2.1") == IP_SUCCESS);
        REQUIRE(hosts.add("a.example", "192.0.2.2") == IP_SUCCESS);

        CHECK(hosts.size() == 1);
        CHECK(hosts.resolve("a.example", ip) == IP_SUCCESS);
        CHECK(ip.get_value() == 0xc0000202);
    }

    SECTION("fallback")
    {
        StaticResolver inner;
        REQUIRE(inner.add("inner.example", "198.51.100.7") == IP_SUCCESS);

        StaticResolver outer(&inner);
        REQUIRE(outer.add("outer.example", "203.0.113.9") == IP_SUCCESS);

        CHECK(outer.resolve("outer.example", ip) == IP_SUCCESS);
        CHECK(ip.get_value() == 0xcb007109);

        CHECK(outer.resolve("inner.example", ip) == IP_SUCCESS);
        CHECK(ip.get_value() == 0xc6336407);

        CHECK(outer.resolve("missing.example", ip) == IP_RESOLVE_ERR);
    }
}
