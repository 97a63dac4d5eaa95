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

#include <cstring>

#include "network/host_resolver.h"
#include "network/prefix_item.h"

using namespace fwcap;

static Ip4 make_ip(const char* s)
{
    Ip4 ip;
    REQUIRE(ip.set(s) == IP_SUCCESS);
    return ip;
}

TEST_CASE("prefix items", "[prefix_item]")
{
    PrefixListItem item;

    SECTION("network prefix")
    {
        REQUIRE(item.set_prefix("10.0.0.0/8") == IP_SUCCESS);
        CHECK(item.get_type() == PIT_PREFIX);
        CHECK(item.get_label() == "10.0.0.0/8");
        CHECK(item.get_start() == make_ip("10.0.0.0"));
        CHECK(item.get_end() == make_ip("10.255.255.255"));
        CHECK(item.get_bits() == 8);
        CHECK(item.capacity() == 1);
    }

    SECTION("host bits set")
    {
        REQUIRE(item.set_prefix("10.1.2.3/8") == IP_SUCCESS);
        CHECK(item.get_start() == make_ip("10.1.2.3"));
        CHECK(item.get_end() == make_ip("10.255.255.255"));
    }

    SECTION("bare address")
    {
        REQUIRE(item.set_prefix("192.0.2.1") == IP_SUCCESS);
        CHECK(item.get_bits() == 32);
        CHECK(item.get_start() == item.get_end());
        CHECK(item.capacity() == 1);
    }

    SECTION("bad masks")
    {
        CHECK(item.set_prefix("10.0.0.0/33") == IP_INVALID_MASK);
        CHECK(item.set_prefix("10.0.0.0/") == IP_INVALID_MASK);
        CHECK(item.set_prefix("10.0.0.0/ab") == IP_INVALID_MASK);
        CHECK(item.set_prefix("10.0.0.0/008") == IP_INVALID_MASK);
        CHECK(item.set_prefix("10.0.0/8") == IP_INET_PARSE_ERR);
    }

    SECTION("range")
    {
        REQUIRE(item.set_range("10.0.0.1-10.0.0.10") == IP_SUCCESS);
        CHECK(item.get_type() == PIT_RANGE);
        CHECK(item.get_start() == make_ip("10.0.0.1"));
        CHECK(item.get_end() == make_ip("10.0.0.10"));
        CHECK(item.capacity() == 5);
        CHECK(!strcmp(item.get_type_str(), "range"));
    }

    SECTION("bad ranges")
    {
        CHECK(item.set_range("10.0.0.10-10.0.0.1") == IP_RANGE_ERR);
        CHECK(item.set_range("10.0.0.1") == IP_INET_PARSE_ERR);
        CHECK(item.set_range("10.0.0.1-10.0.0") == IP_INET_PARSE_ERR);
        CHECK(item.set_range((const char*)nullptr) == IP_ARG_ERR);
    }

    SECTION("host")
    {
        StaticResolver hosts;
        hosts.add("ipv4.net", make_ip("192.0.2.10"));

        REQUIRE(item.set_hostname("ipv4.net", hosts) == IP_SUCCESS);
        CHECK(item.get_type() == PIT_HOSTNAME);
        CHECK(item.get_label() == "ipv4.net");
        CHECK(item.get_start() == make_ip("192.0.2.10"));
        CHECK(item.get_end() == make_ip("192.0.2.10"));
        CHECK(item.capacity() == 1);
        CHECK(!strcmp(item.get_type_str(), "host"));

        CHECK(item.set_hostname("nowhere.invalid", hosts) == IP_RESOLVE_ERR);
        CHECK(item.set_hostname("", hosts) == IP_ARG_ERR);
    }
}
