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

#include <cstdint>
#include <cstring>

#include "ip/ip_range.h"

using namespace fwcap;

static Ip4 make_ip(const char* s)
{
    Ip4 ip;
    REQUIRE(ip.set(s) == IP_SUCCESS);
    return ip;
}

static Capacity count(const char* lo, const char* hi)
{ return range_block_count(make_ip(lo), make_ip(hi)); }

TEST_CASE("decompose range", "[ip_range]")
{
    SECTION("host to end of /24")
    {
        std::vector<Ip4Cidr> blocks =
            decompose_range(make_ip("192.168.0.1"), make_ip("192.168.0.255"));

        REQUIRE(blocks.size() == 8);

        const char* expect[] =
        {
            "192.168.0.1/32", "192.168.0.2/31", "192.168.0.4/30", "192.168.0.8/29",
            "192.168.0.16/28", "192.168.0.32/27", "192.168.0.64/26", "192.168.0.128/25"
        };
        char buf[32];

        for ( unsigned i = 0; i < blocks.size(); ++i )
        {
            INFO(expect[i]);
            CHECK(!strcmp(blocks[i].ntop(buf, sizeof(buf)), expect[i]));
        }
        CHECK(blocks.back().last() == make_ip("192.168.0.255"));
    }

    SECTION("small unaligned")
    {
        std::vector<Ip4Cidr> blocks =
            decompose_range(make_ip("10.0.0.1"), make_ip("10.0.0.10"));

        REQUIRE(blocks.size() == 5);
        CHECK(blocks[0].get_bits() == 32);
        CHECK(blocks[1].get_bits() == 31);
        CHECK(blocks[2].get_bits() == 30);
        CHECK(blocks[3].get_bits() == 31);
        CHECK(blocks[4].get_addr() == make_ip("10.0.0.10"));
    }

    SECTION("reversed")
    {
        CHECK(decompose_range(make_ip("10.0.0.2"), make_ip("10.0.0.1")).empty());
        CHECK(count("10.0.0.2", "10.0.0.1") == 0);
    }
}

TEST_CASE("range block count", "[ip_range]")
{
    CHECK(count("10.0.0.5", "10.0.0.5") == 1);
    CHECK(count("172.16.17.0", "172.16.17.200") == 4);
    CHECK(count("172.16.17.64", "172.16.17.255") == 2);
    CHECK(count("172.16.17.0", "172.16.17.255") == 1);
    CHECK(count("10.18.46.62", "10.18.46.69") == 3);
    CHECK(count("10.10.0.0", "10.11.255.255") == 1);
    CHECK(count("0.0.0.0", "255.255.255.255") == 1);
    CHECK(count("0.0.0.1", "255.255.255.255") == 32);
    CHECK(count("255.255.255.254", "255.255.255.255") == 1);
}

TEST_CASE("cidr last", "[ip_range]")
{
    Ip4Cidr c(make_ip("10.1.0.0"), 16);
    CHECK(c.last() == make_ip("10.1.255.255"));

    Ip4Cidr h(make_ip("10.1.2.3"), 32);
    CHECK(h.last() == make_ip("10.1.2.3"));
}

// blocks must tile [lo, hi] in order with aligned blocks that could not
// grow into the next larger block without leaving the range
static void check_tiling(uint32_t lo, uint32_t hi)
{
    std::vector<Ip4Cidr> blocks = decompose_range(Ip4(lo), Ip4(hi));

    INFO("range " << lo << "-" << hi);
    REQUIRE(!blocks.empty());
    CHECK(blocks.size() == range_block_count(Ip4(lo), Ip4(hi)));
    CHECK(blocks.front().get_addr().get_value() == lo);
    CHECK(blocks.back().last().get_value() == hi);

    for ( unsigned i = 0; i < blocks.size(); ++i )
    {
        const Ip4Cidr& b = blocks[i];
        unsigned bits = b.get_bits();

        CHECK(b.get_addr().is_aligned(bits));

        if ( bits )
        {
            Ip4 wider = b.get_addr().network(bits - 1);
            bool fits = wider == b.get_addr() and wider.broadcast(bits - 1).get_value() <= hi;
            CHECK(!fits);
        }

        if ( i + 1 < blocks.size() )
        {
            uint64_t next = (uint64_t)b.last().get_value() + 1;
            CHECK(blocks[i + 1].get_addr().get_value() == next);
        }
    }
}

TEST_CASE("decompose range tiles minimally", "[ip_range]")
{
    SECTION("edges")
    {
        const uint32_t edges[][2] =
        {
            { 0, 0 }, { 0, 0xffffffff }, { 1, 0xffffffff }, { 0, 0xfffffffe },
            { 0xffffffff, 0xffffffff }, { 0x7fffffff, 0x80000000 },
            { 0x0a000001, 0x0a00000a }, { 0xc0a8010b, 0xc0a801ff },
        };

        for ( const auto& e : edges )
            check_tiling(e[0], e[1]);
    }

    SECTION("sweep")
    {
        // fixed linear congruential sequence so every run sees the same ranges
        uint32_t x = 12345;

        for ( unsigned i = 0; i < 500; ++i )
        {
            x = x * 1103515245u + 12345u;
            uint32_t a = x;
            x = x * 1103515245u + 12345u;
            uint32_t span = x >> (x % 32);
            uint32_t b = (a > 0xffffffff - span) ? 0xffffffff : a + span;

            check_tiling(a, b);
        }
    }
}
