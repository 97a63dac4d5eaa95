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

#include <unistd.h>

#include "log/messages.h"
#include "main/fwcap_config.h"
#include "policy/test/policy_test_common.h"

#include "lua_conf.h"

using namespace fwcap;

static void restore_logging()
{
    FwcapConfig::set_log_quiet(true);
    FwcapConfig::set_log_verbose(false);
}

static bool load(const char* chunk, FwcapConfig& fc)
{
    return load_lua_string(chunk, "test.lua", fc);
}

TEST_CASE("lua conf full table", "[lua_conf]")
{
    FwcapConfig fc;

    const char* chunk =
        "fwcap =\n"
        "{\n"
        "    file = 'acp.txt',\n"
        "    top = 3,\n"
        "    quiet = true,\n"
        "    verbose = false,\n"
        "    hosts = { ['ipv4.net'] = '192.0.2.10', ['ipv6.net'] = '192.0.2.11' },\n"
        "}\n";

    CHECK(load(chunk, fc));
    CHECK(get_parse_errors() == 0);
    CHECK(get_parse_warnings() == 0);

    CHECK(fc.policy_file == "acp.txt");
    CHECK(fc.top_k == 3);
    CHECK(FwcapConfig::log_quiet());
    CHECK(!FwcapConfig::log_verbose());
    REQUIRE(fc.hosts.size() == 2);

    bool found = false;

    for ( const auto& h : fc.hosts )
    {
        if ( h.first == "ipv4.net" )
        {
            CHECK(h.second == "192.0.2.10");
            found = true;
        }
    }
    CHECK(found);
    restore_logging();
}

TEST_CASE("lua conf partial table", "[lua_conf]")
{
    FwcapConfig fc;

    SECTION("no table")
    {
        CHECK(load("x = 1", fc));
        CHECK(get_parse_warnings() == 1);
        CHECK(fc.policy_file.empty());
        CHECK(fc.top_k == FWCAP_DEFAULT_TOP_K);
    }
    SECTION("unknown key")
    {
        CHECK(load("fwcap = { top = 2, color = 'red' }", fc));
        CHECK(get_parse_warnings() == 1);
        CHECK(fc.top_k == 2);
    }
    SECTION("numeric key")
    {
        CHECK(load("fwcap = { 'acp.txt' }", fc));
        CHECK(get_parse_warnings() == 1);
        CHECK(fc.policy_file.empty());
    }
    SECTION("verbose only")
    {
        CHECK(load("fwcap = { verbose = true }", fc));
        CHECK(FwcapConfig::log_verbose());
    }
    CHECK(get_parse_errors() == 0);
    restore_logging();
}

TEST_CASE("lua conf bad values", "[lua_conf]")
{
    FwcapConfig fc;
    const char* chunk = nullptr;

    SECTION("not a table")
    { chunk = "fwcap = 5"; }

    SECTION("zero top")
    { chunk = "fwcap = { top = 0 }"; }

    SECTION("fractional top")
    { chunk = "fwcap = { top = 2.5 }"; }

    SECTION("negative top")
    { chunk = "fwcap = { top = -1 }"; }

    SECTION("string top")
    { chunk = "fwcap = { top = '3' }"; }

    SECTION("huge top")
    { chunk = "fwcap = { top = 1e10 }"; }

    SECTION("numeric file")
    { chunk = "fwcap = { file = 3 }"; }

    SECTION("string quiet")
    { chunk = "fwcap = { quiet = 'yes' }"; }

    SECTION("string verbose")
    { chunk = "fwcap = { verbose = 1 }"; }

    SECTION("string hosts")
    { chunk = "fwcap = { hosts = 'x' }"; }

    SECTION("bad host address")
    { chunk = "fwcap = { hosts = { a = '300.1.1.1' } }"; }

    SECTION("numeric host name")
    { chunk = "fwcap = { hosts = { [1] = 'x' } }"; }

    REQUIRE(chunk);
    CHECK(!load(chunk, fc));
    CHECK(get_parse_errors() == 1);
    CHECK(fc.hosts.empty());
    CHECK(fc.policy_file.empty());
    CHECK(fc.top_k == FWCAP_DEFAULT_TOP_K);
    restore_logging();
}

TEST_CASE("lua conf load failures", "[lua_conf]")
{
    FwcapConfig fc;

    SECTION("syntax")
    { CHECK(!load("fwcap = {", fc)); }

    SECTION("runtime")
    { CHECK(!load("error('boom')", fc)); }

    SECTION("missing file")
    { CHECK(!load_lua_conf("/nonexistent/fwcap.lua", fc)); }

    CHECK(get_parse_errors() == 1);
}

TEST_CASE("lua conf file", "[lua_conf]")
{
    FwcapConfig fc;
    std::string path = write_temp("fwcap = { file = 'from_file.txt', top = 9 }\n");
    REQUIRE(!path.empty());

    CHECK(load_lua_conf(path.c_str(), fc));
    CHECK(fc.policy_file == "from_file.txt");
    CHECK(fc.top_k == 9);

    unlink(path.c_str());
}
