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

#include <string>

#include "log/messages.h"
#include "main/commands.h"
#include "main/fwcap_config.h"
#include "network/host_resolver.h"
#include "parser/parse_utils.h"

#include "policy/test/policy_test_common.h"

using namespace fwcap;

static const std::string acp_text =
    "Current Active Policies:\n"
    FULL_RULE
    "----------[ Rule: small ]-----------\n"
    "    Destination Ports  : HTTPS (protocol 6, port 443)\n"
    RULE_END
    "=======================[ Advanced Settings ]=======================\n";

static unsigned count(const std::string& s, const char* what)
{
    unsigned n = 0;
    size_t pos = 0;

    while ( (pos = s.find(what, pos)) != std::string::npos )
    {
        ++n;
        ++pos;
    }
    return n;
}

struct CommandFixture
{
    CommandFixture()
    {
        path = write_temp(acp_text);
        fc.policy_file = path;
        out = tmpfile();
    }

    ~CommandFixture()
    {
        if ( out )
            fclose(out);
        unlink(path.c_str());
    }

    int run(const char* cmd)
    {
        fc.command = split(cmd, " ");
        return run_command(fc, hosts, out);
    }

    std::string output()
    { return read_all(out); }

    std::string path;
    FwcapConfig fc;
    StaticResolver hosts;
    FILE* out = nullptr;
};

TEST_CASE_METHOD(CommandFixture, "get rule", "[commands]")
{
    REQUIRE(!path.empty());
    REQUIRE(out);

    SECTION("capacity")
    {
        CHECK(run("get rule capacity Custom_rule2 | FM-15046") == 0);
        std::string s = output();
        CHECK(s.find("Rule name: Custom_rule2 | FM-15046\n") == 0);
        CHECK(count(s, "\t capacity:           320\n") == 1);
    }
    SECTION("analysis")
    {
        CHECK(run("get rule analysis small") == 0);
        std::string s = output();
        CHECK(count(s, "Rule name: small\n") == 1);
        CHECK(count(s, "\t source networks: any\n") == 1);
    }
    SECTION("not found")
    {
        CHECK(run("get rule capacity Custom_rule2") == 1);
        CHECK(output().empty());
    }
    SECTION("no name")
    {
        CHECK(run("get rule capacity") == 1);
    }
    SECTION("bad mode")
    {
        CHECK(run("get rule size small") == 1);
    }
    CHECK(get_parse_errors() == 0);
}

TEST_CASE_METHOD(CommandFixture, "get top-k", "[commands]")
{
    REQUIRE(out);

    SECTION("by capacity")
    {
        fc.top_k = 1;
        CHECK(run("get top-k by-capacity") == 0);
        std::string s = output();
        CHECK(count(s, "Rule name: ") == 1);
        CHECK(count(s, "Rule name: Custom_rule2 | FM-15046\n") == 1);
    }
    SECTION("by optimization")
    {
        CHECK(run("get top-k by-optimization") == 0);
        std::string s = output();
        CHECK(count(s, "Rule name: ") == 2);
        CHECK(s.find("Rule name: Custom_rule2 | FM-15046\n") == 0);
    }
    SECTION("bad order")
    {
        CHECK(run("get top-k by-name") == 1);
    }
    SECTION("extra words")
    {
        CHECK(run("get top-k by-capacity 3") == 1);
    }
}

TEST_CASE_METHOD(CommandFixture, "get acp", "[commands]")
{
    REQUIRE(out);

    SECTION("capacity")
    {
        CHECK(run("get acp capacity") == 0);
        std::string s = output();
        CHECK(s.find("# of rules found: 2\n") == 0);
        CHECK(count(s, "Rule name: ") == 0);
    }
    SECTION("analysis")
    {
        CHECK(run("get acp analysis") == 0);
        std::string s = output();
        CHECK(s.find("# of rules found: 2\n") == 0);
        CHECK(count(s, "Rule name: ") == 2);
    }
    SECTION("bad mode")
    {
        CHECK(run("get acp") == 1);
    }
}

TEST_CASE_METHOD(CommandFixture, "command failures", "[commands]")
{
    REQUIRE(out);

    SECTION("unknown verb")
    {
        CHECK(run("put acp capacity") == 1);
    }
    SECTION("unknown object")
    {
        CHECK(run("get host capacity") == 1);
    }
    SECTION("too short")
    {
        CHECK(run("get") == 1);
    }
    SECTION("no policy file")
    {
        fc.policy_file.clear();
        CHECK(run("get acp capacity") == 1);
    }
    SECTION("missing policy file")
    {
        fc.policy_file = "/nonexistent/fwcap/acp.txt";
        CHECK(run("get acp capacity") == 1);
    }
    SECTION("empty policy")
    {
        std::string empty = write_temp("no rules here\n");
        REQUIRE(!empty.empty());
        fc.policy_file = empty;

        CHECK(run("get acp capacity") == 1);
        CHECK(run("get top-k by-capacity") == 1);
        unlink(empty.c_str());
    }
    CHECK(output().empty());
    CHECK(get_parse_errors() == 0);
}
