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

#include "log/messages.h"
#include "network/host_resolver.h"
#include "parser/parse_conf.h"
#include "parser/parse_policy.h"
#include "policy/test/policy_test_common.h"

using namespace fwcap;

static TextLines lines(const std::string& text)
{ return make_lines(text); }

static const char* policy_text =
    "Access Control Policy export\n"
    "Name : ACP-Main\n"
    "----------[ Rule: first ]-----------\n"
    "    Source Networks       : 10.0.0.0/24\n"
    "      10.0.1.0/24\n"
    "    Destination Ports  : HTTPS (protocol 6, port 443)\n"
    "    Logging Configuration\n"
    "Object missing: OBJ-lost\n"
    "----------[ Rule: second ]-----------\n"
    "    Destination Networks  : Servers (group)\n"
    "        OBJ-a (192.0.2.1)\n"
    "        OBJ-b (192.0.2.2)\n"
    "    \x1b[31mcolored noise\x1b[0m\n"
    "    Users\n"
    "=======================[ Advanced Settings ]=======================\n"
    "----------[ Rule: after the end ]-----------\n"
    "    Source Networks       : 10.0.0.0/8\n";

TEST_CASE("policy line filters", "[parse_policy]")
{
    TextLines filtered, extent;

    filter_lines(lines(policy_text), filtered);
    CHECK(filtered.size() == 15);

    for ( const auto& l : filtered )
    {
        CHECK(!contains(l.text, OBJECT_MISSING));
        CHECK(!contains(l.text, "\x1b"));
    }

    policy_extent(filtered, extent);
    REQUIRE(extent.size() == 10);
    CHECK(extent.front().num == 3);
    CHECK(contains(extent.back().text, "Users"));

    std::vector<TextLines> rules = slice_rules(extent);
    REQUIRE(rules.size() == 2);
    CHECK(rules[0].size() == 5);
    CHECK(rules[1].size() == 5);
}

TEST_CASE("rule names", "[parse_policy]")
{
    std::string name;

    CHECK(get_rule_name("----------[ Rule: Custom_rule2 | FM-15046 ]-----------", name));
    CHECK(name == "Custom_rule2 | FM-15046");

    CHECK(get_rule_name("-[ Rule: no end marker", name));
    CHECK(name == "no end marker");

    CHECK(!get_rule_name("Rule: missing dashes", name));
}

TEST_CASE("continuation lines", "[parse_policy]")
{
    TextLines out;

    join_continuations(lines(
        "    Source Networks       : Web (10.0.0.1,\n"
        "        10.0.0.2,\n"
        "        10.0.0.3)\n"
        "    Destination Ports  : HTTPS (protocol 6, port 443)\n"), out);

    REQUIRE(out.size() == 2);
    CHECK(out[0].num == 1);
    CHECK(out[0].text == "    Source Networks       : Web (10.0.0.1,10.0.0.2,10.0.0.3)");
    CHECK(out[1].num == 4);
}

TEST_CASE("field slices", "[parse_policy]")
{
    TextLines rule = lines(
        "----------[ Rule: r ]-----------\n"
        "    Source Networks       : 10.0.0.0/24\n"
        "\n"
        "      10.0.1.0/24\n"
        "    Destination Networks  : 10.1.0.0/16\n"
        "    Source Ports     : SSH (protocol 6, port 22)\n"
        "    Logging Configuration\n"
        "      10.9.9.9\n");

    TextLines field;

    slice_field(rule, SRC_NETWORKS, field);
    REQUIRE(field.size() == 2);
    CHECK(field[1].num == 4);

    field.clear();
    slice_field(rule, DST_NETWORKS, field);
    CHECK(field.size() == 1);

    field.clear();
    slice_field(rule, SRC_PORTS, field);
    CHECK(field.size() == 1);

    field.clear();
    slice_field(rule, DST_PORTS, field);
    CHECK(field.empty());
}

TEST_CASE("parse policy", "[parse_policy]")
{
    StaticResolver hosts;

    SECTION("all rules")
    {
        std::unique_ptr<AccessPolicy> acp = parse_policy(lines(policy_text), hosts);

        REQUIRE(acp);
        REQUIRE(acp->rule_count() == 2);
        CHECK(!acp->find_rule("after the end"));

        const Rule* r = acp->find_rule("first");
        REQUIRE(r);
        CHECK(r->get_networks(RD_SRC)->capacity() == 2);
        CHECK(!r->get_networks(RD_DST));
        CHECK(r->capacity() == 2);
        CHECK(r->optimized_capacity() == 1);

        r = acp->find_rule("second");
        REQUIRE(r);
        CHECK(r->capacity() == 2);
        CHECK(get_parse_errors() == 0);
    }

    SECTION("one rule")
    {
        std::unique_ptr<AccessPolicy> acp = parse_policy(lines(policy_text), hosts, "second");

        REQUIRE(acp);
        REQUIRE(acp->rule_count() == 1);
        CHECK(acp->get_rule(0)->get_label() == "second");
    }

    SECTION("no such rule")
    {
        std::unique_ptr<AccessPolicy> acp = parse_policy(lines(policy_text), hosts, "third");

        REQUIRE(acp);
        CHECK(acp->empty());
    }

    SECTION("no rules")
    {
        std::unique_ptr<AccessPolicy> acp = parse_policy(lines("nothing to see\n"), hosts);

        REQUIRE(acp);
        CHECK(acp->empty());
    }

    SECTION("bad rule")
    {
        std::string text = policy_text;
        text.replace(text.find("10.0.1.0/24"), 11, "10.0.1.0/99");

        CHECK(!parse_policy(lines(text), hosts));
        CHECK(get_parse_errors() == 1);
    }

    SECTION("bad rule skipped by name")
    {
        std::string text = policy_text;
        text.replace(text.find("10.0.1.0/24"), 11, "10.0.1.0/99");

        std::unique_ptr<AccessPolicy> acp = parse_policy(lines(text), hosts, "second");
        REQUIRE(acp);
        CHECK(acp->rule_count() == 1);
        CHECK(get_parse_errors() == 0);
    }
}

TEST_CASE("parse location after a rule", "[parse_policy]")
{
    StaticResolver hosts;
    push_parse_location("policy", "acp.txt");

    SECTION("bad network")
    {
        std::string text = FULL_RULE;
        text.replace(text.find("10.0.0.0/8"), 10, "10.0.0.0/99");

        CHECK(!parse_rule(lines(text), hosts));
        CHECK(get_parse_errors() > 0);
    }
    SECTION("bad port")
    {
        std::string text = FULL_RULE;
        text.replace(text.find("port 443"), 8, "port 70000");

        CHECK(!parse_rule(lines(text), hosts));
        CHECK(get_parse_errors() > 0);
    }
    SECTION("good rule")
    {
        CHECK(parse_rule(lines(FULL_RULE), hosts));
        CHECK(get_parse_errors() == 0);
    }

    // the next message must not name this rule or field
    CHECK(get_parse_context().empty());
    pop_parse_location();
}

TEST_CASE("parse policy file", "[parse_policy]")
{
    StaticResolver hosts;

    SECTION("missing file")
    {
        CHECK(!parse_policy_file("/nonexistent/fwcap/acp.txt", hosts));
        CHECK(get_parse_errors() == 1);
    }

    SECTION("from disk")
    {
        std::string path = write_temp(policy_text);
        REQUIRE(!path.empty());

        std::unique_ptr<AccessPolicy> acp = parse_policy_file(path.c_str(), hosts);
        unlink(path.c_str());

        REQUIRE(acp);
        CHECK(acp->rule_count() == 2);
    }
}
