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

#include <string>
#include <vector>

#include "parser/arg_list.h"

typedef std::pair<std::string, std::string> Arg;

static std::vector<Arg> walk(std::vector<const char*> args, const char* const* flags = nullptr)
{
    std::vector<char*> argv;

    for ( auto a : args )
        argv.emplace_back(const_cast<char*>(a));

    ArgList al(argv.size(), argv.data(), flags);
    std::vector<Arg> out;
    const char* key, * val;

    while ( al.get_arg(key, val) )
        out.emplace_back(key, val);

    return out;
}

TEST_CASE("arg list", "[arg_list]")
{
    static const char* const flags[] = { "q", "help", nullptr };

    SECTION("keys and values")
    {
        std::vector<Arg> args = walk(
            { "fwcap", "-f", "acp.txt", "--top=3", "--file", "b.txt", "-fc.txt" }, flags);

        REQUIRE(args.size() == 4);
        CHECK(args[0] == Arg("f", "acp.txt"));
        CHECK(args[1] == Arg("top", "3"));
        CHECK(args[2] == Arg("file", "b.txt"));
        CHECK(args[3] == Arg("f", "c.txt"));
    }

    SECTION("flags do not take the next word")
    {
        std::vector<Arg> args = walk({ "fwcap", "-q", "get", "--help", "acp" }, flags);

        REQUIRE(args.size() == 4);
        CHECK(args[0] == Arg("q", ""));
        CHECK(args[1] == Arg("", "get"));
        CHECK(args[2] == Arg("help", ""));
        CHECK(args[3] == Arg("", "acp"));
    }

    SECTION("without flags the next word is a value")
    {
        std::vector<Arg> args = walk({ "fwcap", "-q", "get" });

        REQUIRE(args.size() == 1);
        CHECK(args[0] == Arg("q", "get"));
    }

    SECTION("option before option")
    {
        std::vector<Arg> args = walk({ "fwcap", "-f", "-v" });

        REQUIRE(args.size() == 2);
        CHECK(args[0] == Arg("f", ""));
        CHECK(args[1] == Arg("v", ""));
    }

    SECTION("bare dash is a word")
    {
        std::vector<Arg> args = walk({ "fwcap", "-" });

        REQUIRE(args.size() == 1);
        CHECK(args[0] == Arg("", "-"));
    }

    SECTION("reset")
    {
        std::vector<char*> argv = { const_cast<char*>("fwcap"), const_cast<char*>("get") };
        ArgList al(argv.size(), argv.data());
        const char* key, * val;

        CHECK(al.get_arg(key, val));
        CHECK(!al.get_arg(key, val));

        al.reset();
        CHECK(al.get_arg(key, val));
        CHECK(std::string(val) == "get");
    }
}
