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
// cmd_line.cc derived from parser/cmd_line.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "cmd_line.h"

#include <cstdlib>
#include <cstring>
#include <string>

#include "log/messages.h"
#include "lua/lua_conf.h"
#include "main/fwcap_config.h"

#include "arg_list.h"

using namespace fwcap;

//-------------------------------------------------------------------------

static const CmdOption options[] =
{
    { "-?", COT_IMPLIED, "list command line options (same as --help)" },
    { "--help", COT_IMPLIED, "list command line options" },

    { "-c", COT_STRING, "<conf> use this lua configuration" },
    { "--conf", COT_STRING, "<conf> same as -c" },

    { "-f", COT_STRING, "<file> policy listing to analyze" },
    { "--file", COT_STRING, "<file> same as -f" },

    { "-q", COT_IMPLIED, "quiet mode - only show reports and errors" },
    { "-v", COT_IMPLIED, "be verbose; dump the configuration and trace merges" },

    { "--top", COT_COUNT, "<k> number of rules ranked by get top-k (1:max32)" },

    { "-V", COT_IMPLIED, "(same as --version)" },
    { "--version", COT_IMPLIED, "show version number" },

    { nullptr, COT_IMPLIED, nullptr }
};

// these never take a value
static const char* const flags[] =
{ "?", "help", "q", "v", "V", "version", nullptr };

static const CmdOption* find_option(const char* name)
{
    for ( const CmdOption* p = options; p->name; ++p )
    {
        if ( !strcmp(p->name, name) )
            return p;
    }
    return nullptr;
}

static bool is_conf(const char* key)
{ return !strcmp(key, "c") or !strcmp(key, "conf"); }

// logging flags take effect before the conf loads and again after it
static bool is_logging(const char* key)
{ return !strcmp(key, "q") or !strcmp(key, "v"); }

static bool set_arg(const char* key, const char* val, FwcapConfig& fc)
{
    if ( !strcmp(key, "?") or !strcmp(key, "help") )
        fc.help = true;

    else if ( !strcmp(key, "V") or !strcmp(key, "version") )
        fc.version = true;

    else if ( !strcmp(key, "c") or !strcmp(key, "conf") )
        fc.lua_conf = val;

    else if ( !strcmp(key, "f") or !strcmp(key, "file") )
        fc.policy_file = val;

    else if ( !strcmp(key, "q") )
        FwcapConfig::set_log_quiet(true);

    else if ( !strcmp(key, "v") )
        FwcapConfig::set_log_verbose(true);

    else if ( !strcmp(key, "top") )
    {
        char* end = nullptr;
        unsigned long n = strtoul(val, &end, 0);

        if ( *end or !n or n > 0xffffffffUL )
            return false;

        fc.top_k = (unsigned)n;
    }
    else
        return false;

    return true;
}

static void set(const char* key, const char* val, FwcapConfig& fc, bool all)
{
    if ( !*key )
    {
        if ( all )
            fc.command.emplace_back(val);
        return;
    }

    if ( all ? is_conf(key) : !(is_conf(key) or is_logging(key)) )
        return;

    std::string k = "-";
    if (strlen(key) > 1)
        k += "-";
    k += key;

    const CmdOption* p = find_option(k.c_str());

    if ( !p )
        ParseError("unknown option %s %s", k.c_str(), val);

    else if ( (p->type != COT_IMPLIED and !*val) or (p->type == COT_IMPLIED and *val) or
        !set_arg(key, val, fc) )
    {
        ParseError("can't set %s %s", k.c_str(), val);
        ParseError("usage: %s %s", k.c_str(), p->help);
    }
}

//-------------------------------------------------------------------------

namespace fwcap
{
const CmdOption* get_cmd_options()
{ return options; }

unsigned parse_cmd_args(int argc, char* argv[], FwcapConfig& fc)
{
    ArgList al(argc, argv, flags);
    const char* key, * val;

    // get special options first
    while ( al.get_arg(key, val) )
        ::set(key, val, fc, false);

    if ( !fc.lua_conf.empty() )
        load_lua_conf(fc.lua_conf.c_str(), fc);

    // now get the rest
    al.reset();

    while ( al.get_arg(key, val) )
        ::set(key, val, fc, true);

    return get_parse_errors();
}

void parse_cmd_line(int argc, char* argv[], FwcapConfig& fc)
{
    if ( unsigned k = parse_cmd_args(argc, argv, fc) )
        FatalError("see prior %u errors\n", k);
}
}
