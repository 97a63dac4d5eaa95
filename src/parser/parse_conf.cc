//--------------------------------------------------------------------------
// Copyright (C) 2014-2024 Cisco and/or its affiliates. All rights reserved.
// Copyright (C) 2002-2013 Sourcefire, Inc.
// Copyright (C) 1998-2002 Martin Roesch <roesch@sourcefire.com>
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

#include "parse_conf.h"

#include <stack>

#include "log/messages.h"

using namespace fwcap;

struct Location
{
    const char* code;
    std::string path;
    std::string file;
    std::string rule;
    std::string field;
    unsigned line;

    Location(const char* c, const char* p, const char* f, unsigned u)
    { code = c; path = p; file = f; line = u; }
};

static std::stack<Location> files;

void get_parse_location(const char*& file, unsigned& line)
{
    if ( files.empty() )
    {
        file = nullptr;
        line = 0;
        return;
    }
    Location& loc = files.top();
    file = loc.file.c_str();
    line = loc.line;
}

std::string get_parse_context()
{
    std::string ctx;

    if ( files.empty() )
        return ctx;

    Location& loc = files.top();

    if ( !loc.rule.empty() )
    {
        ctx = "rule '";
        ctx += loc.rule;
        ctx += "'";
    }
    if ( !loc.field.empty() )
    {
        if ( !ctx.empty() )
            ctx += " ";
        ctx += loc.field;
    }
    return ctx;
}

void push_parse_location(
    const char* code, const char* path, const char* file, unsigned line)
{
    if ( !path )
        return;

    if ( !file )
        file = path;

    Location loc(code, path, file, line);
    files.push(loc);
    TraceMessage("Loading %s:%s:\n", (code ? code : "?"), loc.file.c_str());
}

void pop_parse_location()
{
    if ( !files.empty() )
    {
        Location& loc = files.top();
        TraceMessage("Finished %s:%s:\n", (loc.code ? loc.code : "?"), loc.file.c_str());
        files.pop();
    }
}

void set_parse_line(unsigned line)
{
    if ( files.empty() )
        return;

    files.top().line = line;
}

void set_parse_rule(const char* rule)
{
    if ( files.empty() )
        return;

    Location& loc = files.top();
    loc.rule = rule ? rule : "";
    loc.field.clear();
}

void set_parse_field(const char* field)
{
    if ( files.empty() )
        return;

    files.top().field = field ? field : "";
}

