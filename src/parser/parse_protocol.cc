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

#include "parse_protocol.h"

#include <cstring>
#include <utility>

#include "log/messages.h"
#include "parser/parse_conf.h"
#include "parser/parse_object.h"
#include "protocol/protocol_ids.h"

using namespace fwcap;

#define ANY_PORT_CLAUSE "protocol any, port "

// "Name (body)" gives Name and body; a bare body is both
static bool split_name(const std::string& text, std::string& name, std::string& body)
{
    std::vector<std::string> parts = split(text, "(");

    if ( parts.size() == 1 )
    {
        if ( contains(text, ")") )
        {
            ParseError("missing opening parenthesis in port list: %s", text.c_str());
            return false;
        }
        name = body = trim(text);
        return true;
    }

    if ( parts.size() == 2 )
    {
        name = trim(parts[0]);
        body = trim(parts[1]);

        if ( body.empty() or body.back() != ')' )
        {
            ParseError("missing closing parenthesis in port list: %s", text.c_str());
            return false;
        }
        body.pop_back();
        return true;
    }

    ParseError("invalid port list: %s", text.c_str());
    return false;
}

static bool get_protocol(const std::string& body, unsigned& proto)
{
    std::string s = trim(split(body, ",")[0]);

    if ( s.compare(0, 8, "protocol") )
    {
        ParseError("missing 'protocol' in port list: %s", s.c_str());
        return false;
    }
    return parse_uint(trim(s.substr(8)), "protocol", 255, proto);
}

static bool get_ports(const std::string& body, Port& lo, Port& hi)
{
    std::vector<std::string> parts = split(body, "port");

    if ( parts.size() < 2 )
    {
        lo = 0;
        hi = MAX_PORT;
        return true;
    }

    std::vector<std::string> range = split(trim(parts[1]), "-");
    unsigned a, b;

    if ( !parse_uint(trim(range[0]), "start port", MAX_PORT, a) )
        return false;

    b = a;

    if ( range.size() > 1 and !parse_uint(trim(range[1]), "end port", MAX_PORT, b) )
        return false;

    if ( a > b )
    {
        ParseError("start port %u is greater than end port %u", a, b);
        return false;
    }
    lo = (Port)a;
    hi = (Port)b;
    return true;
}

// the last word of a "type 3" or "code 4" clause
static std::string last_word(const std::string& s)
{
    std::string t = trim(s);
    size_t sp = t.find_last_of(" \t");
    return sp == std::string::npos ? t : t.substr(sp + 1);
}

static bool get_type_code(const std::string& body, int& type, int& code)
{
    std::vector<std::string> parts = split(body, ",");
    unsigned v;

    type = code = -1;

    if ( parts.size() == 1 )
        return true;

    if ( parts.size() > 3 )
    {
        ParseError("invalid icmp: %s", body.c_str());
        return false;
    }

    if ( !parse_uint(last_word(parts[1]), "icmp type", 255, v) )
        return false;

    type = (int)v;

    if ( parts.size() == 2 )
        return true;

    std::string c = last_word(parts[2]);

    if ( c == "any" or c == "ANY" or c == "Any" )
        return true;

    if ( !parse_uint(c, "icmp code", 255, v) )
        return false;

    code = (int)v;
    return true;
}

namespace fwcap
{
bool parse_protocol_item(const std::string& text, ProtocolListItem& item)
{
    std::string name, body;
    unsigned proto;

    if ( !split_name(text, name, body) or !get_protocol(body, proto) )
        return false;

    if ( is_l4_protocol(proto) )
    {
        Port lo, hi;

        if ( !get_ports(body, lo, hi) )
            return false;

        if ( !item.set_tcp_udp(name, proto, lo, hi) )
        {
            ParseError("invalid tcp/udp port list: %s", text.c_str());
            return false;
        }
        return true;
    }

    if ( is_icmp_protocol(proto) )
    {
        int type, code;

        if ( !get_type_code(body, type, code) )
            return false;

        if ( !item.set_icmp(name, proto, type, code) )
        {
            ParseError("invalid icmp port list: %s", text.c_str());
            return false;
        }
        return true;
    }

    // any port clause on other protocols is ignored
    if ( !item.set_other(name, proto) )
    {
        ParseError("invalid port list: %s", text.c_str());
        return false;
    }
    return true;
}

bool parse_protocol_list(const std::string& text, ProtocolList& pl)
{
    std::string line = trim(text);
    std::vector<std::string> expanded;

    size_t pos = line.find(ANY_PORT_CLAUSE);

    if ( pos == std::string::npos )
        expanded.emplace_back(line);

    else
    {
        std::string rest = line.substr(pos + strlen(ANY_PORT_CLAUSE));
        expanded.emplace_back(line.substr(0, pos) + "protocol 6, port " + rest);
        expanded.emplace_back(line.substr(0, pos) + "protocol 17, port " + rest);
    }

    pl.items.clear();

    for ( const auto& s : expanded )
    {
        ProtocolListItem item;

        if ( !parse_protocol_item(s, item) )
            return false;

        // an unnamed "protocol any" line labels both items with itself
        if ( expanded.size() > 1 and line.find('(') == std::string::npos )
            item.set_label(line);

        pl.items.emplace_back(item);
    }

    pl.label = pl.items[0].get_label();
    return true;
}

bool parse_protocol_group(const TextLines& lines, ProtocolGroup& pg)
{
    if ( lines.empty() or !get_group_name(lines[0].text, pg.label) )
    {
        ParseError("invalid group format, expected '<name> (group)': %s",
            lines.empty() ? "" : lines[0].text.c_str());
        return false;
    }

    pg.lists.clear();

    for ( unsigned i = 1; i < lines.size(); ++i )
    {
        std::string s = trim(lines[i].text);

        if ( s.empty() )
            continue;

        set_parse_line(lines[i].num);
        ProtocolList pl;

        if ( !parse_protocol_list(s, pl) )
            return false;

        pg.lists.emplace_back(std::move(pl));
    }
    return true;
}

std::unique_ptr<ProtocolObject> parse_protocol_object(const TextLines& field)
{
    std::string name;
    TextLines objects;

    if ( !split_field(field, name, objects) )
        return nullptr;

    std::unique_ptr<ProtocolObject> po(new ProtocolObject(name));
    unsigned idx = 0;

    while ( idx < objects.size() )
    {
        set_parse_line(objects[idx].num);

        if ( is_group_line(objects[idx].text) )
        {
            unsigned n = group_extent(objects, idx);
            TextLines group(objects.begin() + idx, objects.begin() + idx + n);
            ProtocolGroup pg;

            if ( !parse_protocol_group(group, pg) )
                return nullptr;

            po->items.emplace_back(std::move(pg));
            idx += n;
            continue;
        }

        ProtocolList pl;

        if ( !parse_protocol_list(objects[idx].text, pl) )
            return nullptr;

        po->items.emplace_back(std::move(pl));
        ++idx;
    }
    return po;
}
}
