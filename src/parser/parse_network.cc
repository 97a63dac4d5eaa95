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

#include "parse_network.h"

#include <cctype>
#include <cstring>
#include <utility>

#include "log/messages.h"
#include "network/host_resolver.h"
#include "parser/parse_conf.h"
#include "parser/parse_object.h"

using namespace fwcap;

static bool only_chars(const std::string& s, const char* extra, bool alpha)
{
    for ( auto c : s )
    {
        unsigned char u = (unsigned char)c;

        if ( isdigit(u) or (alpha and isalpha(u)) or strchr(extra, c) )
            continue;

        return false;
    }
    return true;
}

static bool is_range(const std::string& s)
{
    return only_chars(s, ".-", false) and count_of(s, '-') == 1 and count_of(s, '.') == 6;
}

static bool is_prefix(const std::string& s)
{
    if ( !only_chars(s, "./", false) or count_of(s, '.') != 3 )
        return false;

    size_t slash = s.find('/');

    if ( slash == std::string::npos )
        return true;

    // exactly one mask of one or two digits
    std::string mask = s.substr(slash + 1);
    return !mask.empty() and mask.size() <= 2 and mask.find('/') == std::string::npos;
}

static bool is_hostname(const std::string& s)
{ return only_chars(s, ".-", true); }

namespace fwcap
{
bool classify_prefix_item(const std::string& s, PrefixItemType& type)
{
    if ( s.empty() )
        return false;

    if ( is_range(s) )
        type = PIT_RANGE;

    else if ( is_prefix(s) )
        type = PIT_PREFIX;

    else if ( is_hostname(s) )
        type = PIT_HOSTNAME;

    else
        return false;

    return true;
}

bool parse_prefix_item(const std::string& text, HostResolver& resolver, PrefixListItem& item)
{
    std::string s = trim(text);
    PrefixItemType type;

    if ( s.empty() )
    {
        ParseError("empty prefix list item");
        return false;
    }

    if ( !classify_prefix_item(s, type) )
    {
        ParseError("unknown type of prefix list item: %s", s.c_str());
        return false;
    }

    IpRet ret = IP_FAILURE;

    switch ( type )
    {
    case PIT_RANGE:
        ret = item.set_range(s.c_str());
        break;

    case PIT_PREFIX:
        ret = item.set_prefix(s.c_str());
        break;

    case PIT_HOSTNAME:
        ret = item.set_hostname(s.c_str(), resolver);
        break;
    }

    if ( ret != IP_SUCCESS )
    {
        ParseError("invalid %s '%s': %s", type == PIT_RANGE ? "range" :
            (type == PIT_PREFIX ? "prefix" : "host"), s.c_str(), ip_ret_str(ret));
        return false;
    }
    return true;
}

bool parse_prefix_list(const std::string& text, HostResolver& resolver, PrefixList& pl)
{
    std::string line = trim(text);

    if ( contains(line, "()") )
    {
        ParseError("empty prefix list: %s", line.c_str());
        return false;
    }

    bool open = line.find('(') != std::string::npos;
    bool close = line.find(')') != std::string::npos;

    if ( open != close )
    {
        ParseError("invalid prefix list format: %s", line.c_str());
        return false;
    }

    pl.items.clear();

    if ( !open )
    {
        PrefixListItem item;

        if ( !parse_prefix_item(line, resolver, item) )
            return false;

        pl.label = line;
        pl.items.emplace_back(item);
        return true;
    }

    size_t lp = line.find('(');
    size_t rp = line.find(')', lp);

    if ( rp == std::string::npos )
    {
        ParseError("invalid prefix list format: %s", line.c_str());
        return false;
    }

    if ( rp + 1 < line.size() )
    {
        ParseError("unexpected text after prefix list: %s", line.c_str());
        return false;
    }

    pl.label = trim(line.substr(0, lp));

    for ( const auto& s : split(line.substr(lp + 1, rp - lp - 1), ",") )
    {
        PrefixListItem item;

        if ( !parse_prefix_item(s, resolver, item) )
            return false;

        pl.items.emplace_back(item);
    }
    return true;
}

bool parse_network_group(const TextLines& lines, HostResolver& resolver, NetworkGroup& ng)
{
    if ( lines.empty() or !get_group_name(lines[0].text, ng.label) )
    {
        ParseError("invalid group format, expected '<name> (group)': %s",
            lines.empty() ? "" : lines[0].text.c_str());
        return false;
    }

    ng.lists.clear();

    for ( unsigned i = 1; i < lines.size(); ++i )
    {
        std::string s = trim(lines[i].text);

        if ( s.empty() )
            continue;

        set_parse_line(lines[i].num);
        PrefixList pl;

        if ( !parse_prefix_list(s, resolver, pl) )
            return false;

        ng.lists.emplace_back(std::move(pl));
    }
    return true;
}

std::unique_ptr<NetworkObject> parse_network_object(const TextLines& field, HostResolver& resolver)
{
    std::string name;
    TextLines objects;

    if ( !split_field(field, name, objects) )
        return nullptr;

    std::unique_ptr<NetworkObject> no(new NetworkObject(name));
    unsigned idx = 0;

    while ( idx < objects.size() )
    {
        set_parse_line(objects[idx].num);

        if ( is_group_line(objects[idx].text) )
        {
            unsigned n = group_extent(objects, idx);
            TextLines group(objects.begin() + idx, objects.begin() + idx + n);
            NetworkGroup ng;

            if ( !parse_network_group(group, resolver, ng) )
                return nullptr;

            no->items.emplace_back(std::move(ng));
            idx += n;
            continue;
        }

        PrefixList pl;

        if ( !parse_prefix_list(objects[idx].text, resolver, pl) )
            return nullptr;

        no->items.emplace_back(std::move(pl));
        ++idx;
    }
    return no;
}
}
