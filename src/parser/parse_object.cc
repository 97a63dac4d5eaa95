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

#include "parse_object.h"

#include "log/messages.h"
#include "parser/parse_conf.h"

using namespace fwcap;

bool split_field(const TextLines& field, std::string& name, TextLines& objects)
{
    if ( field.empty() )
    {
        ParseError("field has no lines");
        return false;
    }

    set_parse_line(field[0].num);
    std::vector<std::string> parts = split(field[0].text, ": ");

    if ( parts.size() != 2 )
    {
        ParseError("missing field separator, expected '<field> : <object>': %s",
            field[0].text.c_str());
        return false;
    }

    name = trim(parts[0]);

    if ( name.empty() )
    {
        ParseError("missing field name: %s", field[0].text.c_str());
        return false;
    }

    objects.clear();
    objects.emplace_back(field[0].num, parts[1]);
    objects.insert(objects.end(), field.begin() + 1, field.end());
    return true;
}

bool is_group_line(const std::string& s)
{ return contains(s, "(group)"); }

bool get_group_name(const std::string& title, std::string& name)
{
    if ( !contains(title, " (group)") )
        return false;

    name = trim(title.substr(0, title.find('(')));
    return true;
}

unsigned group_extent(const TextLines& objects, unsigned idx)
{
    if ( idx + 1 >= objects.size() )
        return objects.size() - idx;

    unsigned width = leading_width(objects[idx + 1].text);
    unsigned n = 1;

    while ( idx + n < objects.size() )
    {
        const std::string& s = objects[idx + n].text;

        if ( is_group_line(s) or leading_width(s) != width )
            break;

        ++n;
    }
    return n;
}
