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
// parse_utils.cc derived from parser/parse_utils.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "parse_utils.h"

#include <cctype>
#include <cstring>

#include "log/messages.h"

using namespace fwcap;

static const char* blanks = " \t\r\n";

void read_lines(std::istream& is, TextLines& lines)
{
    std::string s;
    unsigned num = 0;

    while ( std::getline(is, s) )
    {
        if ( !s.empty() and s.back() == '\r' )
            s.pop_back();

        lines.emplace_back(++num, s);
    }
}

std::string trim(const std::string& s)
{
    size_t first = s.find_first_not_of(blanks);

    if ( first == std::string::npos )
        return "";

    size_t last = s.find_last_not_of(blanks);
    return s.substr(first, last - first + 1);
}

std::string trim_left(const std::string& s)
{
    size_t first = s.find_first_not_of(blanks);

    if ( first == std::string::npos )
        return "";

    return s.substr(first);
}

std::vector<std::string> split(const std::string& s, const std::string& sep)
{
    std::vector<std::string> parts;
    size_t pos = 0;

    if ( sep.empty() )
    {
        parts.emplace_back(s);
        return parts;
    }

    while ( true )
    {
        size_t next = s.find(sep, pos);

        if ( next == std::string::npos )
        {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + sep.size();
    }
    return parts;
}

unsigned leading_width(const std::string& s)
{
    unsigned n = 0;

    while ( n < s.size() and (s[n] == ' ' or s[n] == '\t') )
        ++n;

    return n;
}

bool contains(const std::string& s, const char* what)
{ return s.find(what) != std::string::npos; }

unsigned count_of(const std::string& s, char c)
{
    unsigned n = 0;

    for ( auto ch : s )
    {
        if ( ch == c )
            ++n;
    }
    return n;
}

bool parse_uint(const std::string& s, const char* tag, unsigned high, unsigned& value)
{
    if ( s.empty() or s.size() > 10 )
    {
        ParseError("invalid '%s' format: '%s'", tag, s.c_str());
        return false;
    }

    uint64_t n = 0;

    for ( auto c : s )
    {
        if ( !isdigit((unsigned char)c) )
        {
            ParseError("invalid '%s' format: '%s'", tag, s.c_str());
            return false;
        }
        n = n * 10 + (c - '0');
    }

    if ( n > high )
    {
        ParseError("'%s' must be in 0:%u, inclusive", tag, high);
        return false;
    }

    value = (unsigned)n;
    return true;
}
