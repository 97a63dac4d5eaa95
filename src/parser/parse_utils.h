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
// parse_utils.h derived from parser/parse_utils.h

#ifndef PARSE_UTILS_H
#define PARSE_UTILS_H

// text helpers shared by the policy, network and protocol parsers

#include <istream>
#include <string>
#include <vector>

// one physical line of the export; num is 1 based
struct TextLine
{
    TextLine() = default;
    TextLine(unsigned n, const std::string& s) : num(n), text(s) { }

    unsigned num = 0;
    std::string text;
};

typedef std::vector<TextLine> TextLines;

void read_lines(std::istream&, TextLines&);

std::string trim(const std::string&);
std::string trim_left(const std::string&);

// every piece including empty ones, like strtok would not
std::vector<std::string> split(const std::string&, const std::string& sep);

// count of leading blanks and tabs
unsigned leading_width(const std::string&);

bool contains(const std::string&, const char*);
unsigned count_of(const std::string&, char);

// decimal digits only; reports ParseError and returns false otherwise
bool parse_uint(const std::string&, const char* tag, unsigned high, unsigned& value);

#endif

