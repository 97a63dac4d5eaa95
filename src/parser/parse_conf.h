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

#ifndef PARSE_CONF_H
#define PARSE_CONF_H

#include <string>

// the location stack tells error messages where the parser is:
// which file and line, and within a policy which rule and field

void push_parse_location(
    const char* code, const char* path, const char* file = nullptr, unsigned line = 0);

void pop_parse_location();
void set_parse_line(unsigned);

// nullptr clears the context
void set_parse_rule(const char*);
void set_parse_field(const char*);

void get_parse_location(const char*& name, unsigned& line);

// "rule 'name' Source Networks" or empty when nothing is being parsed
std::string get_parse_context();

#endif

