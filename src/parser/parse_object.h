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

#ifndef PARSE_OBJECT_H
#define PARSE_OBJECT_H

// the layout shared by network and port fields:
//
//     Source Networks       : Internal (group)
//         OBJ-192.168.0.0 (192.168.0.0/16)
//         OBJ-172.17.0.0 (172.17.0.0/16)
//       OBJ-10.10.0.0_16 (10.10.0.0/16)
//       10.0.0.0/8
//
// the first line carries the field name and the first object.  a group
// runs while its children share the indent of the first child.

#include <string>

#include "parser/parse_utils.h"

// name is the text before ": " trimmed; objects gets the text after it
// followed by the remaining lines
bool split_field(const TextLines& field, std::string& name, TextLines& objects);

bool is_group_line(const std::string&);

// the text before '(' trimmed; false without " (group)"
bool get_group_name(const std::string& title, std::string& name);

// number of lines starting at objects[idx] that belong to the group
// there, title included
unsigned group_extent(const TextLines& objects, unsigned idx);

#endif

