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

#ifndef LUA_CONF_H
#define LUA_CONF_H

// an optional lua file may set defaults in a global table:
//
//     fwcap =
//     {
//         file = 'acp.txt',
//         top = 10,
//         verbose = true,
//         hosts = { ['ipv4.net'] = '192.0.2.10' },
//     }
//
// problems are reported with ParseError and counted

#include <string>

namespace fwcap
{
struct FwcapConfig;

bool load_lua_conf(const char* path, FwcapConfig&);

// same for a chunk held in memory; name is used in messages
bool load_lua_string(const std::string& chunk, const char* name, FwcapConfig&);
}
#endif

