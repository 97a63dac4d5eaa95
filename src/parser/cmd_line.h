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
// cmd_line.h derived from parser/cmd_line.h

#ifndef CMD_LINE_H
#define CMD_LINE_H

namespace fwcap
{
struct FwcapConfig;

enum CmdOptionType
{
    COT_IMPLIED,
    COT_STRING,
    COT_COUNT
};

struct CmdOption
{
    const char* name;
    CmdOptionType type;
    const char* help;
};

// terminated by a null name
const CmdOption* get_cmd_options();

// -c, -q and -v first so the lua conf sees them and the rest of the
// command line overrides the conf.  FatalError after any ParseError.
void parse_cmd_line(int argc, char* argv[], FwcapConfig&);

// same without the FatalError; returns the number of errors
unsigned parse_cmd_args(int argc, char* argv[], FwcapConfig&);
}
#endif
