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
// help.cc derived from main/help.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "help.h"

#include <lua.hpp>

#include <cstdio>

#include "parser/cmd_line.h"

#include "build.h"

using namespace fwcap;

void help_usage(const char* s)
{
    fprintf(stdout, "usage:\n");
    fprintf(stdout, "    %s -?: list options\n", s);
    fprintf(stdout, "    %s -V: output version\n", s);
    fprintf(stdout, "    %s --file <file> get rule capacity <name>\n", s);
    fprintf(stdout, "    %s --file <file> get rule analysis <name>\n", s);
    fprintf(stdout, "    %s --file <file> [--top <k>] get top-k by-capacity\n", s);
    fprintf(stdout, "    %s --file <file> [--top <k>] get top-k by-optimization\n", s);
    fprintf(stdout, "    %s --file <file> get acp capacity\n", s);
    fprintf(stdout, "    %s --file <file> get acp analysis\n", s);
}

void help_options()
{
    for ( const CmdOption* p = get_cmd_options(); p->name; ++p )
        fprintf(stdout, "%s %s\n", p->name, p->help);
}

void help_version()
{
    fprintf(stdout, "\n");
    fprintf(stdout, "   fwcap %s\n", FWCAP_VERSION);
    fprintf(stdout, "   access control policy capacity analyzer\n");
    fprintf(stdout, "   Using %s\n", LUAJIT_VERSION);
    fprintf(stdout, "\n");
}
