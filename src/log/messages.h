//--------------------------------------------------------------------------
// Copyright (C) 2014-2024 Cisco and/or its affiliates. All rights reserved.
// Copyright (C) 2002-2013 Sourcefire, Inc.
// Copyright (C) 2002 Martin Roesch <roesch@sourcefire.com>
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

#ifndef MESSAGES_H
#define MESSAGES_H

#include <cstdio>
#include <cstdarg>

#include "main/fwcap_types.h"

#define LOG_DIV "--------------------------------------------------"

#ifndef __GNUC__
#define __attribute__(x)  /*NOTHING*/
#endif

#define STD_BUF 1024

enum WarningGroup
{
    WARN_CONF,
    WARN_MAX
};

unsigned get_parse_errors();
unsigned get_parse_warnings();
void reset_parse_errors();

namespace fwcap
{
void ParseWarning(WarningGroup, const char*, ...) __attribute__((format (printf, 2, 3)));
void ParseError(const char*, ...) __attribute__((format (printf, 1, 2)));

void LogMessage(const char*, ...) __attribute__((format (printf, 1, 2)));
void LogMessage(FILE*, const char*, ...) __attribute__((format (printf, 2, 3)));
void ErrorMessage(const char*, ...) __attribute__((format (printf, 1, 2)));

// only printed when running verbose
void TraceMessage(const char*, ...) __attribute__((format (printf, 1, 2)));

class ConfigLogger final
{
public:
    ConfigLogger() = delete;

    static bool log_flag(const char* caption, bool flag, bool subopt = false);

    static void log_value(const char* caption, unsigned n, bool subopt = false);
    static void log_value(const char* caption, const char* str, bool subopt = false);

    static void log_list(const char* caption, const char* list, const char* prefix = " ",
        bool subopt = false);

private:
    static constexpr int indention = 25;
    static constexpr int max_line_len = 75;
};

[[noreturn]] void FatalError(const char*, ...) __attribute__((format (printf, 1, 2)));
}

#endif

