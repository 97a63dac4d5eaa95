//--------------------------------------------------------------------------
// Copyright (C) 2014-2024 Cisco and/or its affiliates. All rights reserved.
// Copyright (C) 2013-2013 Sourcefire, Inc.
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

#include "messages.h"

#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>

#include "main/fwcap_config.h"
#include "parser/parse_conf.h"

using namespace fwcap;

static int already_fatal = 0;

static unsigned parse_errors = 0;
static unsigned parse_warnings = 0;

void reset_parse_errors()
{
    parse_errors = 0;
    parse_warnings = 0;
}

unsigned get_parse_errors()
{
    unsigned tmp = parse_errors;
    parse_errors = 0;
    return tmp;
}

unsigned get_parse_warnings()
{
    unsigned tmp = parse_warnings;
    parse_warnings = 0;
    return tmp;
}

static void log_message(FILE* file, const char* type, const char* msg)
{
    const char* file_name;
    unsigned file_line;
    get_parse_location(file_name, file_line);

    std::string ctx = get_parse_context();

    if ( !ctx.empty() )
        ctx += ": ";

    if ( file_line )
        LogMessage(file, "%s: %s:%u %s%s\n", type, file_name, file_line, ctx.c_str(), msg);

    else if ( file_name )
        LogMessage(file, "%s: %s: %s%s\n", type, file_name, ctx.c_str(), msg);

    else
        LogMessage(file, "%s: %s%s\n", type, ctx.c_str(), msg);
}

namespace fwcap
{
void ParseWarning(WarningGroup wg, const char* format, ...)
{
    const FwcapConfig* fc = FwcapConfig::get_conf();

    if ( fc and !(fc->warning_flags & (1 << wg)) )
        return;

    char buf[STD_BUF+1];
    va_list ap;

    va_start(ap, format);
    vsnprintf(buf, STD_BUF, format, ap);
    va_end(ap);

    buf[STD_BUF] = '\0';
    log_message(stderr, "WARNING", buf);

    parse_warnings++;
}

void ParseError(const char* format, ...)
{
    char buf[STD_BUF+1];
    va_list ap;

    va_start(ap, format);
    vsnprintf(buf, STD_BUF, format, ap);
    va_end(ap);

    buf[STD_BUF] = '\0';
    log_message(stderr, "ERROR", buf);

    parse_errors++;
}

// print an info message to stdout
void LogMessage(const char* format,...)
{
    if ( FwcapConfig::log_quiet() )
        return;

    va_list ap;
    va_start(ap, format);

    vfprintf(stdout, format, ap);

    va_end(ap);
}

void LogMessage(FILE* fh, const char* format,...)
{
    if ( fh == stdout and FwcapConfig::log_quiet() )
        return;

    va_list ap;
    va_start(ap, format);

    vfprintf(fh, format, ap);

    va_end(ap);
}

void TraceMessage(const char* format,...)
{
    if ( !FwcapConfig::log_verbose() )
        return;

    va_list ap;
    va_start(ap, format);

    vfprintf(stdout, format, ap);

    va_end(ap);
}

// print an error message to stderr
void ErrorMessage(const char* format,...)
{
    va_list ap;
    va_start(ap, format);

    vfprintf(stderr, format, ap);

    va_end(ap);
}

// when a fatal error occurs, this function prints the error message
// and exits with a failure status
[[noreturn]] void FatalError(const char* format,...)
{
    char buf[STD_BUF+1];
    va_list ap;

    // -----------------------------
    // bail now if we are reentering
    if ( already_fatal )
        exit(1);
    else
        already_fatal = 1;
    // -----------------------------

    va_start(ap, format);
    vsnprintf(buf, STD_BUF, format, ap);
    va_end(ap);

    buf[STD_BUF] = '\0';

    fprintf(stderr, "FATAL: %s", buf);
    fprintf(stderr,"Fatal Error, Quitting..\n");

    exit(EXIT_FAILURE);
}

#define CAPTION "%*s: "
#define SUB_CAPTION "%*s = "

bool ConfigLogger::log_flag(const char* caption, bool flag, bool subopt)
{
    auto fmt = subopt ? SUB_CAPTION "%s\n" : CAPTION "%s\n";
    auto ind = subopt ? indention + strlen(caption) + 2 : indention;

    LogMessage(fmt, (int)ind, caption, flag ? "enabled" : "disabled");
    return flag;
}

void ConfigLogger::log_value(const char* caption, unsigned n, bool subopt)
{
    auto fmt = subopt ? SUB_CAPTION "%u\n" : CAPTION "%u\n";
    auto ind = subopt ? indention + strlen(caption) + 2 : indention;

    LogMessage(fmt, (int)ind, caption, n);
}

void ConfigLogger::log_value(const char* caption, const char* str, bool subopt)
{
    if ( !str or !str[0] )
        return;

    auto fmt = subopt ? SUB_CAPTION "%s\n" : CAPTION "%s\n";
    auto ind = subopt ? indention + strlen(caption) + 2 : indention;

    LogMessage(fmt, (int)ind, caption, str);
}

void ConfigLogger::log_list(const char* caption, const char* list, const char* prefix, bool subopt)
{
    if ( !list or !list[0] )
        return;

    auto delim_symbol = subopt ? "=" : ":";
    auto ind = subopt ? indention + strlen(caption) + 2 : indention;

    const char* const delim = (caption and caption[0]) ? delim_symbol : " ";
    const char* const head_fmt = "%*s%s%.0s%s\n";
    const char* const tail_fmt = "%*.0s%.0s%s%s\n";
    const char* fmt = head_fmt;

    std::stringstream ss(list);
    std::string res;
    std::string val;

    while (ss >> val)
    {
        if ( res.length() + val.length() > max_line_len )
        {
            LogMessage(fmt, (int)ind, caption, delim, prefix, res.c_str());
            fmt = tail_fmt;
            res.clear();
        }
        res += ' ' + val;
    }

    LogMessage(fmt, (int)ind, caption, delim, prefix, res.c_str());
}
} //namespace fwcap

