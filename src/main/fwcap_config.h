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
// fwcap_config.h derived from main/snort_config.h

#ifndef FWCAP_CONFIG_H
#define FWCAP_CONFIG_H

// FwcapConfig holds the effective settings from the command line and the
// optional lua configuration file

#include <string>
#include <utility>
#include <vector>

#include "main/fwcap_types.h"

#define FWCAP_DEFAULT_TOP_K 5

enum LoggingFlag
{
    LOGGING_FLAG__VERBOSE = 0x00000001,
    LOGGING_FLAG__QUIET   = 0x00000002,
};

namespace fwcap
{
struct FwcapConfig
{
    FwcapConfig();

    // dump the effective configuration (verbose only)
    void show() const;

    std::string policy_file;
    std::string lua_conf;

    // positional words after the options, ie "get rule capacity NAME"
    std::vector<std::string> command;

    // static name to dotted quad map from the lua conf
    std::vector<std::pair<std::string, std::string>> hosts;

    unsigned top_k = FWCAP_DEFAULT_TOP_K;
    uint32_t warning_flags;

    bool help = false;
    bool version = false;

    static const FwcapConfig* get_conf();
    static void set_conf(const FwcapConfig*);

    static void set_log_quiet(bool enabled)
    {
        if (enabled)
            logging_flags |= LOGGING_FLAG__QUIET;
        else
            logging_flags &= ~LOGGING_FLAG__QUIET;
    }

    static bool log_quiet()
    { return logging_flags & LOGGING_FLAG__QUIET; }

    static void set_log_verbose(bool enabled)
    {
        if (enabled)
            logging_flags |= LOGGING_FLAG__VERBOSE;
        else
            logging_flags &= ~LOGGING_FLAG__VERBOSE;
    }

    static bool log_verbose()
    { return logging_flags & LOGGING_FLAG__VERBOSE; }

private:
    static uint32_t logging_flags;
};
}

#endif

