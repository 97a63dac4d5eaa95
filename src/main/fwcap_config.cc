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
// fwcap_config.cc derived from main/snort_config.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "fwcap_config.h"

#include "log/messages.h"

using namespace fwcap;

uint32_t FwcapConfig::logging_flags = 0;

static const FwcapConfig* fwcap_conf = nullptr;

FwcapConfig::FwcapConfig()
{
    // all groups are on by default
    warning_flags = (1 << WARN_MAX) - 1;
}

const FwcapConfig* FwcapConfig::get_conf()
{ return fwcap_conf; }

void FwcapConfig::set_conf(const FwcapConfig* fc)
{ fwcap_conf = fc; }

void FwcapConfig::show() const
{
    if ( !log_verbose() )
        return;

    LogMessage("%s\n", LOG_DIV);
    LogMessage("fwcap configuration\n");

    ConfigLogger::log_value("policy file", policy_file.c_str());
    ConfigLogger::log_value("lua conf", lua_conf.c_str());
    ConfigLogger::log_value("top", top_k);
    ConfigLogger::log_flag("quiet", log_quiet());
    ConfigLogger::log_flag("verbose", log_verbose());

    if ( !hosts.empty() )
    {
        std::string list;

        for ( const auto& h : hosts )
        {
            list += h.first;
            list += "=";
            list += h.second;
            list += " ";
        }
        ConfigLogger::log_list("hosts", list.c_str());
    }

    std::string cmd;

    for ( const auto& w : command )
    {
        cmd += w;
        cmd += " ";
    }
    ConfigLogger::log_list("command", cmd.c_str());
}

