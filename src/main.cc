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

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "log/messages.h"
#include "main/commands.h"
#include "main/fwcap_config.h"
#include "main/help.h"
#include "network/host_resolver.h"
#include "parser/cmd_line.h"

using namespace fwcap;

static int main_exit_code = 0;

//-------------------------------------------------------------------------
// housekeeping foo
//-------------------------------------------------------------------------

static void load_hosts(const FwcapConfig& fc, StaticResolver& hosts)
{
    for ( const auto& h : fc.hosts )
    {
        IpRet ret = hosts.add(h.first.c_str(), h.second.c_str());

        if ( ret != IP_SUCCESS )
            ParseError("host %s: %s is not usable, %s",
                h.first.c_str(), h.second.c_str(), ip_ret_str(ret));
    }
    if ( hosts.size() )
        TraceMessage("loaded %zu static hosts\n", hosts.size());
}

// false when there is nothing more to do
static bool set_mode(const FwcapConfig& fc, const char* prog)
{
    if ( fc.help )
    {
        help_usage(prog);
        help_options();
        return false;
    }

    if ( fc.version )
    {
        help_version();
        return false;
    }

    if ( fc.command.empty() )
    {
        help_usage(prog);
        main_exit_code = 1;
        return false;
    }
    return true;
}

static void fwcap_main(const FwcapConfig& fc)
{
    DnsResolver dns;
    StaticResolver hosts(&dns);

    load_hosts(fc, hosts);

    if ( unsigned k = get_parse_errors() )
        FatalError("see prior %u errors\n", k);

    main_exit_code = run_command(fc, hosts, stdout);
}

//-------------------------------------------------------------------------
// main foo
//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    FwcapConfig fc;
    FwcapConfig::set_conf(&fc);

    parse_cmd_line(argc, argv, fc);

    if ( set_mode(fc, argv[0]) )
    {
        fc.show();
        fwcap_main(fc);
    }

    FwcapConfig::set_conf(nullptr);
    return main_exit_code;
}
