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

#include "commands.h"

#include <memory>
#include <string>
#include <vector>

#include "log/messages.h"
#include "log/report.h"
#include "parser/parse_policy.h"

#include "fwcap_config.h"

using namespace fwcap;

typedef std::vector<std::string> Words;

static std::string join(const Words& words, unsigned from)
{
    std::string s;

    for ( unsigned i = from; i < words.size(); ++i )
    {
        if ( !s.empty() )
            s += " ";
        s += words[i];
    }
    return s;
}

static std::unique_ptr<AccessPolicy> load_policy(
    const FwcapConfig& fc, HostResolver& resolver, const char* only = nullptr)
{
    std::unique_ptr<AccessPolicy> acp =
        parse_policy_file(fc.policy_file.c_str(), resolver, only);

    if ( unsigned k = get_parse_errors() )
    {
        ErrorMessage("ERROR: see prior %u errors\n", k);
        return nullptr;
    }
    return acp;
}

static int get_rule(const FwcapConfig& fc, HostResolver& resolver, FILE* out)
{
    const Words& cmd = fc.command;
    std::string name = join(cmd, 3);

    if ( cmd.size() < 4 or (cmd[2] != "capacity" and cmd[2] != "analysis") )
    {
        ErrorMessage("usage: get rule capacity|analysis <name>\n");
        return 1;
    }

    std::unique_ptr<AccessPolicy> acp = load_policy(fc, resolver, name.c_str());

    if ( !acp )
        return 1;

    const Rule* r = acp->find_rule(name);

    if ( !r )
    {
        ErrorMessage("no rule found with name: %s\n", name.c_str());
        return 1;
    }

    if ( cmd[2] == "capacity" )
        report_rule_capacity(out, *r);
    else
        report_rule_analysis(out, *r);

    return 0;
}

static int get_top_k(const FwcapConfig& fc, HostResolver& resolver, FILE* out)
{
    const Words& cmd = fc.command;

    if ( cmd.size() != 3 or (cmd[2] != "by-capacity" and cmd[2] != "by-optimization") )
    {
        ErrorMessage("usage: get top-k by-capacity|by-optimization\n");
        return 1;
    }

    std::unique_ptr<AccessPolicy> acp = load_policy(fc, resolver);

    if ( !acp )
        return 1;

    if ( acp->empty() )
    {
        ErrorMessage("no rules found\n");
        return 1;
    }

    std::vector<const Rule*> top = (cmd[2] == "by-capacity") ?
        acp->top_by_capacity(fc.top_k) : acp->top_by_optimization(fc.top_k);

    for ( auto r : top )
        report_rule_capacity(out, *r);

    return 0;
}

static int get_acp(const FwcapConfig& fc, HostResolver& resolver, FILE* out)
{
    const Words& cmd = fc.command;

    if ( cmd.size() != 3 or (cmd[2] != "capacity" and cmd[2] != "analysis") )
    {
        ErrorMessage("usage: get acp capacity|analysis\n");
        return 1;
    }

    std::unique_ptr<AccessPolicy> acp = load_policy(fc, resolver);

    if ( !acp )
        return 1;

    if ( acp->empty() )
    {
        ErrorMessage("no rules found\n");
        return 1;
    }

    report_policy_capacity(out, *acp);

    if ( cmd[2] == "analysis" )
    {
        for ( unsigned i = 0; i < acp->rule_count(); ++i )
            report_rule_capacity(out, *acp->get_rule(i));
    }
    return 0;
}

namespace fwcap
{
int run_command(const FwcapConfig& fc, HostResolver& resolver, FILE* out)
{
    const Words& cmd = fc.command;

    if ( cmd.size() < 2 or cmd[0] != "get" )
    {
        ErrorMessage("unknown command: %s\n", join(cmd, 0).c_str());
        return 1;
    }

    if ( fc.policy_file.empty() )
    {
        ErrorMessage("no policy file given, use --file <file>\n");
        return 1;
    }

    if ( cmd[1] == "rule" )
        return get_rule(fc, resolver, out);

    if ( cmd[1] == "top-k" )
        return get_top_k(fc, resolver, out);

    if ( cmd[1] == "acp" )
        return get_acp(fc, resolver, out);

    ErrorMessage("unknown command: %s\n", join(cmd, 0).c_str());
    return 1;
}
}
