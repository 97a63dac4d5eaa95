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

#include "parse_policy.h"

#include <cstring>
#include <fstream>
#include <utility>

#include "log/messages.h"
#include "parser/parse_conf.h"
#include "parser/parse_network.h"
#include "parser/parse_protocol.h"

using namespace fwcap;

static const char* const field_keys[] =
{ SRC_NETWORKS, DST_NETWORKS, SRC_PORTS, DST_PORTS };

static const char* const end_keys[] =
{ "Logging", "Users", "URLs", "Safe Search", "Logging Configuration" };

static bool ends_field(const std::string& s, const char* keyword)
{
    for ( auto key : field_keys )
    {
        if ( strcmp(key, keyword) and contains(s, key) )
            return true;
    }
    for ( auto key : end_keys )
    {
        if ( contains(s, key) )
            return true;
    }
    return false;
}

static int paren_balance(const std::string& s)
{ return (int)count_of(s, '(') - (int)count_of(s, ')'); }

// the caller holds the rule name in the parse location
static std::unique_ptr<Rule> build_rule(
    const std::string& name, const TextLines& lines, HostResolver& resolver)
{
    TextLines body;
    join_continuations(lines, body);

    std::unique_ptr<Rule> rule(new Rule(name));

    const char* net_keys[RD_MAX] = { SRC_NETWORKS, DST_NETWORKS };
    const char* port_keys[RD_MAX] = { SRC_PORTS, DST_PORTS };

    for ( int d = RD_SRC; d < RD_MAX; ++d )
    {
        TextLines field;
        slice_field(body, net_keys[d], field);

        if ( field.empty() )
            continue;

        set_parse_field(net_keys[d]);
        std::unique_ptr<NetworkObject> no = parse_network_object(field, resolver);

        if ( !no )
            return nullptr;

        rule->set_networks((RuleDirection)d, std::move(no));
    }

    for ( int d = RD_SRC; d < RD_MAX; ++d )
    {
        TextLines field;
        slice_field(body, port_keys[d], field);

        if ( field.empty() )
            continue;

        set_parse_field(port_keys[d]);
        std::unique_ptr<ProtocolObject> po = parse_protocol_object(field);

        if ( !po )
            return nullptr;

        rule->set_protocols((RuleDirection)d, std::move(po));
    }

    return rule;
}

namespace fwcap
{
void filter_lines(const TextLines& in, TextLines& out)
{
    for ( const auto& line : in )
    {
        if ( contains(line.text, OBJECT_MISSING) or contains(line.text, "\x1b") )
            continue;

        out.emplace_back(line);
    }
}

void policy_extent(const TextLines& in, TextLines& out)
{
    auto it = in.begin();

    while ( it != in.end() and !contains(it->text, RULE_NAME_START) )
        ++it;

    while ( it != in.end() and !contains(it->text, POLICY_END) )
        out.emplace_back(*it++);
}

void join_continuations(const TextLines& in, TextLines& out)
{
    for ( unsigned i = 0; i < in.size(); ++i )
    {
        TextLine line = in[i];
        int open = paren_balance(line.text);

        while ( open > 0 and i + 1 < in.size() )
        {
            const std::string& next = in[++i].text;
            line.text += trim_left(next);
            open += paren_balance(next);
        }
        out.emplace_back(line);
    }
}

std::vector<TextLines> slice_rules(const TextLines& lines)
{
    std::vector<TextLines> rules;

    for ( const auto& line : lines )
    {
        if ( contains(line.text, RULE_MARKER) )
            rules.emplace_back();

        // anything ahead of the first title is not part of a rule
        if ( !rules.empty() )
            rules.back().emplace_back(line);
    }
    return rules;
}

bool get_rule_name(const std::string& title, std::string& name)
{
    size_t pos = title.find(RULE_NAME_START);

    if ( pos == std::string::npos )
        return false;

    pos += strlen(RULE_NAME_START);
    size_t end = title.find(RULE_NAME_END, pos);

    name = title.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    return true;
}

void slice_field(const TextLines& rule, const char* keyword, TextLines& field)
{
    auto it = rule.begin();

    while ( it != rule.end() and !contains(it->text, keyword) )
        ++it;

    for ( ; it != rule.end(); ++it )
    {
        if ( ends_field(it->text, keyword) )
            break;

        if ( trim(it->text).empty() )
            continue;

        field.emplace_back(*it);
    }
}

std::unique_ptr<Rule> parse_rule(const TextLines& lines, HostResolver& resolver)
{
    if ( lines.empty() )
    {
        ParseError("rule has no lines");
        return nullptr;
    }

    std::string name;
    set_parse_line(lines[0].num);

    if ( !get_rule_name(lines[0].text, name) )
    {
        ParseError("missing rule name marker: %s", lines[0].text.c_str());
        return nullptr;
    }

    set_parse_rule(name.c_str());
    std::unique_ptr<Rule> rule = build_rule(name, lines, resolver);
    set_parse_rule(nullptr);

    return rule;
}

std::unique_ptr<AccessPolicy> parse_policy(
    const TextLines& lines, HostResolver& resolver, const char* only)
{
    TextLines filtered, extent;
    filter_lines(lines, filtered);
    policy_extent(filtered, extent);

    std::unique_ptr<AccessPolicy> policy(new AccessPolicy);

    for ( const auto& rl : slice_rules(extent) )
    {
        if ( only )
        {
            std::string name;

            if ( get_rule_name(rl[0].text, name) and name != only )
                continue;
        }

        std::unique_ptr<Rule> rule = parse_rule(rl, resolver);

        if ( !rule )
            return nullptr;

        TraceMessage("rule '%s' parsed\n", rule->get_label().c_str());
        policy->add_rule(std::move(*rule));
    }
    return policy;
}

std::unique_ptr<AccessPolicy> parse_policy_file(
    const char* path, HostResolver& resolver, const char* only)
{
    std::ifstream fs(path, std::ios_base::in);

    if ( !fs )
    {
        ParseError("can't open policy file %s", path);
        return nullptr;
    }

    TextLines lines;
    read_lines(fs, lines);

    push_parse_location("policy", path);
    std::unique_ptr<AccessPolicy> policy = parse_policy(lines, resolver, only);
    pop_parse_location();

    return policy;
}
}
