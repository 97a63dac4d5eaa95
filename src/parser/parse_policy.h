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

#ifndef PARSE_POLICY_H
#define PARSE_POLICY_H

// the policy listing scanner.  it cuts the export into rules and each
// rule into its four object fields, then hands the field lines to the
// network and protocol parsers.
//
// ----------[ Rule: Custom_rule2 | FM-15046 ]-----------
//     Source Networks       : Internal (group)
//         OBJ-192.168.0.0 (192.168.0.0/16)
//     Destination Networks  : OBJ-10.138.0.0_16 (10.138.0.0/16)
//     Destination Ports     : HTTPS (protocol 6, port 443)
//     Logging Configuration
// ...
// =======================[ Advanced Settings ]=======================

#include <memory>
#include <string>
#include <vector>

#include "parser/parse_utils.h"
#include "policy/access_policy.h"

#define RULE_MARKER "Rule: "
#define RULE_NAME_START "-[ Rule: "
#define RULE_NAME_END " ]-"
#define POLICY_END "=[ Advanced Settings ]="
#define OBJECT_MISSING "Object missing: "

#define SRC_NETWORKS "Source Networks"
#define DST_NETWORKS "Destination Networks"
#define SRC_PORTS "Source Ports"
#define DST_PORTS "Destination Ports"

namespace fwcap
{
class HostResolver;

// drop lines the exporter marks as missing objects or that carry
// terminal escapes
void filter_lines(const TextLines& in, TextLines& out);

// from the first rule title up to the advanced settings
void policy_extent(const TextLines& in, TextLines& out);

// a line with an unclosed parenthesis absorbs the following lines, less
// their indent, until it closes
void join_continuations(const TextLines& in, TextLines& out);

// each rule's lines starting with its title line
std::vector<TextLines> slice_rules(const TextLines&);

// the text between the name markers; false without the opening marker
bool get_rule_name(const std::string& title, std::string& name);

// from the line with keyword up to the next field keyword or end marker;
// empty when the field is absent.  blank lines are dropped.
void slice_field(const TextLines& rule, const char* keyword, TextLines& field);

std::unique_ptr<Rule> parse_rule(const TextLines& rule, HostResolver&);

// when only is set just the rules with that exact name are built.
// nullptr after the first rule that fails.
std::unique_ptr<AccessPolicy> parse_policy(
    const TextLines&, HostResolver&, const char* only = nullptr);

std::unique_ptr<AccessPolicy> parse_policy_file(
    const char* path, HostResolver&, const char* only = nullptr);
}
#endif

