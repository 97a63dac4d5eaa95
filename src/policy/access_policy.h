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

#ifndef ACCESS_POLICY_H
#define ACCESS_POLICY_H

// the ordered rule set of one access control policy

#include <string>
#include <vector>

#include "policy/rule.h"

namespace fwcap
{
class AccessPolicy
{
public:
    AccessPolicy() = default;

    void add_rule(Rule&&);

    unsigned rule_count() const
    { return rules.size(); }

    bool empty() const
    { return rules.empty(); }

    // first rule with exactly this name or nullptr
    const Rule* find_rule(const std::string& name) const;

    // nullptr when idx is out of range
    const Rule* get_rule(unsigned idx) const;

    Capacity capacity() const;
    Capacity optimized_capacity() const;

    // at most k rules, largest first; equal values keep policy order
    std::vector<const Rule*> top_by_capacity(unsigned k) const;

    // ranked by capacity - optimized capacity
    std::vector<const Rule*> top_by_optimization(unsigned k) const;

private:
    std::vector<Rule> rules;
};
}
#endif

