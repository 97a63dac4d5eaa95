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

#ifndef RULE_H
#define RULE_H

// a Rule is one access control entry with up to four object fields.  an
// absent field matches everything and contributes a factor of 1.

#include <memory>
#include <string>
#include <vector>

#include "network/network_object.h"
#include "protocol/protocol_object.h"

namespace fwcap
{
enum RuleDirection
{
    RD_SRC,
    RD_DST,
    RD_MAX
};

class Rule
{
public:
    explicit Rule(const std::string& s) : label(s) { }

    Rule(Rule&&) = default;
    Rule& operator=(Rule&&) = default;

    const std::string& get_label() const
    { return label; }

    void set_networks(RuleDirection, std::unique_ptr<NetworkObject>);
    void set_protocols(RuleDirection, std::unique_ptr<ProtocolObject>);

    // nullptr when the field is absent
    const NetworkObject* get_networks(RuleDirection d) const
    { return networks[d].get(); }

    const ProtocolObject* get_protocols(RuleDirection d) const
    { return protocols[d].get(); }

    // raw network capacities; the protocol factor always comes from the
    // optimized protocol lists
    Capacity capacity() const;
    Capacity optimized_capacity() const;

    Capacity protocol_factor() const;

private:
    std::string label;
    std::unique_ptr<NetworkObject> networks[RD_MAX];
    std::unique_ptr<ProtocolObject> protocols[RD_MAX];
};

// nullptr for an absent direction; 1 when both are absent.  the table
// with more distinct protocols drives the sum so swapping the arguments
// gives the same result.
Capacity protocol_factor(
    const std::vector<OptimizedProtocol>* src, const std::vector<OptimizedProtocol>* dst);
}
#endif

