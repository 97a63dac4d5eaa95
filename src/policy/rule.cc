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

#include "rule.h"

#include <map>
#include <utility>

using namespace fwcap;

typedef std::map<uint8_t, Capacity> ProtocolFreq;

static void count_protocols(const std::vector<OptimizedProtocol>* ops, ProtocolFreq& freq)
{
    if ( !ops )
        return;

    for ( const auto& op : *ops )
        freq[op.protocol]++;
}

namespace fwcap
{
Capacity protocol_factor(
    const std::vector<OptimizedProtocol>* src, const std::vector<OptimizedProtocol>* dst)
{
    ProtocolFreq sf, df;
    count_protocols(src, sf);
    count_protocols(dst, df);

    if ( sf.empty() and df.empty() )
        return 1;

    // equal sizes are ordered by content so the pick does not depend on direction
    bool src_long = sf.size() > df.size() or (sf.size() == df.size() and sf > df);
    const ProtocolFreq& lng = src_long ? sf : df;
    const ProtocolFreq& sht = src_long ? df : sf;

    Capacity factor = 0;

    for ( const auto& p : lng )
    {
        auto it = sht.find(p.first);
        factor += p.second * (it != sht.end() ? it->second : 1);
    }
    return factor;
}
}

void Rule::set_networks(RuleDirection d, std::unique_ptr<NetworkObject> no)
{ networks[d] = std::move(no); }

void Rule::set_protocols(RuleDirection d, std::unique_ptr<ProtocolObject> po)
{ protocols[d] = std::move(po); }

Capacity Rule::protocol_factor() const
{
    std::vector<OptimizedProtocol> src, dst;

    if ( protocols[RD_SRC] )
        src = protocols[RD_SRC]->optimize();

    if ( protocols[RD_DST] )
        dst = protocols[RD_DST]->optimize();

    return fwcap::protocol_factor(
        protocols[RD_SRC] ? &src : nullptr, protocols[RD_DST] ? &dst : nullptr);
}

Capacity Rule::capacity() const
{
    Capacity src = networks[RD_SRC] ? networks[RD_SRC]->capacity() : 1;
    Capacity dst = networks[RD_DST] ? networks[RD_DST]->capacity() : 1;

    return src * dst * protocol_factor();
}

Capacity Rule::optimized_capacity() const
{
    Capacity src = networks[RD_SRC] ? networks[RD_SRC]->optimize().capacity() : 1;
    Capacity dst = networks[RD_DST] ? networks[RD_DST]->optimize().capacity() : 1;

    return src * dst * protocol_factor();
}
