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

#include "access_policy.h"

#include <algorithm>
#include <utility>

using namespace fwcap;

typedef std::pair<Capacity, const Rule*> RankedRule;

static std::vector<const Rule*> top_k(std::vector<RankedRule>& ranked, unsigned k)
{
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const RankedRule& a, const RankedRule& b)
        { return a.first > b.first; });

    std::vector<const Rule*> top;

    for ( const auto& r : ranked )
    {
        if ( top.size() >= k )
            break;

        top.emplace_back(r.second);
    }
    return top;
}

void AccessPolicy::add_rule(Rule&& r)
{ rules.emplace_back(std::move(r)); }

const Rule* AccessPolicy::find_rule(const std::string& name) const
{
    for ( const auto& r : rules )
    {
        if ( r.get_label() == name )
            return &r;
    }
    return nullptr;
}

const Rule* AccessPolicy::get_rule(unsigned idx) const
{
    if ( idx >= rules.size() )
        return nullptr;

    return &rules[idx];
}

Capacity AccessPolicy::capacity() const
{
    Capacity n = 0;

    for ( const auto& r : rules )
        n += r.capacity();

    return n;
}

Capacity AccessPolicy::optimized_capacity() const
{
    Capacity n = 0;

    for ( const auto& r : rules )
        n += r.optimized_capacity();

    return n;
}

std::vector<const Rule*> AccessPolicy::top_by_capacity(unsigned k) const
{
    std::vector<RankedRule> ranked;

    for ( const auto& r : rules )
        ranked.emplace_back(r.capacity(), &r);

    return top_k(ranked, k);
}

std::vector<const Rule*> AccessPolicy::top_by_optimization(unsigned k) const
{
    std::vector<RankedRule> ranked;

    for ( const auto& r : rules )
    {
        // optimized never exceeds raw for the same protocol factor
        Capacity raw = r.capacity();
        Capacity opt = r.optimized_capacity();
        ranked.emplace_back(raw > opt ? raw - opt : 0, &r);
    }
    return top_k(ranked, k);
}
