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

#include "protocol_merge.h"

#include <algorithm>
#include <cstdio>
#include <utility>

#include "log/messages.h"
#include "utils/merge_verb.h"

using namespace fwcap;

static OptimizedProtocol make_entry(const ProtocolListItem& item)
{
    OptimizedProtocol op;
    op.label = item.get_label();
    op.protocol = item.get_protocol();
    op.port_start = item.get_port_start();
    op.port_end = item.get_port_end();
    op.l4 = item.is_l4();
    op.first = item;
    op.count = 1;
    return op;
}

static uint32_t l4_key(const ProtocolListItem& item)
{ return ((uint32_t)item.get_protocol() << 16) + item.get_port_start(); }

std::string OptimizedProtocol::to_string() const
{
    if ( !l4 )
    {
        std::string s = first.to_string();

        if ( count > 1 )
        {
            char buf[32];
            snprintf(buf, sizeof(buf), " x%u", count);
            s += buf;
        }
        return s;
    }

    char buf[64];

    if ( port_start == port_end )
        snprintf(buf, sizeof(buf), " (protocol %u, port %u)", protocol, port_start);
    else
        snprintf(buf, sizeof(buf), " (protocol %u, port %u-%u)", protocol, port_start, port_end);

    return label + buf;
}

namespace fwcap
{
void unique_l3(const std::vector<ProtocolListItem>& items, std::vector<OptimizedProtocol>& out)
{
    std::vector<OptimizedProtocol> uniq;

    for ( const auto& item : items )
    {
        if ( item.is_l4() )
            continue;

        auto it = std::find_if(uniq.begin(), uniq.end(),
            [&item](const OptimizedProtocol& op)
            { return op.first.same_l3(item); });

        if ( it != uniq.end() )
        {
            it->count++;
            continue;
        }
        uniq.emplace_back(make_entry(item));
    }
    out.insert(out.end(), uniq.begin(), uniq.end());
}

void merge_l4(const std::vector<ProtocolListItem>& items, std::vector<OptimizedProtocol>& out)
{
    std::vector<const ProtocolListItem*> l4;

    for ( const auto& item : items )
    {
        if ( item.is_l4() )
            l4.emplace_back(&item);
    }

    if ( l4.empty() )
        return;

    std::stable_sort(l4.begin(), l4.end(),
        [](const ProtocolListItem* a, const ProtocolListItem* b)
        { return l4_key(*a) < l4_key(*b); });

    OptimizedProtocol curr = make_entry(*l4[0]);

    for ( size_t i = 1; i < l4.size(); ++i )
    {
        const ProtocolListItem& next = *l4[i];

        if ( next.get_protocol() == curr.protocol and
            (uint32_t)next.get_port_start() <= (uint32_t)curr.port_end + 1 )
        {
            MergeVerb verb = classify_merge(curr.port_end, next.get_port_start(), next.get_port_end());
            append_merge_label(curr.label, verb, next.get_label());

            if ( next.get_port_end() > curr.port_end )
                curr.port_end = next.get_port_end();

            curr.count++;
            TraceMessage("merged port %u-%u into protocol %u, port %u-%u\n",
                next.get_port_start(), next.get_port_end(), curr.protocol,
                curr.port_start, curr.port_end);
            continue;
        }
        out.emplace_back(std::move(curr));
        curr = make_entry(next);
    }
    out.emplace_back(std::move(curr));
}
}
