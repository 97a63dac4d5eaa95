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

#include "network_merge.h"

#include <utility>

#include "ip/ip_range.h"
#include "log/messages.h"

using namespace fwcap;

void PrefixMerger::seed(const PrefixListItem& item)
{
    items.clear();
    items.emplace_back(item);

    label = item.get_label();
    start = item.get_start();
    end = item.get_end();
    sum = item.capacity();
}

bool PrefixMerger::overlaps(const PrefixListItem& next) const
{
    // 64 bits so 255.255.255.255 has a successor
    return (uint64_t)next.get_start().get_value() <= (uint64_t)end.get_value() + 1;
}

MergeVerb PrefixMerger::add(const PrefixListItem& next)
{
    MergeVerb verb = classify_merge(
        end.get_value(), next.get_start().get_value(), next.get_end().get_value());

    append_merge_label(label, verb, next.get_label());
    items.emplace_back(next);
    sum += next.capacity();

    if ( next.get_end() > end )
        end = next.get_end();

    if ( next.get_start() < start )
        start = next.get_start();

    return verb;
}

Capacity PrefixMerger::span_capacity() const
{
    return range_block_count(start, end);
}

void PrefixMerger::close(std::vector<OptimizedPrefix>& out)
{
    if ( items.empty() )
        FatalError("prefix merge closed with no items\n");

    Capacity span = span_capacity();

    if ( items.size() > 1 and span < sum )
    {
        IpString lo, hi;
        TraceMessage("merged %zu items into %s-%s: " STDu64 " -> " STDu64 " blocks\n",
            items.size(), start.ntop(lo), end.ntop(hi), sum, span);

        OptimizedPrefix op;
        op.label = label;
        op.start = start;
        op.end = end;
        op.items = std::move(items);
        op.capacity = span;
        out.emplace_back(std::move(op));
    }
    else
    {
        if ( items.size() > 1 )
            TraceMessage("reverted merge of %zu items: " STDu64 " blocks not less than " STDu64 "\n",
                items.size(), span, sum);

        for ( const auto& item : items )
        {
            OptimizedPrefix op;
            op.label = item.get_label();
            op.start = item.get_start();
            op.end = item.get_end();
            op.items.emplace_back(item);
            op.capacity = item.capacity();
            out.emplace_back(std::move(op));
        }
    }

    items.clear();
    label.clear();
    sum = 0;
}

namespace fwcap
{
void merge_prefixes(const std::vector<PrefixListItem>& items, std::vector<OptimizedPrefix>& out)
{
    if ( items.empty() )
        return;

    PrefixMerger pm;
    pm.seed(items[0]);

    for ( size_t i = 1; i < items.size(); ++i )
    {
        if ( pm.overlaps(items[i]) )
        {
            pm.add(items[i]);
            continue;
        }
        pm.close(out);
        pm.seed(items[i]);
    }
    pm.close(out);
}
}

