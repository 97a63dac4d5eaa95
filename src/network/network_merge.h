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

#ifndef NETWORK_MERGE_H
#define NETWORK_MERGE_H

// the address merge engine.  items sorted by start are fed to a
// PrefixMerger which grows while the next item overlaps or adjoins the
// accumulated span.  close() keeps the merge only when the span takes
// fewer CIDR blocks than the items did; otherwise each item is emitted
// on its own.

#include <string>
#include <vector>

#include "network/prefix_item.h"
#include "utils/merge_verb.h"

namespace fwcap
{
struct OptimizedPrefix
{
    // "A ADJOINS B SHADOWS C" for a merge, the item label otherwise
    std::string label;
    Ip4 start;
    Ip4 end;
    std::vector<PrefixListItem> items;
    Capacity capacity = 0;

    bool merged() const
    { return items.size() > 1; }
};

class PrefixMerger
{
public:
    PrefixMerger() = default;

    bool empty() const
    { return items.empty(); }

    size_t size() const
    { return items.size(); }

    // clears any previous state
    void seed(const PrefixListItem&);

    // next.start is at or before the address after the span
    bool overlaps(const PrefixListItem& next) const;

    // caller checks overlaps() first
    MergeVerb add(const PrefixListItem& next);

    // sum of the accumulated items' own capacities
    Capacity item_capacity() const
    { return sum; }

    // blocks needed to express [start, end] as one span
    Capacity span_capacity() const;

    const Ip4& get_start() const
    { return start; }

    const Ip4& get_end() const
    { return end; }

    const std::string& get_label() const
    { return label; }

    // emit into out and reset; an empty merger is a fatal logic error
    void close(std::vector<OptimizedPrefix>& out);

private:
    std::string label;
    Ip4 start;
    Ip4 end;
    std::vector<PrefixListItem> items;
    Capacity sum = 0;
};

// items must already be sorted by start
void merge_prefixes(const std::vector<PrefixListItem>& items, std::vector<OptimizedPrefix>& out);
}
#endif

