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

#ifndef PROTOCOL_MERGE_H
#define PROTOCOL_MERGE_H

// l3 items (no ports) are deduplicated on protocol, type and code.  l4
// items sorted by protocol and first port are merged per protocol while
// the next range overlaps or adjoins; a port merge is always kept.

#include <string>
#include <vector>

#include "protocol/protocol_item.h"

namespace fwcap
{
struct OptimizedProtocol
{
    // "A ADJOINS B" for a merge, the item label otherwise
    std::string label;
    uint8_t protocol = 0;
    Port port_start = 0;
    Port port_end = 0;
    bool l4 = false;

    // first item seen, describes l3 entries
    ProtocolListItem first;
    unsigned count = 0;

    bool merged() const
    { return count > 1; }

    // "label (protocol 6, port 80-82)"
    std::string to_string() const;
};

// keeps the first of each distinct (protocol, type, code) in input order
void unique_l3(const std::vector<ProtocolListItem>&, std::vector<OptimizedProtocol>& out);

// non-l4 items are ignored
void merge_l4(const std::vector<ProtocolListItem>&, std::vector<OptimizedProtocol>& out);
}
#endif

