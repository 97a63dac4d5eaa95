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
// ip_range.h derived from sfip/sf_cidr.h

#ifndef IP_RANGE_H
#define IP_RANGE_H

#include <vector>

#include "ip/ip_addr.h"

namespace fwcap
{
struct Ip4Cidr
{
    Ip4Cidr() = default;
    Ip4Cidr(const Ip4& a, uint8_t b) : addr(a), bits(b) { }

    const Ip4& get_addr() const
    { return addr; }

    uint8_t get_bits() const
    { return bits; }

    Ip4 last() const
    { return addr.broadcast(bits); }

    // a.b.c.d/n
    const char* ntop(char* buf, int bufsize) const;

private:
    Ip4 addr;
    uint8_t bits = IP4_MAX_BITS;
};

// split [start, end] into the fewest aligned CIDR blocks, lowest first;
// nothing is returned when start > end
std::vector<Ip4Cidr> decompose_range(const Ip4& start, const Ip4& end);

// same count as decompose_range(start, end).size() without the vector
Capacity range_block_count(const Ip4& start, const Ip4& end);
}
#endif

