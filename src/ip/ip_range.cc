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
// ip_range.cc derived from sfip/sf_cidr.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "ip_range.h"

#include <cstdio>

using namespace fwcap;

const char* Ip4Cidr::ntop(char* buf, int bufsize) const
{
    IpString str;
    snprintf(buf, bufsize, "%s/%u", addr.ntop(str), (unsigned)bits);
    return buf;
}

// the widest block that starts at cur and stays inside end; masks are
// scanned widest first so the first hit is the largest block
static uint8_t widest_block(const Ip4& cur, const Ip4& end)
{
    for ( unsigned bits = 0; bits < IP4_MAX_BITS; ++bits )
    {
        if ( cur.is_aligned(bits) and cur.broadcast(bits) <= end )
            return bits;
    }
    return IP4_MAX_BITS;
}

template<typename Visitor>
static void walk_range(const Ip4& start, const Ip4& end, Visitor visit)
{
    if ( start > end )
        return;

    Ip4 cur = start;

    while ( true )
    {
        uint8_t bits = widest_block(cur, end);
        visit(cur, bits);

        Ip4 last = cur.broadcast(bits);

        if ( last >= end or last.successor(cur) != IP_SUCCESS )
            break;
    }
}

namespace fwcap
{
std::vector<Ip4Cidr> decompose_range(const Ip4& start, const Ip4& end)
{
    std::vector<Ip4Cidr> blocks;

    walk_range(start, end, [&blocks](const Ip4& addr, uint8_t bits)
        { blocks.emplace_back(addr, bits); });

    return blocks;
}

Capacity range_block_count(const Ip4& start, const Ip4& end)
{
    Capacity n = 0;

    walk_range(start, end, [&n](const Ip4&, uint8_t)
        { ++n; });

    return n;
}
}

