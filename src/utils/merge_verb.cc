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

#include "merge_verb.h"

namespace fwcap
{
MergeVerb classify_merge(uint64_t curr_end, uint64_t next_start, uint64_t next_end)
{
    if ( curr_end + 1 == next_start )
        return MERGE_ADJOINS;

    if ( next_end <= curr_end )
        return MERGE_SHADOWS;

    return MERGE_PARTIALLY_OVERLAPS;
}

const char* merge_verb_str(MergeVerb v)
{
    switch ( v )
    {
    case MERGE_ADJOINS:
        return "ADJOINS";
    case MERGE_SHADOWS:
        return "SHADOWS";
    case MERGE_PARTIALLY_OVERLAPS:
        return "PARTIALLY OVERLAPS";
    }
    return "?";
}

void append_merge_label(std::string& label, MergeVerb v, const std::string& next)
{
    label += " ";
    label += merge_verb_str(v);
    label += " ";
    label += next;
}
}

