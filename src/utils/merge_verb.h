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

#ifndef MERGE_VERB_H
#define MERGE_VERB_H

// how the next range relates to the accumulated one when two sorted
// ranges are merged; shared by the address and port merge engines

#include <cstdint>
#include <string>

namespace fwcap
{
enum MergeVerb
{
    MERGE_ADJOINS,
    MERGE_SHADOWS,
    MERGE_PARTIALLY_OVERLAPS
};

// callers only ask once next_start <= curr_end + 1
MergeVerb classify_merge(uint64_t curr_end, uint64_t next_start, uint64_t next_end);

const char* merge_verb_str(MergeVerb);

// "<label> VERB <next>"
void append_merge_label(std::string& label, MergeVerb, const std::string& next);
}
#endif

