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

#ifndef REPORT_H
#define REPORT_H

// text reports for the get commands
//
// Rule name: <name>
//      capacity:           <n>
//      optimized capacity: <m>
//      optimization ratio: <r>%

#include <cstdio>

#include "main/fwcap_types.h"

namespace fwcap
{
class AccessPolicy;
class Rule;

// 100 - opt / raw * 100; 0 when raw is 0
double optimization_ratio(Capacity raw, Capacity opt);

void report_rule_capacity(FILE*, const Rule&);

// the capacity report followed by the optimized entries of each field
void report_rule_analysis(FILE*, const Rule&);

void report_policy_capacity(FILE*, const AccessPolicy&);
}
#endif

