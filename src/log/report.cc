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

#include "report.h"

#include "policy/access_policy.h"

using namespace fwcap;

static void report_networks(FILE* fh, const char* title, const NetworkObject* no)
{
    if ( !no )
    {
        fprintf(fh, "\t %s: any\n", title);
        return;
    }

    NetworkObjectOptimized opt = no->optimize();

    fprintf(fh, "\t %s: %s (" STDu64 " -> " STDu64 ")\n", title, no->label.c_str(),
        no->capacity(), opt.capacity());

    for ( const auto& op : opt.prefixes )
    {
        IpString lo, hi;
        fprintf(fh, "\t\t %s [%s-%s] capacity " STDu64 "\n", op.label.c_str(),
            op.start.ntop(lo), op.end.ntop(hi), op.capacity);
    }
}

static void report_protocols(FILE* fh, const char* title, const ProtocolObject* po)
{
    if ( !po )
    {
        fprintf(fh, "\t %s: any\n", title);
        return;
    }

    std::vector<OptimizedProtocol> opt = po->optimize();

    fprintf(fh, "\t %s: %s (%u -> %zu)\n", title, po->label.c_str(),
        po->item_count(), opt.size());

    for ( const auto& op : opt )
        fprintf(fh, "\t\t %s\n", op.to_string().c_str());
}

namespace fwcap
{
double optimization_ratio(Capacity raw, Capacity opt)
{
    if ( !raw )
        return 0.0;

    return 100.0 - ((double)opt / (double)raw) * 100.0;
}

void report_rule_capacity(FILE* fh, const Rule& r)
{
    Capacity raw = r.capacity();
    Capacity opt = r.optimized_capacity();

    fprintf(fh, "Rule name: %s\n", r.get_label().c_str());
    fprintf(fh, "\t capacity:           " STDu64 "\n", raw);
    fprintf(fh, "\t optimized capacity: " STDu64 "\n", opt);
    fprintf(fh, "\t optimization ratio: %.2f%%\n", optimization_ratio(raw, opt));
}

void report_rule_analysis(FILE* fh, const Rule& r)
{
    report_rule_capacity(fh, r);

    report_networks(fh, "source networks", r.get_networks(RD_SRC));
    report_networks(fh, "destination networks", r.get_networks(RD_DST));

    report_protocols(fh, "source ports", r.get_protocols(RD_SRC));
    report_protocols(fh, "destination ports", r.get_protocols(RD_DST));

    fprintf(fh, "\t protocol factor: " STDu64 "\n", r.protocol_factor());
}

void report_policy_capacity(FILE* fh, const AccessPolicy& acp)
{
    Capacity raw = acp.capacity();
    Capacity opt = acp.optimized_capacity();

    fprintf(fh, "# of rules found: %u\n", acp.rule_count());
    fprintf(fh, "policy capacity: " STDu64 "\n", raw);
    fprintf(fh, "policy optimized capacity: " STDu64 "\n", opt);
    fprintf(fh, "policy optimization ratio: %.2f%%\n", optimization_ratio(raw, opt));
}
}
