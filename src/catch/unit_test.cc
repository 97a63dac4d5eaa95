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
// unit_test.cc derived from catch/unit_test.cc

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "log/messages.h"
#include "main/fwcap_config.h"

using namespace fwcap;

// error counts are checked per section so each one starts from zero
struct ParseErrorReset : Catch::TestEventListenerBase
{
    using TestEventListenerBase::TestEventListenerBase;

    void sectionStarting(const Catch::SectionInfo& info) override
    {
        TestEventListenerBase::sectionStarting(info);
        reset_parse_errors();
    }
};

CATCH_REGISTER_LISTENER(ParseErrorReset)

static bool run_catch(int argc, char* argv[])
{
    Catch::Session session;

    if ( session.applyCommandLine(argc, argv) )
        return false;

    return session.run() == 0;
}

int main(int argc, char* argv[])
{
    // only the reporter writes to stdout
    FwcapConfig::set_log_quiet(true);

    if ( !run_catch(argc, argv) )
        return -1;

    return 0;
}
