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

#ifndef POLICY_TEST_COMMON_H
#define POLICY_TEST_COMMON_H

// a rule listing as exported, used by the policy and command tests

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>

#include "parser/parse_utils.h"

#define RULE_TITLE "----------[ Rule: Custom_rule2 | FM-15046 ]-----------\n"

#define RULE_SRC_NETWORKS \
    "    Source Networks       : Internal (group)\n" \
    "        OBJ-192.168.100.0 (192.168.100.0/23)\n" \
    "        OBJ-10.11.0.0 (10.11.0.0/16)\n" \
    "        OBJ-172.16.17.0-200 (172.16.17.0-172.16.17.200)\n" \
    "      OBJ-192.168.101.0_24 (192.168.101.0/24)\n" \
    "      OBJ-10.10.0.0_16 (10.10.0.0/16)\n" \
    "      OBJ-172.16.17.64-255 (172.16.17.64-172.16.17.255)\n"

#define RULE_DST_NETWORKS \
    "    Destination Networks  : OBJ-10.138.0.0_16 (10.138.0.0/16)\n" \
    "        10.0.0.0/8\n" \
    "        172.16.0.0/12\n" \
    "        192.168.0.0/16        \n" \
    "      OBJ-192.168.243.0_24 (192.168.243.0/24)\n" \
    "      OBJ-10.18.46.62-69 (10.18.46.62-10.18.46.69)\n"

#define RULE_SRC_PORTS \
    "    Source Ports     : ephemeral (protocol 6, port 1024)\n" \
    "       FTP (protocol 6, port 21)\n"

#define RULE_DST_PORTS \
    "    Destination Ports  : HTTPS (protocol 6, port 443)\n" \
    "       FTP (protocol 6, port 21)\n" \
    "       SSH (protocol 6, port 22)\n"

#define RULE_END "    Logging Configuration\n"

#define FULL_RULE \
    RULE_TITLE RULE_SRC_NETWORKS RULE_DST_NETWORKS RULE_SRC_PORTS RULE_DST_PORTS RULE_END

inline TextLines make_lines(const std::string& text)
{
    std::istringstream is(text);
    TextLines lines;
    read_lines(is, lines);
    return lines;
}

// caller unlinks the returned path
inline std::string write_temp(const std::string& text)
{
    char path[] = "/tmp/fwcap_test_XXXXXX";
    int fd = mkstemp(path);

    if ( fd < 0 )
        return "";

    FILE* fh = fdopen(fd, "w");

    if ( !fh )
    {
        close(fd);
        return "";
    }
    fputs(text.c_str(), fh);
    fclose(fh);
    return path;
}

inline std::string read_all(FILE* fh)
{
    std::string s;
    char buf[256];
    size_t n;

    rewind(fh);

    while ( (n = fread(buf, 1, sizeof(buf), fh)) > 0 )
        s.append(buf, n);

    return s;
}

#endif
