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

#ifndef PARSE_PROTOCOL_H
#define PARSE_PROTOCOL_H

// build the port side of a rule from the text of one field:
//
//     HTTP (protocol 6, port 80)
//     FTP (protocol 6, port 20-21)
//     ICMP (protocol 1, type 3, code 4)
//     IGMP (protocol 2)
//     protocol 17, port 53
//
// failures are reported with ParseError and return false or nullptr

#include <memory>
#include <string>

#include "parser/parse_utils.h"
#include "protocol/protocol_object.h"

namespace fwcap
{
// one item; "protocol any" is not accepted here
bool parse_protocol_item(const std::string&, ProtocolListItem&);

// one line; "protocol any, port X" gives a tcp and a udp item
bool parse_protocol_list(const std::string&, ProtocolList&);

bool parse_protocol_group(const TextLines&, ProtocolGroup&);

std::unique_ptr<ProtocolObject> parse_protocol_object(const TextLines&);
}
#endif

