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

#ifndef PARSE_NETWORK_H
#define PARSE_NETWORK_H

// build the network side of a rule from the text of one field; failures
// are reported with ParseError and return false or nullptr

#include <memory>
#include <string>

#include "network/network_object.h"
#include "parser/parse_utils.h"

namespace fwcap
{
class HostResolver;

// range, prefix or host by the characters used; false when empty or
// none of these
bool classify_prefix_item(const std::string&, PrefixItemType&);

bool parse_prefix_item(const std::string&, HostResolver&, PrefixListItem&);

// "Name (item, item, ...)" or a single bare item
bool parse_prefix_list(const std::string&, HostResolver&, PrefixList&);

// title line then one prefix list per non-empty child line
bool parse_network_group(const TextLines&, HostResolver&, NetworkGroup&);

// field lines as sliced from a rule
std::unique_ptr<NetworkObject> parse_network_object(const TextLines&, HostResolver&);
}
#endif

