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

#ifndef BUILD_H
#define BUILD_H

#define STRINGIFY_MX(s) STRINGIFY(s)
#define STRINGIFY(s) #s

#ifndef FWCAP_VERSION_MAJOR
#define FWCAP_VERSION_MAJOR 1
#endif

#ifndef FWCAP_VERSION_MINOR
#define FWCAP_VERSION_MINOR 0
#endif

#ifndef FWCAP_BUILD_NUMBER
#define FWCAP_BUILD_NUMBER 0
#endif

#define FWCAP_VERSION STRINGIFY_MX(FWCAP_VERSION_MAJOR) "." \
    STRINGIFY_MX(FWCAP_VERSION_MINOR) "." STRINGIFY_MX(FWCAP_BUILD_NUMBER)

#endif

