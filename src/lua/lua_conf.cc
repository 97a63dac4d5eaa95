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

#include "lua_conf.h"

#include <lua.hpp>

#include <cstring>

#include "ip/ip_addr.h"
#include "log/messages.h"
#include "main/fwcap_config.h"

using namespace fwcap;

#define CONF_TABLE "fwcap"

static const char* const conf_keys[] =
{ "file", "top", "quiet", "verbose", "hosts", nullptr };

enum FieldStatus
{
    FIELD_ABSENT,
    FIELD_SET,
    FIELD_BAD
};

//-------------------------------------------------------------------------
// one interpreter per conf chunk
//-------------------------------------------------------------------------

class ConfState
{
public:
    ConfState()
    {
        L = luaL_newstate();

        if ( !L )
            FatalError("Lua state instantiation failed\n");

        luaL_openlibs(L);
    }

    ~ConfState()
    { lua_close(L); }

    ConfState(const ConfState&) = delete;
    ConfState& operator=(const ConfState&) = delete;

    // status is the luaL_load* result; the chunk runs when it loaded
    bool run(int status, const char* name);

    lua_State* get()
    { return L; }

private:
    lua_State* L;
};

bool ConfState::run(int status, const char* name)
{
    if ( !status )
        status = lua_pcall(L, 0, 0, 0);

    if ( status )
    {
        const char* err = lua_tostring(L, -1);
        ParseError("can't load %s: %s", name, err ? err : "unknown error");
        lua_pop(L, 1);
        return false;
    }
    return true;
}

//-------------------------------------------------------------------------
// typed reads from the fwcap table; each leaves the stack as it was
//-------------------------------------------------------------------------

class ConfTable
{
public:
    ConfTable(lua_State* s, int t) : L(s), index(t) { }

    FieldStatus get_string(const char* key, std::string&);

    // whole number 1 or more
    FieldStatus get_count(const char* key, unsigned&);

    FieldStatus get_flag(const char* key, bool&);

    void check_keys();

private:
    // pushes the field; false when it is nil
    bool push(const char* key)
    {
        lua_getfield(L, index, key);

        if ( !lua_isnil(L, -1) )
            return true;

        lua_pop(L, 1);
        return false;
    }

    lua_State* L;
    int index;
};

FieldStatus ConfTable::get_string(const char* key, std::string& s)
{
    if ( !push(key) )
        return FIELD_ABSENT;

    FieldStatus fs = FIELD_BAD;

    // lua_tolstring would turn a number into a string
    if ( lua_type(L, -1) == LUA_TSTRING )
    {
        size_t len = 0;
        const char* str = lua_tolstring(L, -1, &len);
        s.assign(str, len);
        fs = FIELD_SET;
    }
    lua_pop(L, 1);
    return fs;
}

FieldStatus ConfTable::get_count(const char* key, unsigned& n)
{
    if ( !push(key) )
        return FIELD_ABSENT;

    FieldStatus fs = FIELD_BAD;

    if ( lua_type(L, -1) == LUA_TNUMBER )
    {
        lua_Number d = lua_tonumber(L, -1);

        if ( d >= 1 and d <= 0xffffffff and (lua_Number)(lua_Integer)d == d )
        {
            n = (unsigned)d;
            fs = FIELD_SET;
        }
    }
    lua_pop(L, 1);
    return fs;
}

FieldStatus ConfTable::get_flag(const char* key, bool& b)
{
    if ( !push(key) )
        return FIELD_ABSENT;

    FieldStatus fs = FIELD_BAD;

    if ( lua_type(L, -1) == LUA_TBOOLEAN )
    {
        b = lua_toboolean(L, -1);
        fs = FIELD_SET;
    }
    lua_pop(L, 1);
    return fs;
}

static bool is_conf_key(const char* k)
{
    for ( const char* const* p = conf_keys; *p; ++p )
    {
        if ( !strcmp(*p, k) )
            return true;
    }
    return false;
}

void ConfTable::check_keys()
{
    lua_pushnil(L);

    while ( lua_next(L, index) )
    {
        // lua_tostring would convert a numeric key in place and break lua_next
        if ( lua_type(L, -2) != LUA_TSTRING )
            ParseWarning(WARN_CONF, "ignoring non-string key in " CONF_TABLE);

        else if ( !is_conf_key(lua_tostring(L, -2)) )
            ParseWarning(WARN_CONF, "unknown key " CONF_TABLE ".%s", lua_tostring(L, -2));

        lua_pop(L, 1);
    }
}

//-------------------------------------------------------------------------
// conf fields
//-------------------------------------------------------------------------

static bool get_hosts(lua_State* L, int t, FwcapConfig& fc)
{
    lua_getfield(L, t, "hosts");

    if ( lua_isnil(L, -1) )
    {
        lua_pop(L, 1);
        return true;
    }

    if ( !lua_istable(L, -1) )
    {
        ParseError(CONF_TABLE ".hosts must be a table of name = 'a.b.c.d'");
        lua_pop(L, 1);
        return false;
    }

    int h = lua_gettop(L);
    bool ok = true;
    lua_pushnil(L);

    while ( lua_next(L, h) )
    {
        if ( lua_type(L, -2) != LUA_TSTRING or lua_type(L, -1) != LUA_TSTRING )
        {
            ParseError(CONF_TABLE ".hosts entries must be name = 'a.b.c.d'");
            ok = false;
        }
        else
        {
            const char* name = lua_tostring(L, -2);
            const char* addr = lua_tostring(L, -1);
            Ip4 ip;

            if ( ip.set(addr) != IP_SUCCESS )
            {
                ParseError(CONF_TABLE ".hosts['%s'] = '%s' is not an IPv4 address", name, addr);
                ok = false;
            }
            else
                fc.hosts.emplace_back(name, addr);
        }
        lua_pop(L, 1);
    }
    lua_pop(L, 1);
    return ok;
}

static bool get_flags(ConfTable& table)
{
    bool ok = true;
    bool flag;

    switch ( table.get_flag("quiet", flag) )
    {
    case FIELD_SET:
        FwcapConfig::set_log_quiet(flag);
        break;
    case FIELD_BAD:
        ParseError(CONF_TABLE ".quiet must be a boolean");
        ok = false;
        break;
    case FIELD_ABSENT:
        break;
    }

    switch ( table.get_flag("verbose", flag) )
    {
    case FIELD_SET:
        FwcapConfig::set_log_verbose(flag);
        break;
    case FIELD_BAD:
        ParseError(CONF_TABLE ".verbose must be a boolean");
        ok = false;
        break;
    case FIELD_ABSENT:
        break;
    }
    return ok;
}

static bool get_conf(lua_State* L, const char* name, FwcapConfig& fc)
{
    if ( !lua_checkstack(L, 4) )
        FatalError("Lua stack can't grow by %d\n", 4);

    int top = lua_gettop(L);
    lua_getglobal(L, CONF_TABLE);

    if ( lua_isnil(L, -1) )
    {
        ParseWarning(WARN_CONF, "%s does not set " CONF_TABLE, name);
        lua_settop(L, top);
        return true;
    }

    if ( !lua_istable(L, -1) )
    {
        ParseError("%s: " CONF_TABLE " must be a table", name);
        lua_settop(L, top);
        return false;
    }

    int t = lua_gettop(L);
    ConfTable table(L, t);
    bool ok = true;

    table.check_keys();

    if ( table.get_string("file", fc.policy_file) == FIELD_BAD )
    {
        ParseError(CONF_TABLE ".file must be a string");
        ok = false;
    }

    if ( table.get_count("top", fc.top_k) == FIELD_BAD )
    {
        ParseError(CONF_TABLE ".top must be an integer 1 or more");
        ok = false;
    }

    if ( !get_flags(table) )
        ok = false;

    if ( !get_hosts(L, t, fc) )
        ok = false;

    lua_settop(L, top);
    return ok;
}

namespace fwcap
{
bool load_lua_conf(const char* path, FwcapConfig& fc)
{
    ConfState cs;
    TraceMessage("Loading lua conf %s\n", path);

    if ( !cs.run(luaL_loadfile(cs.get(), path), path) )
        return false;

    return get_conf(cs.get(), path, fc);
}

bool load_lua_string(const std::string& chunk, const char* name, FwcapConfig& fc)
{
    ConfState cs;

    if ( !cs.run(luaL_loadbuffer(cs.get(), chunk.c_str(), chunk.size(), name), name) )
        return false;

    return get_conf(cs.get(), name, fc);
}
}
