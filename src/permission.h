#pragma once

#include <string>

#include <z3++.h>

#include "symbols.h"
#include "xmacros.h"

namespace wxv {

class Query;

#define X_PERM_BITS(XB, XE) \
XB(ro)                       \
XE(nx)

XM_ENUM_CLASS(PermBit, X_PERM_BITS);

const char *to_string(PermBit bit);

/* Per-page permission markers of one table, each a function from address to Bool
 * (true = bit set). Entries that are never pinned stay free.
 */
struct PermissionTable {
    std::string name;
    AddrKind kind;
    z3::func_decl ro;
    z3::func_decl nx;

    const z3::func_decl& fn(PermBit bit) const { return bit == PermBit::ro ? ro : nx; }

    z3::expr operator()(PermBit bit, const Address& addr) const;
    z3::expr read_only(const Address& addr) const { return (*this)(PermBit::ro, addr); }
    z3::expr no_exec(const Address& addr) const { return (*this)(PermBit::nx, addr); }

    std::string label(PermBit bit) const;
};

PermissionTable declare_permission_table(SymbolModel& symbols, const std::string& name, AddrKind kind);

void assert_permission(Query& query, const PermissionTable& table, PermBit bit, const Address& addr, bool value);

/// W^X for one page: it is read-only or non-executable (or both).
z3::expr wx_policy(const PermissionTable& table, const Address& addr);

}
