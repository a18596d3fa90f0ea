#include "permission.h"
#include "query.h"
#include "util.h"

namespace wxv {

namespace {

const char *perm_bit_names[] = {XM_STR_LIST(X_PERM_BITS)};

}

const char *to_string(PermBit bit) {
    return xm::name(perm_bit_names, bit);
}

z3::expr PermissionTable::operator()(PermBit bit, const Address& addr) const {
    expect_kind(addr, kind, name);
    return fn(bit)(addr.expr);
}

std::string PermissionTable::label(PermBit bit) const {
    return util::to_string(name, "_", to_string(bit));
}

PermissionTable declare_permission_table(SymbolModel& symbols, const std::string& name, AddrKind kind) {
    const z3::sort& domain = symbols.addr_sort();
    const z3::sort range = symbols.ctx().bool_sort();
    return PermissionTable {
        name,
        kind,
        symbols.function(util::to_string(name, "_ro"), domain, range),
        symbols.function(util::to_string(name, "_nx"), domain, range),
    };
}

void assert_permission(Query& query, const PermissionTable& table, PermBit bit, const Address& addr, bool value) {
    const z3::expr entry = table(bit, addr);
    query.add(value ? entry : !entry, util::to_string(table.label(bit), "-pin"));
}

z3::expr wx_policy(const PermissionTable& table, const Address& addr) {
    return table.read_only(addr) || table.no_exec(addr);
}

}
