#include "symbols.h"
#include "oracle.h"
#include "exception.h"
#include "util.h"

namespace wxv {

namespace {

const char *addr_kind_names[] = {XM_STR_LIST(X_ADDR_KINDS)};

z3::sort make_addr_sort(Oracle& oracle, const Geometry& geom) {
    validate(geom);
    return oracle.ctx().bv_sort(geom.addr_bits);
}

}

const char *to_string(AddrKind kind) {
    return xm::name(addr_kind_names, kind);
}

void validate(const Geometry& geom) {
    if (geom.addr_bits == 0 || geom.addr_bits > 64) {
        throw configuration_error(util::format("address width %u out of range [1, 64]", geom.addr_bits));
    }
    if (geom.stages < 1) {
        throw configuration_error("at least one translation stage is required");
    }
    if (geom.page_bits > geom.addr_bits) {
        throw configuration_error(util::format("page shift %u exceeds address width %u", geom.page_bits, geom.addr_bits));
    }
}

void expect_kind(const Address& addr, AddrKind kind, const std::string& user) {
    if (addr.kind != kind) {
        throw configuration_error(util::to_string(user, ": expected ", to_string(kind), " address, got ", to_string(addr.kind)));
    }
}

SymbolModel::SymbolModel(Oracle& oracle, const Geometry& geom):
oracle(oracle), geom(geom), addr_sort_(make_addr_sort(oracle, geom)) {}

z3::context& SymbolModel::ctx() const {
    return oracle.ctx();
}

void SymbolModel::claim(const std::string& name) {
    if (!names.insert(name).second) {
        throw configuration_error(util::to_string("symbol '", name, "' declared twice"));
    }
}

Address SymbolModel::address(AddrKind kind, const std::string& name) {
    claim(name);
    trace("declare %s address %s", to_string(kind), name.c_str());
    return Address {kind, oracle.declare_symbol(name, addr_sort_)};
}

Address SymbolModel::address_val(AddrKind kind, uint64_t value) const {
    if (geom.addr_bits < 64 && (value >> geom.addr_bits) != 0) {
        throw configuration_error(util::format("address 0x%llx does not fit in %u bits", (unsigned long long) value, geom.addr_bits));
    }
    return Address {kind, ctx().bv_val(value, geom.addr_bits)};
}

z3::expr SymbolModel::bit(const std::string& name) {
    claim(name);
    return oracle.declare_symbol(name, ctx().bool_sort());
}

z3::func_decl SymbolModel::function(const std::string& name, const z3::sort& domain, const z3::sort& range) {
    claim(name);
    trace("declare function %s", name.c_str());
    return oracle.declare_function(name, domain, range);
}

z3::expr SymbolModel::page_aligned(const Address& addr) const {
    if (geom.page_bits == 0) {
        return ctx().bool_val(true);
    }
    const uint64_t mask = geom.page_bits >= 64 ? ~uint64_t(0) : (uint64_t(1) << geom.page_bits) - 1;
    const z3::expr zero = ctx().bv_val(0, geom.addr_bits);
    return (addr.expr & ctx().bv_val(mask, geom.addr_bits)) == zero;
}

}
