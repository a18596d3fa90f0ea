#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>

#include <z3++.h>

#include "xmacros.h"

namespace wxv {

class Oracle;

#define X_ADDR_KINDS(XB, XE) \
XB(va)                        \
XB(ipa)                       \
XE(pa)

XM_ENUM_CLASS(AddrKind, X_ADDR_KINDS);

const char *to_string(AddrKind kind);

struct Geometry {
    unsigned addr_bits = 32;
    unsigned stages = 1;
    unsigned page_bits = 12;
};

/// Throws configuration_error unless 1 <= addr_bits <= 64, stages >= 1 and
/// page_bits <= addr_bits.
void validate(const Geometry& geom);

/* All address kinds share one bit-vector sort; the kind tag keeps VA, IPA and PA
 * from being fed to the wrong translation stage.
 */
struct Address {
    AddrKind kind;
    z3::expr expr;

    z3::context& ctx() const { return expr.ctx(); }

    z3::expr operator==(const Address& other) const { return expr == other.expr; }
    z3::expr operator!=(const Address& other) const { return expr != other.expr; }
};

void expect_kind(const Address& addr, AddrKind kind, const std::string& user);

/* Declares the symbols of one query. Every name is declared at most once; the
 * namespace dies with the query's oracle.
 */
class SymbolModel {
public:
    SymbolModel(Oracle& oracle, const Geometry& geom);

    const Geometry& geometry() const { return geom; }
    z3::context& ctx() const;
    const z3::sort& addr_sort() const { return addr_sort_; }

    Address address(AddrKind kind, const std::string& name);
    Address address_val(AddrKind kind, uint64_t value) const;
    z3::expr bit(const std::string& name);
    z3::func_decl function(const std::string& name, const z3::sort& domain, const z3::sort& range);

    z3::expr page_aligned(const Address& addr) const;

private:
    Oracle& oracle;
    Geometry geom;
    z3::sort addr_sort_;
    std::unordered_set<std::string> names;

    void claim(const std::string& name);
};

}
