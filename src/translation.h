#pragma once

#include <string>
#include <vector>

#include <z3++.h>

#include "symbols.h"

namespace wxv {

class Query;

/* One translation stage as an uninterpreted total function over the address sort.
 * Nothing about the table is fixed until a mapping is pinned, so the solver ranges
 * over every table consistent with the pinned facts.
 */
struct Translation {
    std::string name;
    AddrKind domain;
    AddrKind range;
    z3::func_decl fn;

    Address operator()(const Address& in) const;
};

Translation declare_translation(SymbolModel& symbols, const std::string& name, AddrKind domain, AddrKind range);

/// Pins fn(in) == out. Conflicting pins make the query unsat; they are not rejected here.
void assert_mapping(Query& query, const Translation& fn, const Address& in, const Address& out);

/// No two of inputs share a target under fn, encoded through an inverse function.
void assert_exclusive(Query& query, const Translation& fn, const std::vector<Address>& inputs);

}
