#include "translation.h"
#include "query.h"
#include "util.h"

namespace wxv {

Address Translation::operator()(const Address& in) const {
    expect_kind(in, domain, name);
    return Address {range, fn(in.expr)};
}

Translation declare_translation(SymbolModel& symbols, const std::string& name, AddrKind domain, AddrKind range) {
    const z3::sort& sort = symbols.addr_sort();
    return Translation {name, domain, range, symbols.function(name, sort, sort)};
}

void assert_mapping(Query& query, const Translation& fn, const Address& in, const Address& out) {
    expect_kind(out, fn.range, fn.name);
    query.add(fn(in) == out, util::to_string(fn.name, "-map"));
}

void assert_exclusive(Query& query, const Translation& fn, const std::vector<Address>& inputs) {
    if (inputs.empty()) {
        return;
    }
    SymbolModel& symbols = query.symbols();
    const z3::sort& sort = symbols.addr_sort();
    const z3::func_decl inverse = symbols.function(fn.name + "_inv", sort, sort);

    z3::expr_vector facts {query.ctx()};
    for (const Address& in : inputs) {
        facts.push_back(inverse(fn(in).expr) == in.expr);
    }
    query.add(z3::reduce_and(facts), util::to_string(fn.name, "-exclusive"));
}

}
