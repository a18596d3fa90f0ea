#include "alias.h"
#include "query.h"
#include "util.h"

namespace wxv {

void assert_alias(Query& query, const AliasPair& pair, const Translation& fn) {
    query.add(pair.va1 != pair.va2 && fn(pair.va1) == fn(pair.va2), util::to_string(fn.name, "-alias"));
}

void assert_aliases(Query& query, const std::vector<Address>& vas, const Translation& fn, const Address& target) {
    expect_kind(target, fn.range, fn.name);

    z3::expr_vector distinct {query.ctx()};
    z3::expr_vector targets {query.ctx()};
    for (const Address& va : vas) {
        distinct.push_back(va.expr);
        targets.push_back(fn(va) == target);
    }
    if (vas.size() > 1) {
        query.add(z3::distinct(distinct), util::to_string(fn.name, "-alias-distinct"));
    }
    query.add(z3::reduce_and(targets), util::to_string(fn.name, "-alias-target"));
}

}
