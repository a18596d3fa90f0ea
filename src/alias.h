#pragma once

#include <vector>

#include "symbols.h"
#include "translation.h"

namespace wxv {

class Query;

struct AliasPair {
    Address va1;
    Address va2;
};

/// va1 != va2 and fn(va1) == fn(va2): two entries of one table naming the same frame.
void assert_alias(Query& query, const AliasPair& pair, const Translation& fn);

inline void assert_alias(Query& query, const Address& va1, const Address& va2, const Translation& fn) {
    assert_alias(query, AliasPair {va1, va2}, fn);
}

/// Every address in vas is distinct from the others and fn sends all of them to target.
void assert_aliases(Query& query, const std::vector<Address>& vas, const Translation& fn, const Address& target);

}
