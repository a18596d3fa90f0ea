#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include <z3++.h>

#include "oracle.h"
#include "symbols.h"
#include "xmacros.h"

namespace wxv {

#define X_QUERY_STATES(XB, XE) \
XB(idle)                        \
XB(building)                    \
XB(asserted)                    \
XB(solved)                      \
XE(done)

XM_ENUM_CLASS(QueryState, X_QUERY_STATES);

const char *to_string(QueryState state);

/// Concrete values of the watched terms in a satisfying model.
struct Witness {
    struct Entry {
        std::string name;
        bool is_bit;
        uint64_t value;
    };
    std::vector<Entry> entries;

    const Entry *find(const std::string& name) const;
    std::optional<uint64_t> address(const std::string& name) const;
    std::optional<bool> bit(const std::string& name) const;

    bool empty() const { return entries.empty(); }
    void print(std::ostream& os) const;
};

struct Result {
    Verdict verdict;
    Witness witness;                 // sat
    std::vector<std::string> core;   // unsat
    std::string reason;              // unknown
};

/* One formula, solved once. Constraints are only accepted before solve(); the
 * oracle session (and with it every symbol) is discarded with the query.
 */
class Query {
public:
    explicit Query(const Geometry& geom, std::unique_ptr<Oracle> oracle = nullptr);

    Query(const Query&) = delete;
    Query& operator=(const Query&) = delete;

    SymbolModel& symbols() { return symbols_; }
    const SymbolModel& symbols() const { return symbols_; }
    z3::context& ctx() const { return oracle_->ctx(); }
    QueryState state() const { return state_; }

    /// Adds fact to the conjunction. Labels are made unique by suffixing.
    void add(const z3::expr& fact, const std::string& label);

    /// Registers a term to be evaluated into the witness on sat.
    void watch(const std::string& name, const z3::expr& term);
    void watch(const std::string& name, const Address& addr) { watch(name, addr.expr); }

    Result solve();

    void dump(std::ostream& os) const;

private:
    std::unique_ptr<Oracle> oracle_;
    SymbolModel symbols_;
    QueryState state_ = QueryState::idle;
    std::vector<std::pair<std::string, z3::expr>> watches;
    std::unordered_map<std::string, unsigned> labels;

    void transition(QueryState to);
    Witness extract_witness() const;
};

}
