#include <algorithm>
#include <stdexcept>

#include "query.h"
#include "config.h"
#include "exception.h"
#include "util.h"

namespace wxv {

namespace {

const char *query_state_names[] = {XM_STR_LIST(X_QUERY_STATES)};

std::unique_ptr<Oracle> open_oracle(const Geometry& geom, std::unique_ptr<Oracle> oracle) {
    validate(geom);
    if (oracle) {
        return oracle;
    }
    return std::make_unique<Oracle>(conf::timeout_ms);
}

}

const char *to_string(QueryState state) {
    return xm::name(query_state_names, state);
}

const Witness::Entry *Witness::find(const std::string& name) const {
    const auto it = std::find_if(entries.begin(), entries.end(), [&] (const Entry& entry) {
        return entry.name == name;
    });
    return it == entries.end() ? nullptr : &*it;
}

std::optional<uint64_t> Witness::address(const std::string& name) const {
    const Entry *entry = find(name);
    if (entry == nullptr || entry->is_bit) {
        return std::nullopt;
    }
    return entry->value;
}

std::optional<bool> Witness::bit(const std::string& name) const {
    const Entry *entry = find(name);
    if (entry == nullptr || !entry->is_bit) {
        return std::nullopt;
    }
    return entry->value != 0;
}

void Witness::print(std::ostream& os) const {
    for (const Entry& entry : entries) {
        os << "  " << entry.name << " = ";
        if (entry.is_bit) {
            os << entry.value;
        } else {
            os << util::hex(entry.value);
        }
        os << "\n";
    }
}

Query::Query(const Geometry& geom, std::unique_ptr<Oracle> oracle):
oracle_(open_oracle(geom, std::move(oracle))), symbols_(*oracle_, geom) {}

void Query::transition(QueryState to) {
    trace("query %s -> %s", to_string(state_), to_string(to));
    state_ = to;
}

void Query::add(const z3::expr& fact, const std::string& label) {
    switch (state_) {
        case QueryState::idle:
            transition(QueryState::building);
            break;
        case QueryState::building:
            break;
        default:
            throw std::logic_error(util::to_string("constraint '", label, "' added to a ", to_string(state_), " query"));
    }

    unsigned& count = labels[label];
    const std::string unique = count == 0 ? label : util::to_string(label, "#", count);
    ++count;
    oracle_->add(fact, unique);
}

void Query::watch(const std::string& name, const z3::expr& term) {
    watches.emplace_back(name, term);
}

Result Query::solve() {
    if (state_ != QueryState::idle && state_ != QueryState::building) {
        throw std::logic_error(util::to_string("solve() on a ", to_string(state_), " query"));
    }
    transition(QueryState::asserted);

    Result res;
    res.verdict = oracle_->check_sat();
    transition(QueryState::solved);

    switch (res.verdict) {
        case Verdict::sat:
            res.witness = extract_witness();
            break;
        case Verdict::unsat:
            res.core = oracle_->unsat_core();
            break;
        case Verdict::unknown:
            res.reason = oracle_->reason_unknown();
            break;
    }

    transition(QueryState::done);
    return res;
}

Witness Query::extract_witness() const {
    const z3::eval eval {oracle_->get_model()};
    Witness witness;
    for (const auto& [name, term] : watches) {
        try {
            const z3::expr value = eval(term);
            if (value.is_bool()) {
                witness.entries.push_back(Witness::Entry {name, true, value.is_true() ? 1u : 0u});
            } else {
                witness.entries.push_back(Witness::Entry {name, false, value.get_numeral_uint64()});
            }
        } catch (const z3::exception& e) {
            throw oracle_unavailable(util::to_string("cannot evaluate ", name, ": ", e.msg()));
        }
    }
    return witness;
}

void Query::dump(std::ostream& os) const {
    os << oracle_->to_smt2();
}

}
