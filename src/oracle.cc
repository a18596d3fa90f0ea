#include <stdexcept>

#include "oracle.h"
#include "exception.h"
#include "util.h"

namespace wxv {

namespace {

const char *verdict_names[] = {XM_STR_LIST(X_VERDICTS)};

/* Runs one solver call; a Z3 failure ends the session. */
template <typename Func>
auto guarded(const char *what, Func&& func) -> decltype(func()) {
    try {
        return func();
    } catch (const z3::exception& e) {
        throw oracle_unavailable(util::to_string(what, " failed: ", e.msg()));
    }
}

}

const char *to_string(Verdict verdict) {
    return xm::name(verdict_names, verdict);
}

Oracle::Oracle(unsigned timeout_ms) {
    try {
        ctx_ = std::make_unique<z3::context>();
        solver_ = std::make_unique<z3::solver>(*ctx_);
        if (timeout_ms > 0) {
            z3::params params {*ctx_};
            params.set("timeout", timeout_ms);
            solver_->set(params);
        }
    } catch (const z3::exception& e) {
        throw oracle_unavailable(util::to_string("cannot open solver session: ", e.msg()));
    }
}

z3::expr Oracle::declare_symbol(const std::string& name, const z3::sort& sort) {
    return guarded("declare-const", [&] () {
        return ctx_->constant(name.c_str(), sort);
    });
}

z3::func_decl Oracle::declare_function(const std::string& name, const z3::sort& domain, const z3::sort& range) {
    return guarded("declare-fun", [&] () {
        return ctx_->function(name.c_str(), domain, range);
    });
}

void Oracle::add(const z3::expr& formula, const std::string& label) {
    if (last) {
        throw std::logic_error("assertion after check_sat");
    }
    guarded("assert", [&] () {
        solver_->add(formula, label.c_str());
    });
}

Verdict Oracle::check_sat() {
    const z3::check_result res = guarded("check-sat", [&] () {
        return solver_->check();
    });

    switch (res) {
        case z3::sat:   last = Verdict::sat;   break;
        case z3::unsat: last = Verdict::unsat; break;
        default:        last = Verdict::unknown; break;
    }
    return *last;
}

z3::model Oracle::get_model() const {
    if (last != Verdict::sat) {
        throw std::logic_error("model requested without a sat verdict");
    }
    return guarded("get-model", [&] () {
        return solver_->get_model();
    });
}

std::vector<std::string> Oracle::unsat_core() const {
    if (last != Verdict::unsat) {
        throw std::logic_error("unsat core requested without an unsat verdict");
    }
    return guarded("get-unsat-core", [&] () {
        std::vector<std::string> labels;
        for (const z3::expr& e : solver_->unsat_core()) {
            labels.push_back(e.decl().name().str());
        }
        return labels;
    });
}

std::string Oracle::reason_unknown() const {
    return guarded("get-info", [&] () {
        return solver_->reason_unknown();
    });
}

std::string Oracle::to_smt2() const {
    return guarded("to-smt2", [&] () {
        return solver_->to_smt2();
    });
}

}
