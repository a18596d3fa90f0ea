#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <z3++.h>

#include "xmacros.h"

namespace wxv {

#define X_VERDICTS(XB, XE) \
XB(sat)                     \
XB(unsat)                   \
XE(unknown)

XM_ENUM_CLASS(Verdict, X_VERDICTS);

const char *to_string(Verdict verdict);

inline std::ostream& operator<<(std::ostream& os, Verdict verdict) {
    return os << to_string(verdict);
}

/* The only solver surface the encoders rely on. One Oracle is one Z3 session; it is
 * never shared between queries.
 */
class Oracle {
public:
    explicit Oracle(unsigned timeout_ms = 0);
    virtual ~Oracle() = default;

    Oracle(const Oracle&) = delete;
    Oracle& operator=(const Oracle&) = delete;

    z3::context& ctx() const { return *ctx_; }

    z3::expr declare_symbol(const std::string& name, const z3::sort& sort);
    z3::func_decl declare_function(const std::string& name, const z3::sort& domain, const z3::sort& range);

    /// Asserts formula, tracked under label for unsat cores.
    void add(const z3::expr& formula, const std::string& label);

    virtual Verdict check_sat();

    /// Valid only after check_sat() returned sat.
    z3::model get_model() const;

    std::vector<std::string> unsat_core() const;
    virtual std::string reason_unknown() const;

    std::string to_smt2() const;

protected:
    std::unique_ptr<z3::context> ctx_;
    std::unique_ptr<z3::solver> solver_;
    std::optional<Verdict> last;
};

}
