#pragma once

#include <string>

#include "oracle.h"

namespace wxv::testing {

/// An oracle that gives up on every query, as Z3 does when a resource limit expires.
class InconclusiveOracle: public Oracle {
public:
    Verdict check_sat() override {
        last = Verdict::unknown;
        return Verdict::unknown;
    }

    std::string reason_unknown() const override {
        return "timeout";
    }
};

}
