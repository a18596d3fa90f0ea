#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <vector>

#include "oracle.h"
#include "query.h"
#include "scenario.h"

namespace wxv {

struct Outcome {
    Check check;
    Result result;

    bool expected() const { return result.verdict == check.expected; }
};

/// Facts and geometry for a scenario as configured on the command line.
Facts configured_facts(Scenario scenario);
Geometry configured_geometry(Scenario scenario);

/// Builds and solves one check in a fresh query.
Outcome run_check(const Check& check, const Facts& facts, const Geometry& geom, std::unique_ptr<Oracle> oracle = nullptr);
Outcome run_check(const Check& check, std::unique_ptr<Oracle> oracle = nullptr);

/// Opens the oracle session of one check. An empty factory means a Z3 session.
using OracleFactory = std::function<std::unique_ptr<Oracle>()>;

/// Runs checks on up to jobs threads, one oracle session per check. Outcomes keep
/// the order of checks.
std::vector<Outcome> run_checks(const std::vector<Check>& checks, unsigned jobs, const OracleFactory& open_oracle = nullptr);

void print_outcome(std::ostream& os, const Outcome& outcome);

}
