#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

#include "verify.h"
#include "config.h"
#include "util.h"

namespace wxv {

Facts configured_facts(Scenario scenario) {
    Facts facts = default_facts(scenario);
    if (conf::va) {
        facts.va = conf::va;
    } else if (conf::addr_bits >= 64 || (conf::default_va >> conf::addr_bits) == 0) {
        facts.va = conf::default_va;
    }
    facts.alias_pins = conf::aliases;
    if (facts.aliases < facts.alias_pins.size()) {
        facts.aliases = static_cast<unsigned>(facts.alias_pins.size());
    }
    return facts;
}

Geometry configured_geometry(Scenario scenario) {
    return scenario_geometry(scenario, conf::addr_bits, conf::page_bits, conf::nested_stages);
}

Outcome run_check(const Check& check, const Facts& facts, const Geometry& geom, std::unique_ptr<Oracle> oracle) {
    trace("check %s/%s", to_string(check.scenario), to_string(check.goal));

    Query query {geom, std::move(oracle)};
    Theory theory {query, check.scenario, facts};
    theory.pose(check.goal);
    theory.seal();

    if (conf::dump) {
        std::cerr << "; " << to_string(check.scenario) << "/" << to_string(check.goal) << "\n";
        query.dump(std::cerr);
    }

    Outcome outcome {check, query.solve()};
    if (!outcome.expected()) {
        report("%s/%s: %s, expected %s", to_string(check.scenario), to_string(check.goal),
               to_string(outcome.result.verdict), to_string(check.expected));
    }
    return outcome;
}

Outcome run_check(const Check& check, std::unique_ptr<Oracle> oracle) {
    return run_check(check, configured_facts(check.scenario), configured_geometry(check.scenario), std::move(oracle));
}

std::vector<Outcome> run_checks(const std::vector<Check>& checks, unsigned jobs, const OracleFactory& open_oracle) {
    std::vector<std::optional<Outcome>> slots(checks.size());
    std::atomic<std::size_t> next {0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    const auto worker = [&] () {
        std::size_t i;
        while ((i = next++) < checks.size()) {
            try {
                slots[i] = run_check(checks[i], open_oracle ? open_oracle() : nullptr);
            } catch (...) {
                /* rethrown on the calling thread below */
                const std::lock_guard<std::mutex> lock {failure_mutex};
                if (!failure) {
                    failure = std::current_exception();
                }
                next = checks.size();
                return;
            }
        }
    };

    if (jobs <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        for (unsigned j = 0; j < jobs && j < checks.size(); ++j) {
            threads.emplace_back(worker);
        }
        for (std::thread& thread : threads) {
            thread.join();
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }

    std::vector<Outcome> outcomes;
    for (auto& slot : slots) {
        outcomes.push_back(std::move(*slot));
    }
    return outcomes;
}

void print_outcome(std::ostream& os, const Outcome& outcome) {
    const Check& check = outcome.check;
    const Result& result = outcome.result;
    const bool violation = is_violation(check.goal);

    os << "== " << to_string(check.scenario) << ": " << to_string(check.goal)
       << (violation ? " (violation query)" : " (witness query)") << "\n";
    os << result.verdict << "\n";

    switch (result.verdict) {
        case Verdict::sat:
            os << (violation ? "  counterexample:\n" : "  configuration:\n");
            result.witness.print(os);
            break;
        case Verdict::unsat:
            os << (violation ? "  property holds\n" : "  no configuration satisfies the theory\n");
            if (!result.core.empty()) {
                os << "  core:";
                for (const std::string& label : result.core) {
                    os << " " << label;
                }
                os << "\n";
            }
            break;
        case Verdict::unknown:
            os << "  inconclusive: " << result.reason << "\n";
            break;
    }

    if (!outcome.expected()) {
        os << "  note: expected " << check.expected << "\n";
    }
}

}
