#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "compose.h"
#include "oracle.h"
#include "permission.h"
#include "symbols.h"
#include "xmacros.h"

namespace wxv {

class Query;

#define X_SCENARIOS(XB, XE) \
XB(basic_paging)             \
XB(aliasing)                 \
XB(single_level_wx)          \
XE(nested_wxvisor)

XM_ENUM_CLASS(Scenario, X_SCENARIOS);

/* Witness goals (mapping .. executable) ask whether a valid configuration exists:
 * sat is the good answer. The rest negate a safety property: sat means the
 * solver found a counterexample page-table state.
 */
#define X_GOALS(XB, XE)       \
XB(mapping)                    \
XB(alias_mapping)              \
XB(readable)                   \
XB(writable)                   \
XB(executable)                 \
XB(writable_and_executable)    \
XB(write_despite_ro)           \
XB(execute_despite_nx)         \
XB(stage_override)             \
XB(alias_write_mismatch)       \
XB(alias_execute_mismatch)     \
XE(stage2_alias)

XM_ENUM_CLASS(Goal, X_GOALS);

const char *to_string(Scenario scenario);
const char *to_string(Goal goal);

/// Accepts a scenario name or its number (1-4).
Scenario parse_scenario(const std::string& s);
Goal parse_goal(const std::string& s);

std::vector<Scenario> all_scenarios();

bool is_violation(Goal goal);

/// Concrete pins and policy switches for one theory. Unset pins stay symbolic.
struct Facts {
    std::optional<uint64_t> va;
    std::optional<uint64_t> ipa;
    std::optional<uint64_t> pa;
    unsigned aliases = 0;
    std::vector<uint64_t> alias_pins;

    /* first-stage bits of va, last-stage bits of its last intermediate address */
    std::optional<bool> ro;
    std::optional<bool> nx;
    std::optional<bool> ro2;
    std::optional<bool> nx2;

    bool enforce_wx = true;
    bool bind_frames = true;
    bool exclusive_frames = true;
};

Facts default_facts(Scenario scenario);

Geometry scenario_geometry(Scenario scenario, unsigned addr_bits, unsigned page_bits, unsigned nested_stages);

/* The background theory of a scenario asserted into a query: levels va -> ... -> pa,
 * one translation and one page table per stage, the physical frame table, aliases,
 * and the scenario's policy. Goals are posed on top; seal() adds the constraints that
 * range over every address the goals introduced.
 */
class Theory {
public:
    Theory(Query& query, Scenario scenario, const Facts& facts);

    Scenario scenario() const { return scenario_; }
    const TranslationPath& path() const { return path_; }
    const PermissionTable& phy() const { return phy_; }

    const std::vector<Address>& levels() const { return levels_; }
    const Address& va() const { return levels_.front(); }
    const Address& pa() const { return levels_.back(); }
    const std::vector<Address>& aliases() const { return aliases_; }

    void pose(Goal goal);
    void seal();

private:
    Query& query;
    Scenario scenario_;
    Facts facts;
    PermissionTable phy_;
    TranslationPath path_;
    std::vector<Address> levels_;
    std::vector<std::string> level_names;
    std::vector<Address> aliases_;
    std::vector<std::vector<Address>> exclusive;
    bool sealed = false;

    void check_facts() const;
    void declare_levels();
    void assert_pins();
    void assert_policy();
    void require_aliases(Goal goal) const;
    void require_stages(Goal goal) const;
    void watch();
};

struct Check {
    Scenario scenario;
    Goal goal;
    Verdict expected;
};

Verdict expected_verdict(Scenario scenario, Goal goal);

std::vector<Check> default_checks(Scenario scenario);

}
