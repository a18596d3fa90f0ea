#include <stdexcept>

#include "scenario.h"
#include "alias.h"
#include "exception.h"
#include "query.h"
#include "translation.h"
#include "util.h"

namespace wxv {

namespace {

const char *scenario_names[] = {XM_STR_LIST(X_SCENARIOS)};
const char *goal_names[] = {XM_STR_LIST(X_GOALS)};

Scenario check_stages(Scenario scenario, const Geometry& geom) {
    if (scenario == Scenario::nested_wxvisor) {
        if (geom.stages < 2) {
            throw configuration_error(util::format("%s needs at least 2 stages, got %u", to_string(scenario), geom.stages));
        }
    } else if (geom.stages != 1) {
        throw configuration_error(util::format("%s is a single-stage theory, got %u stages", to_string(scenario), geom.stages));
    }
    return scenario;
}

std::string level_name(unsigned i, unsigned stages) {
    if (i == 0) {
        return "va";
    } else if (i == stages) {
        return "pa";
    } else if (stages == 2) {
        return "ipa";
    } else {
        return util::to_string("ipa", i);
    }
}

}

const char *to_string(Scenario scenario) {
    return xm::name(scenario_names, scenario);
}

const char *to_string(Goal goal) {
    return xm::name(goal_names, goal);
}

Scenario parse_scenario(const std::string& s) {
    if (const auto scenario = xm::lookup<Scenario>(scenario_names, s.c_str())) {
        return *scenario;
    }
    if (s.size() == 1 && s[0] >= '1' && s[0] < '1' + XM_SIZE(X_SCENARIOS)) {
        return static_cast<Scenario>(s[0] - '1');
    }
    throw configuration_error(util::to_string("unknown scenario '", s, "'"));
}

Goal parse_goal(const std::string& s) {
    if (const auto goal = xm::lookup<Goal>(goal_names, s.c_str())) {
        return *goal;
    }
    throw configuration_error(util::to_string("unknown goal '", s, "'"));
}

std::vector<Scenario> all_scenarios() {
    std::vector<Scenario> scenarios;
    for (unsigned i = 0; i < XM_SIZE(X_SCENARIOS); ++i) {
        scenarios.push_back(static_cast<Scenario>(i));
    }
    return scenarios;
}

bool is_violation(Goal goal) {
    switch (goal) {
        case Goal::mapping:
        case Goal::alias_mapping:
        case Goal::readable:
        case Goal::writable:
        case Goal::executable:
            return false;
        default:
            return true;
    }
}

Facts default_facts(Scenario scenario) {
    Facts facts;
    switch (scenario) {
        case Scenario::aliasing:
        case Scenario::nested_wxvisor:
            facts.aliases = 2;
            break;
        default:
            break;
    }
    return facts;
}

Geometry scenario_geometry(Scenario scenario, unsigned addr_bits, unsigned page_bits, unsigned nested_stages) {
    Geometry geom;
    geom.addr_bits = addr_bits;
    geom.page_bits = page_bits;
    geom.stages = scenario == Scenario::nested_wxvisor ? nested_stages : 1;
    return geom;
}

Theory::Theory(Query& query, Scenario scenario, const Facts& facts):
query(query),
scenario_(check_stages(scenario, query.symbols().geometry())),
facts(facts),
phy_(declare_permission_table(query.symbols(), "phy", AddrKind::pa)) {
    check_facts();
    declare_levels();
    assert_pins();

    if (facts.bind_frames) {
        query.add(path_.frame_consistent(phy_, va()), "frame-va");
        for (const Address& alias : aliases_) {
            query.add(path_.frame_consistent(phy_, alias), "frame-alias");
        }
    }

    if (facts.enforce_wx) {
        assert_policy();
    }
}

void Theory::check_facts() const {
    const SymbolModel& symbols = query.symbols();
    if (facts.alias_pins.size() > facts.aliases) {
        throw configuration_error(util::format("%zu alias pins for %u aliases", facts.alias_pins.size(), facts.aliases));
    }
    if (symbols.geometry().stages < 2 && (facts.ipa || facts.ro2 || facts.nx2)) {
        throw configuration_error("intermediate address or last-stage bits pinned in a single-stage theory");
    }

    /* address_val rejects pins wider than the address sort */
    for (const auto& pin : {facts.va, facts.ipa, facts.pa}) {
        if (pin) {
            symbols.address_val(AddrKind::va, *pin);
        }
    }
    for (const uint64_t pin : facts.alias_pins) {
        symbols.address_val(AddrKind::va, pin);
    }
}

void Theory::declare_levels() {
    SymbolModel& symbols = query.symbols();
    const unsigned stages = symbols.geometry().stages;

    for (unsigned i = 0; i <= stages; ++i) {
        const AddrKind kind = i == 0 ? AddrKind::va : (i == stages ? AddrKind::pa : AddrKind::ipa);
        level_names.push_back(level_name(i, stages));
        levels_.push_back(symbols.address(kind, level_names.back()));
    }

    exclusive.resize(stages);
    for (unsigned i = 0; i < stages; ++i) {
        const Translation mmu = declare_translation(symbols, util::to_string("mmu", i + 1), levels_[i].kind, levels_[i + 1].kind);
        const PermissionTable table = declare_permission_table(symbols, util::to_string("pt", i + 1), levels_[i].kind);
        path_.push(mmu, table);
        assert_mapping(query, mmu, levels_[i], levels_[i + 1]);
        exclusive[i].push_back(levels_[i]);
    }

    for (unsigned i = 0; i <= stages; ++i) {
        query.add(symbols.page_aligned(levels_[i]), util::to_string("aligned-", level_names[i]));
    }

    /* aliases share the first-stage target of va */
    for (unsigned k = 0; k < facts.aliases; ++k) {
        const Address alias = symbols.address(AddrKind::va, util::to_string("va", k + 1));
        query.add(symbols.page_aligned(alias), util::to_string("aligned-va", k + 1));
        aliases_.push_back(alias);
    }
    if (!aliases_.empty()) {
        std::vector<Address> vas {va()};
        vas.insert(vas.end(), aliases_.begin(), aliases_.end());
        assert_aliases(query, vas, path_[0].mmu, levels_[1]);
    }
}

void Theory::assert_pins() {
    const SymbolModel& symbols = query.symbols();
    const unsigned stages = path_.size();

    const auto pin = [&] (const Address& addr, uint64_t value, const std::string& name) {
        query.add(addr == symbols.address_val(addr.kind, value), util::to_string("pin-", name));
    };

    if (facts.va) {
        pin(va(), *facts.va, "va");
    }
    if (facts.pa) {
        pin(pa(), *facts.pa, "pa");
    }
    if (facts.ipa) {
        pin(levels_[1], *facts.ipa, level_names[1]);
    }
    for (std::size_t k = 0; k < facts.alias_pins.size(); ++k) {
        pin(aliases_[k], facts.alias_pins[k], util::to_string("va", k + 1));
    }

    const PermissionTable& first = path_[0].perms;
    if (facts.ro) {
        assert_permission(query, first, PermBit::ro, va(), *facts.ro);
    }
    if (facts.nx) {
        assert_permission(query, first, PermBit::nx, va(), *facts.nx);
    }

    if (facts.ro2 || facts.nx2) {
        const PermissionTable& last = path_.back().perms;
        const Address& at = levels_[stages - 1];
        if (facts.ro2) {
            assert_permission(query, last, PermBit::ro, at, *facts.ro2);
        }
        if (facts.nx2) {
            assert_permission(query, last, PermBit::nx, at, *facts.nx2);
        }
    }
}

void Theory::assert_policy() {
    switch (scenario_) {
        case Scenario::basic_paging:
        case Scenario::aliasing:
            break;

        case Scenario::single_level_wx: {
            const PermissionTable& table = path_[0].perms;
            query.add(wx_policy(table, va()), "wx-va");
            for (const Address& alias : aliases_) {
                query.add(wx_policy(table, alias), "wx-alias");
            }
            break;
        }

        case Scenario::nested_wxvisor: {
            /* the guest table is unconstrained; the hypervisor's stage and the frame are not */
            const std::size_t last = path_.size() - 1;
            query.add(wx_policy(path_[last].perms, levels_[last]), util::to_string("wx-", path_[last].perms.name));
            query.add(wx_policy(phy_, pa()), "wx-phy");
            break;
        }
    }
}

void Theory::require_aliases(Goal goal) const {
    if (aliases_.empty()) {
        throw configuration_error(util::to_string(to_string(goal), " needs aliases, ", to_string(scenario_), " has none"));
    }
}

void Theory::require_stages(Goal goal) const {
    if (path_.size() < 2) {
        throw configuration_error(util::to_string(to_string(goal), " needs a nested translation, ", to_string(scenario_), " has one stage"));
    }
}

void Theory::pose(Goal goal) {
    if (sealed) {
        throw std::logic_error("goal posed on a sealed theory");
    }

    z3::context& ctx = query.ctx();
    const auto granted = [&] (const Address& addr, AccessKind kind) {
        return path_.granted(AccessRequest {addr, kind});
    };
    const std::string label = util::to_string("goal-", to_string(goal));

    switch (goal) {
        case Goal::mapping:
            query.add(ctx.bool_val(true), label);
            break;

        case Goal::alias_mapping:
            require_aliases(goal);
            query.add(va() != aliases_.front() && path_.translate(va()) == path_.translate(aliases_.front()), label);
            break;

        case Goal::readable:
            query.add(granted(va(), AccessKind::read), label);
            break;

        case Goal::writable:
            query.add(granted(va(), AccessKind::write), label);
            break;

        case Goal::executable:
            query.add(granted(va(), AccessKind::execute), label);
            break;

        case Goal::writable_and_executable:
            query.add(granted(va(), AccessKind::write) && granted(va(), AccessKind::execute), label);
            break;

        case Goal::write_despite_ro:
            query.add((phy_.read_only(pa()) || path_.denied(PermBit::ro, va())) && granted(va(), AccessKind::write), label);
            break;

        case Goal::execute_despite_nx:
            query.add((phy_.no_exec(pa()) || path_.denied(PermBit::nx, va())) && granted(va(), AccessKind::execute), label);
            break;

        case Goal::stage_override: {
            require_stages(goal);
            const std::size_t last = path_.size() - 1;
            const z3::expr first_grants = !path_[0].perms.read_only(va());
            const z3::expr last_denies = path_[last].perms.read_only(levels_[last]);
            query.add(first_grants && last_denies && granted(va(), AccessKind::write), label);
            break;
        }

        case Goal::alias_write_mismatch:
        case Goal::alias_execute_mismatch: {
            require_aliases(goal);
            const AccessKind kind = goal == Goal::alias_write_mismatch ? AccessKind::write : AccessKind::execute;
            z3::expr_vector differs {ctx};
            for (const Address& alias : aliases_) {
                differs.push_back(granted(va(), kind) != granted(alias, kind));
            }
            query.add(z3::reduce_or(differs), label);
            break;
        }

        case Goal::stage2_alias: {
            require_stages(goal);
            const Stage& second = path_[1];
            const std::string name = util::to_string(level_names[1], "_alias");
            const Address other = query.symbols().address(levels_[1].kind, name);
            query.add(other != levels_[1] && second.mmu(other) == levels_[2], label);
            query.watch(name, other);
            query.watch(util::to_string(second.mmu.name, "(", name, ")"), second.mmu(other));
            query.watch(util::to_string(second.perms.label(PermBit::ro), "(", name, ")"), second.perms.read_only(other));
            query.watch(util::to_string(second.perms.label(PermBit::nx), "(", name, ")"), second.perms.no_exec(other));
            exclusive[1].push_back(other);
            break;
        }
    }
}

void Theory::seal() {
    if (sealed) {
        return;
    }
    sealed = true;

    if (scenario_ == Scenario::nested_wxvisor && facts.exclusive_frames) {
        for (std::size_t i = 1; i < path_.size(); ++i) {
            assert_exclusive(query, path_[i].mmu, exclusive[i]);
        }
    }

    watch();
}

void Theory::watch() {
    for (std::size_t i = 0; i < levels_.size(); ++i) {
        query.watch(level_names[i], levels_[i]);
    }
    for (std::size_t k = 0; k < aliases_.size(); ++k) {
        query.watch(util::to_string("va", k + 1), aliases_[k]);
    }

    for (std::size_t i = 0; i < path_.size(); ++i) {
        const Stage& stage = path_[i];
        const std::string& at = level_names[i];
        query.watch(util::to_string(stage.mmu.name, "(", at, ")"), stage.mmu(levels_[i]));
        query.watch(util::to_string(stage.perms.label(PermBit::ro), "(", at, ")"), stage.perms.read_only(levels_[i]));
        query.watch(util::to_string(stage.perms.label(PermBit::nx), "(", at, ")"), stage.perms.no_exec(levels_[i]));
    }
    for (std::size_t k = 0; k < aliases_.size(); ++k) {
        const PermissionTable& first = path_[0].perms;
        const std::string at = util::to_string("va", k + 1);
        query.watch(util::to_string(path_[0].mmu.name, "(", at, ")"), path_[0].mmu(aliases_[k]));
        query.watch(util::to_string(first.label(PermBit::ro), "(", at, ")"), first.read_only(aliases_[k]));
        query.watch(util::to_string(first.label(PermBit::nx), "(", at, ")"), first.no_exec(aliases_[k]));
    }

    query.watch("phy_ro(pa)", phy_.read_only(pa()));
    query.watch("phy_nx(pa)", phy_.no_exec(pa()));
    query.watch("write(va)", path_.granted(AccessRequest {va(), AccessKind::write}));
    query.watch("execute(va)", path_.granted(AccessRequest {va(), AccessKind::execute}));
}

Verdict expected_verdict(Scenario scenario, Goal goal) {
    if (!is_violation(goal)) {
        return Verdict::sat;
    }
    /* without a policy nothing stops a page from being writable and executable */
    if (goal == Goal::writable_and_executable && (scenario == Scenario::basic_paging || scenario == Scenario::aliasing)) {
        return Verdict::sat;
    }
    return Verdict::unsat;
}

std::vector<Check> default_checks(Scenario scenario) {
    std::vector<Goal> goals;
    switch (scenario) {
        case Scenario::basic_paging:
            goals = {Goal::mapping, Goal::readable, Goal::writable, Goal::executable,
                     Goal::writable_and_executable, Goal::write_despite_ro, Goal::execute_despite_nx};
            break;
        case Scenario::aliasing:
            goals = {Goal::mapping, Goal::alias_mapping, Goal::alias_write_mismatch, Goal::alias_execute_mismatch};
            break;
        case Scenario::single_level_wx:
            goals = {Goal::mapping, Goal::writable, Goal::executable,
                     Goal::writable_and_executable, Goal::write_despite_ro, Goal::execute_despite_nx};
            break;
        case Scenario::nested_wxvisor:
            goals = {Goal::mapping, Goal::alias_mapping, Goal::writable, Goal::executable,
                     Goal::writable_and_executable, Goal::write_despite_ro, Goal::execute_despite_nx,
                     Goal::stage_override, Goal::alias_write_mismatch, Goal::alias_execute_mismatch,
                     Goal::stage2_alias};
            break;
    }

    std::vector<Check> checks;
    for (const Goal goal : goals) {
        checks.push_back(Check {scenario, goal, expected_verdict(scenario, goal)});
    }
    return checks;
}

}
