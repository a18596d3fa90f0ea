#include "compose.h"
#include "exception.h"
#include "util.h"

namespace wxv {

namespace {

const char *access_kind_names[] = {XM_STR_LIST(X_ACCESS_KINDS)};

}

const char *to_string(AccessKind kind) {
    return xm::name(access_kind_names, kind);
}

std::optional<PermBit> governing_bit(AccessKind kind) {
    switch (kind) {
        case AccessKind::read:    return std::nullopt;
        case AccessKind::write:   return PermBit::ro;
        case AccessKind::execute: return PermBit::nx;
    }
    return std::nullopt;
}

void TranslationPath::push(const Translation& mmu, const PermissionTable& perms) {
    if (perms.kind != mmu.domain) {
        throw configuration_error(util::to_string("table ", perms.name, " indexes ", to_string(perms.kind),
                                                  " but ", mmu.name, " translates ", to_string(mmu.domain)));
    }
    if (!stages.empty() && stages.back().mmu.range != mmu.domain) {
        throw configuration_error(util::to_string(mmu.name, " cannot follow ", stages.back().mmu.name));
    }
    stages.push_back(Stage {mmu, perms});
}

void TranslationPath::check_nonempty() const {
    if (stages.empty()) {
        throw configuration_error("translation path has no stages");
    }
}

const Stage& TranslationPath::operator[](std::size_t i) const {
    if (i >= stages.size()) {
        throw configuration_error(util::format("stage %zu out of range, path has %zu", i + 1, stages.size()));
    }
    return stages[i];
}

std::vector<Address> TranslationPath::walk(const Address& in) const {
    check_nonempty();
    std::vector<Address> levels {in};
    for (const Stage& stage : stages) {
        levels.push_back(stage.mmu(levels.back()));
    }
    return levels;
}

z3::expr TranslationPath::stage_grant(std::size_t i, const Address& at, AccessKind kind) const {
    const Stage& stage = (*this)[i];
    if (const auto bit = governing_bit(kind)) {
        return !stage.perms(*bit, at);
    } else {
        /* every translation is total, so the page is always present */
        expect_kind(at, stage.perms.kind, stage.perms.name);
        return at.ctx().bool_val(true);
    }
}

z3::expr TranslationPath::granted(const AccessRequest& req) const {
    const std::vector<Address> levels = walk(req.addr);
    z3::expr_vector grants {req.addr.ctx()};
    for (std::size_t i = 0; i < stages.size(); ++i) {
        grants.push_back(stage_grant(i, levels[i], req.kind));
    }
    return z3::reduce_and(grants);
}

z3::expr TranslationPath::denied(PermBit bit, const Address& in) const {
    const std::vector<Address> levels = walk(in);
    z3::expr_vector bits {in.ctx()};
    for (std::size_t i = 0; i < stages.size(); ++i) {
        bits.push_back(stages[i].perms(bit, levels[i]));
    }
    return z3::reduce_or(bits);
}

z3::expr TranslationPath::frame_consistent(const PermissionTable& phy, const Address& in) const {
    const Address frame = translate(in);
    return z3::iff(phy.read_only(frame), denied(PermBit::ro, in))
        && z3::iff(phy.no_exec(frame), denied(PermBit::nx, in));
}

}
