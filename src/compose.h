#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <z3++.h>

#include "permission.h"
#include "symbols.h"
#include "translation.h"
#include "xmacros.h"

namespace wxv {

#define X_ACCESS_KINDS(XB, XE) \
XB(read)                        \
XB(write)                       \
XE(execute)

XM_ENUM_CLASS(AccessKind, X_ACCESS_KINDS);

const char *to_string(AccessKind kind);

/// The bit that denies kind when set: ro for write, nx for execute, none for read.
std::optional<PermBit> governing_bit(AccessKind kind);

struct AccessRequest {
    Address addr;
    AccessKind kind;
};

/// A translation stage together with the table that holds permissions for its input.
struct Stage {
    Translation mmu;
    PermissionTable perms;
};

/* The chain of stages an access traverses, e.g. mmu2 . mmu1 for VA -> IPA -> PA.
 *
 * The effective permission of an access is the meet of what every stage allows:
 * a single stage denying the access denies it. Stages are never ORed.
 */
class TranslationPath {
public:
    void push(const Translation& mmu, const PermissionTable& perms);

    std::size_t size() const { return stages.size(); }
    bool empty() const { return stages.empty(); }
    const Stage& operator[](std::size_t i) const;
    const Stage& back() const { return (*this)[stages.size() - 1]; }

    /// [in, mmu1(in), mmu2(mmu1(in)), ...]
    std::vector<Address> walk(const Address& in) const;
    Address translate(const Address& in) const { return walk(in).back(); }

    z3::expr stage_grant(std::size_t i, const Address& at, AccessKind kind) const;
    z3::expr granted(const AccessRequest& req) const;

    /// The composed bit: set if any traversed stage sets it.
    z3::expr denied(PermBit bit, const Address& in) const;

    /// The frame reached from in carries exactly the composed ro and nx of the path.
    z3::expr frame_consistent(const PermissionTable& phy, const Address& in) const;

private:
    std::vector<Stage> stages;

    void check_nonempty() const;
};

}
