#include <gtest/gtest.h>

#include "alias.h"
#include "compose.h"
#include "query.h"

namespace {

using namespace wxv;

class AliasTest: public ::testing::Test {
protected:
    Query query {Geometry()};
    SymbolModel& symbols = query.symbols();
    Translation mmu1 = declare_translation(symbols, "mmu1", AddrKind::va, AddrKind::pa);
    PermissionTable pt1 = declare_permission_table(symbols, "pt1", AddrKind::va);
    PermissionTable phy = declare_permission_table(symbols, "phy", AddrKind::pa);
    Address va1 = symbols.address(AddrKind::va, "va1");
    Address va2 = symbols.address(AddrKind::va, "va2");
};

TEST_F(AliasTest, AddressCannotAliasItself) {
    assert_alias(query, va1, va1, mmu1);
    EXPECT_EQ(query.solve().verdict, Verdict::unsat);
}

TEST_F(AliasTest, DistinctAddressesMayShareFrame) {
    assert_alias(query, AliasPair {va1, va2}, mmu1);
    query.watch("va1", va1);
    query.watch("va2", va2);
    query.watch("mmu1(va1)", mmu1(va1));
    query.watch("mmu1(va2)", mmu1(va2));

    const Result res = query.solve();
    ASSERT_EQ(res.verdict, Verdict::sat);
    EXPECT_NE(res.witness.address("va1").value_or(0), res.witness.address("va2").value_or(0));
    EXPECT_EQ(res.witness.address("mmu1(va1)").value_or(0), res.witness.address("mmu1(va2)").value_or(1));
}

TEST_F(AliasTest, UnboundAliasesCanDisagree) {
    assert_alias(query, va1, va2, mmu1);
    query.add(!pt1.read_only(va1) && pt1.read_only(va2), "disagree");
    EXPECT_EQ(query.solve().verdict, Verdict::sat);
}

TEST_F(AliasTest, BoundAliasesAgreeOnWrite) {
    TranslationPath path;
    path.push(mmu1, pt1);
    assert_alias(query, va1, va2, mmu1);
    query.add(path.frame_consistent(phy, va1), "frame-va1");
    query.add(path.frame_consistent(phy, va2), "frame-va2");
    query.add(path.granted(AccessRequest {va1, AccessKind::write}) != path.granted(AccessRequest {va2, AccessKind::write}), "mismatch");
    EXPECT_EQ(query.solve().verdict, Verdict::unsat);
}

TEST_F(AliasTest, AliasGroupSharesTarget) {
    const Address va = symbols.address(AddrKind::va, "va");
    const Address pa = symbols.address_val(AddrKind::pa, 0x9000);
    assert_aliases(query, {va, va1, va2}, mmu1, pa);
    query.watch("mmu1(va2)", mmu1(va2));

    const Result res = query.solve();
    ASSERT_EQ(res.verdict, Verdict::sat);
    EXPECT_EQ(res.witness.address("mmu1(va2)").value_or(0), 0x9000u);
}

TEST_F(AliasTest, AliasGroupMembersAreDistinct) {
    const Address pa = symbols.address(AddrKind::pa, "pa");
    assert_aliases(query, {va1, va2}, mmu1, pa);
    query.add(va1 == va2, "collapse");
    EXPECT_EQ(query.solve().verdict, Verdict::unsat);
}

}
