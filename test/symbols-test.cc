#include <gtest/gtest.h>

#include "exception.h"
#include "query.h"
#include "symbols.h"

namespace {

using namespace wxv;

Geometry geometry(unsigned addr_bits, unsigned page_bits = 12, unsigned stages = 1) {
    Geometry geom;
    geom.addr_bits = addr_bits;
    geom.page_bits = page_bits;
    geom.stages = stages;
    return geom;
}

TEST(GeometryTest, AcceptsDefaults) {
    EXPECT_NO_THROW(validate(Geometry()));
    EXPECT_NO_THROW(validate(geometry(64)));
}

TEST(GeometryTest, RejectsBadWidth) {
    EXPECT_THROW(validate(geometry(0, 0)), configuration_error);
    EXPECT_THROW(validate(geometry(65)), configuration_error);
}

TEST(GeometryTest, RejectsNoStages) {
    EXPECT_THROW(validate(geometry(32, 12, 0)), configuration_error);
}

TEST(GeometryTest, RejectsPageLargerThanAddress) {
    EXPECT_THROW(validate(geometry(8, 12)), configuration_error);
}

TEST(GeometryTest, QueryRejectsGeometryBeforeBuilding) {
    EXPECT_THROW(Query query(geometry(0, 0)), configuration_error);
    EXPECT_THROW(Query query(geometry(32, 12, 0)), configuration_error);
}

TEST(SymbolModelTest, AddressValueMustFitWidth) {
    Query query {geometry(16)};
    EXPECT_THROW(query.symbols().address_val(AddrKind::va, 0x10000), configuration_error);
    EXPECT_NO_THROW(query.symbols().address_val(AddrKind::va, 0xffff));
}

TEST(SymbolModelTest, SymbolsAreDeclaredOnce) {
    Query query {Geometry()};
    query.symbols().address(AddrKind::va, "va");
    EXPECT_THROW(query.symbols().address(AddrKind::pa, "va"), configuration_error);
    EXPECT_THROW(query.symbols().bit("va"), configuration_error);
}

TEST(SymbolModelTest, FreshQueriesDoNotShareNames) {
    Query first {Geometry()};
    Query second {Geometry()};
    first.symbols().address(AddrKind::va, "va");
    EXPECT_NO_THROW(second.symbols().address(AddrKind::va, "va"));
}

TEST(SymbolModelTest, UnalignedAddressIsRejectedBySolver) {
    Query query {Geometry()};
    SymbolModel& symbols = query.symbols();
    const Address va = symbols.address(AddrKind::va, "va");
    query.add(symbols.page_aligned(va), "aligned");
    query.add(va == symbols.address_val(AddrKind::va, 0x12345678), "pin");
    EXPECT_EQ(query.solve().verdict, Verdict::unsat);
}

TEST(SymbolModelTest, AlignedAddressIsAccepted) {
    Query query {Geometry()};
    SymbolModel& symbols = query.symbols();
    const Address va = symbols.address(AddrKind::va, "va");
    query.add(symbols.page_aligned(va), "aligned");
    query.add(va == symbols.address_val(AddrKind::va, 0x12345000), "pin");
    query.watch("va", va);

    const Result res = query.solve();
    ASSERT_EQ(res.verdict, Verdict::sat);
    EXPECT_EQ(res.witness.address("va").value_or(0), 0x12345000u);
}

TEST(SymbolModelTest, SixtyFourBitAddresses) {
    Query query {geometry(64)};
    SymbolModel& symbols = query.symbols();
    const Address pa = symbols.address(AddrKind::pa, "pa");
    query.add(pa == symbols.address_val(AddrKind::pa, 0xffffffff'fffff000), "pin");
    query.add(symbols.page_aligned(pa), "aligned");
    query.watch("pa", pa);

    const Result res = query.solve();
    ASSERT_EQ(res.verdict, Verdict::sat);
    EXPECT_EQ(res.witness.address("pa").value_or(0), 0xffffffff'fffff000u);
}

TEST(SymbolModelTest, ZeroPageShiftAlignsEverything) {
    Query query {geometry(32, 0)};
    SymbolModel& symbols = query.symbols();
    const Address va = symbols.address(AddrKind::va, "va");
    query.add(symbols.page_aligned(va), "aligned");
    query.add(va == symbols.address_val(AddrKind::va, 0x3), "pin");
    EXPECT_EQ(query.solve().verdict, Verdict::sat);
}

}
