#include <algorithm>
#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "inconclusive-oracle.h"
#include "query.h"

namespace {

using namespace wxv;

bool contains(const std::vector<std::string>& labels, const std::string& label) {
    return std::find(labels.begin(), labels.end(), label) != labels.end();
}

TEST(QueryTest, EmptyQueryIsSat) {
    Query query {Geometry()};
    const Result res = query.solve();
    EXPECT_EQ(res.verdict, Verdict::sat);
    EXPECT_TRUE(res.witness.empty());
}

TEST(QueryTest, StateFollowsLifecycle) {
    Query query {Geometry()};
    EXPECT_EQ(query.state(), QueryState::idle);

    query.add(query.symbols().bit("b"), "set-b");
    EXPECT_EQ(query.state(), QueryState::building);

    query.solve();
    EXPECT_EQ(query.state(), QueryState::done);
}

TEST(QueryTest, NoConstraintsAfterSolve) {
    Query query {Geometry()};
    const z3::expr b = query.symbols().bit("b");
    query.add(b, "set-b");
    query.solve();
    EXPECT_THROW(query.add(!b, "late"), std::logic_error);
}

TEST(QueryTest, SolvesOnce) {
    Query query {Geometry()};
    query.solve();
    EXPECT_THROW(query.solve(), std::logic_error);
}

TEST(QueryTest, CoreNamesTheConflictingLabels) {
    Query query {Geometry()};
    const z3::expr b = query.symbols().bit("b");
    const z3::expr c = query.symbols().bit("c");
    query.add(b, "set-b");
    query.add(c, "set-c");
    query.add(!b, "clear-b");

    const Result res = query.solve();
    ASSERT_EQ(res.verdict, Verdict::unsat);
    EXPECT_TRUE(contains(res.core, "set-b"));
    EXPECT_TRUE(contains(res.core, "clear-b"));
    EXPECT_TRUE(res.witness.empty());
}

TEST(QueryTest, RepeatedLabelsAreNumbered) {
    Query query {Geometry()};
    const z3::expr b = query.symbols().bit("b");
    query.add(b, "pin");
    query.add(!b, "pin");

    const Result res = query.solve();
    ASSERT_EQ(res.verdict, Verdict::unsat);
    EXPECT_TRUE(contains(res.core, "pin"));
    EXPECT_TRUE(contains(res.core, "pin#1"));
}

TEST(QueryTest, WitnessHoldsWatchedValues) {
    Query query {Geometry()};
    SymbolModel& symbols = query.symbols();
    const Address pa = symbols.address(AddrKind::pa, "pa");
    const z3::expr b = symbols.bit("b");
    query.add(pa == symbols.address_val(AddrKind::pa, 0x9000), "pin-pa");
    query.add(b, "set-b");
    query.watch("pa", pa);
    query.watch("b", b);

    const Result res = query.solve();
    ASSERT_EQ(res.verdict, Verdict::sat);
    EXPECT_EQ(res.witness.address("pa").value_or(0), 0x9000u);
    EXPECT_TRUE(res.witness.bit("b").value_or(false));
    EXPECT_FALSE(res.witness.bit("pa").has_value());
    EXPECT_FALSE(res.witness.address("missing").has_value());

    std::ostringstream os;
    res.witness.print(os);
    EXPECT_EQ(os.str(), "  pa = 0x9000\n  b = 1\n");
}

TEST(QueryTest, InconclusiveOracleReportsReason) {
    Query query {Geometry(), std::make_unique<wxv::testing::InconclusiveOracle>()};
    query.add(query.symbols().bit("b"), "set-b");

    const Result res = query.solve();
    EXPECT_EQ(res.verdict, Verdict::unknown);
    EXPECT_EQ(res.reason, "timeout");
    EXPECT_TRUE(res.core.empty());
    EXPECT_EQ(query.state(), QueryState::done);
}

TEST(QueryTest, DumpWritesAssertions) {
    Query query {Geometry()};
    query.add(query.symbols().bit("b"), "set-b");

    std::ostringstream os;
    query.dump(os);
    EXPECT_NE(os.str().find("set-b"), std::string::npos);
}

TEST(OracleTest, ModelOnlyAfterSat) {
    Oracle oracle;
    EXPECT_THROW(oracle.get_model(), std::logic_error);

    const z3::expr b = oracle.declare_symbol("b", oracle.ctx().bool_sort());
    oracle.add(b, "set-b");
    oracle.add(!b, "not-b");
    ASSERT_EQ(oracle.check_sat(), Verdict::unsat);
    EXPECT_THROW(oracle.get_model(), std::logic_error);
    EXPECT_NO_THROW(oracle.unsat_core());
}

TEST(OracleTest, CoreOnlyAfterUnsat) {
    Oracle oracle;
    ASSERT_EQ(oracle.check_sat(), Verdict::sat);
    EXPECT_THROW(oracle.unsat_core(), std::logic_error);
    EXPECT_THROW(oracle.add(oracle.ctx().bool_val(true), "late"), std::logic_error);
}

TEST(OracleTest, VerdictNames) {
    std::ostringstream os;
    os << Verdict::unsat;
    EXPECT_EQ(os.str(), "unsat");
    EXPECT_STREQ(to_string(Verdict::unknown), "unknown");
}

}
