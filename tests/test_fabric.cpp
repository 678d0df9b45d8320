/*
===============================================================================
TEST FABRIC — Tests for fabric.h (VariableFabric)
===============================================================================

OVERVIEW
--------
Validates the decision variable fabric: one assignment variable per
candidate, one worked-shift indicator per (employee, timeline day, shift),
indicators tied to assignments on horizon days and pinned on history days.

TEST ORGANIZATION
-----------------
• Section A: Variable counts
• Section B: Indicator semantics under a solve
• Section C: knownIdle()

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• fabric.h - System under test
• roster_fixtures.h - Shared instances
• Gurobi C++ API - Solver backend

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "roster_fixtures.h"

using namespace roster;
using fixtures::day;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {

    GRBEnv& quietEnv() {
        static GRBEnv env(true);
        static const bool started = (env.set(GRB_IntParam_OutputFlag, 0), env.start(), true);
        (void)started;
        return env;
    }

    /// Model, registries and fabric for one instance
    struct FabricHarness {
        explicit FabricHarness(const ProblemInstance& inst)
            : model(quietEnv()), fabric(inst, vars, cons)
        {
            fabric.addAssignments(model);
            fabric.addIndicators(model);
            model.update();
        }

        GRBModel model;
        VariableTable<RosterVar> vars;
        ConstraintTable<ConstraintFamily> cons;
        VariableFabric fabric;
    };

} // namespace

// ============================================================================
// SECTION A: VARIABLE COUNTS
// ============================================================================

/**
 * @test Fabric::OneAssignmentPerCandidate
 * @brief x exists exactly for candidates; absences remove them
 *
 * @scenario 4 employees, 7 days, 2 shifts; employee 2 absent for 3 days
 * @then 56 - 6 = 50 assignment variables
 *
 * @covers VariableFabric::addAssignments()
 */
TEST_CASE("A1: Fabric::OneAssignmentPerCandidate", "[fabric][counts]")
{
    auto in = fixtures::week();
    in.absences.push_back({ 2, "U", { day(4), day(6) } });
    auto inst = ProblemInstance::build(in);

    FabricHarness h(inst);
    const auto& X = h.vars.get(RosterVar::Assign);

    REQUIRE(h.fabric.stats().assignments == 50);
    REQUIRE(X.size() == 50);
    REQUIRE_FALSE(X.contains(1, 1, 0));
    REQUIRE(X.contains(1, 0, 0));
}

/**
 * @test Fabric::IndicatorsCoverTimeline
 * @brief w exists for every plannable employee, timeline day and shift type
 *
 * @scenario Look-back 6 days (default streak limit) plus 7 horizon days
 * @then 4 * 13 * 2 = 104 indicators; 48 history pins, 56 linked
 *
 * @covers VariableFabric::addIndicators(), FabricStats
 */
TEST_CASE("A2: Fabric::IndicatorsCoverTimeline", "[fabric][counts]")
{
    auto inst = ProblemInstance::build(fixtures::week());
    FabricHarness h(inst);

    const auto& st = h.fabric.stats();
    REQUIRE(st.indicators == 104);
    REQUIRE(st.pinned == 48);
    REQUIRE(st.linked == 56);
    REQUIRE(h.cons.count(ConstraintFamily::WorksPin) == 48);
    REQUIRE(h.cons.count(ConstraintFamily::WorksLink) == 2 * 56);

    REQUIRE(h.vars.get(RosterVar::Works).contains(3, -6, 1));
    REQUIRE_FALSE(h.vars.get(RosterVar::Works).contains(3, -7, 1));
}

/**
 * @test Fabric::NonPlannableEmployeesGetNothing
 * @brief Inactive or team-less employees have no variables at all
 *
 * @covers VariableFabric::addAssignments(), addIndicators()
 */
TEST_CASE("A3: Fabric::NonPlannableEmployeesGetNothing", "[fabric][counts]")
{
    auto in = fixtures::week();
    in.employees[3].active = false;
    auto inst = ProblemInstance::build(in);

    FabricHarness h(inst);
    REQUIRE(h.vars.get(RosterVar::Assign).size() == 3 * 7 * 2);
    REQUIRE_FALSE(h.vars.get(RosterVar::Works).contains(3, 0, 0));
}

// ============================================================================
// SECTION B: INDICATOR SEMANTICS
// ============================================================================

/**
 * @test Fabric::IndicatorFollowsAssignment
 * @brief w is 1 exactly where x is 1, and history pins hold
 *
 * @scenario Force x[0,0,0] = 1, minimise the sum of all indicators
 * @given Employee 1 worked S the day before the horizon
 * @then w[0,0,0] = 1, w[0,-1,1] = 1, every other horizon w is 0
 *
 * @covers VariableFabric::addIndicators()
 */
TEST_CASE("B1: Fabric::IndicatorFollowsAssignment", "[fabric][solve]")
{
    auto in = fixtures::week();
    in.history.push_back({ 1, day(2), 2 });
    auto inst = ProblemInstance::build(in);

    FabricHarness h(inst);
    auto& X = h.vars.get(RosterVar::Assign);
    auto& W = h.vars.get(RosterVar::Works);

    h.model.addConstr(X.at(0, 0, 0) == 1.0);
    h.model.setObjective(sum(W), GRB_MINIMIZE);
    h.model.optimize();

    REQUIRE(h.model.get(GRB_IntAttr_Status) == GRB_OPTIMAL);
    REQUIRE(h.model.get(GRB_DoubleAttr_ObjVal) == Catch::Approx(2.0));
    REQUIRE(isSet(W.at(0, 0, 0)));
    REQUIRE(isSet(W.at(0, -1, 1)));
    REQUIRE_FALSE(isSet(W.at(0, -1, 0)));
    REQUIRE_FALSE(isSet(W.at(0, 1, 0)));
}

/**
 * @test Fabric::IndicatorForcedByAssignment
 * @brief Maximising assignments drives the matching indicators to 1
 *
 * @covers VariableFabric::addIndicators()
 */
TEST_CASE("B2: Fabric::IndicatorForcedByAssignment", "[fabric][solve]")
{
    auto inst = ProblemInstance::build(fixtures::singleTeam(1, { day(3), day(4) }, fixtures::earlyLate()));

    FabricHarness h(inst);
    auto& X = h.vars.get(RosterVar::Assign);
    auto& W = h.vars.get(RosterVar::Works);

    // prefer x, penalise w: w must still follow x
    h.model.setObjective(sum(W) - 2.0 * sum(X), GRB_MINIMIZE);
    h.model.optimize();

    REQUIRE(h.model.get(GRB_IntAttr_Status) == GRB_OPTIMAL);
    X.forEach([&](const GRBVar& x, const std::vector<int>& idx) {
        REQUIRE(isSet(x) == isSet(W.at(idx[0], idx[1], idx[2])));
    });
}

// ============================================================================
// SECTION C: KNOWN IDLE
// ============================================================================

/**
 * @test Fabric::KnownIdle
 * @brief Indicators fixed to zero are reported idle
 *
 * @covers VariableFabric::knownIdle()
 */
TEST_CASE("C1: Fabric::KnownIdle", "[fabric][idle]")
{
    auto in = fixtures::week();
    in.history.push_back({ 1, day(2), 2 });
    in.absences.push_back({ 2, "AU", { day(3), day(3) } });
    auto inst = ProblemInstance::build(in);

    VariableTable<RosterVar> vars;
    ConstraintTable<ConstraintFamily> cons;
    VariableFabric fabric(inst, vars, cons);

    REQUIRE_FALSE(fabric.knownIdle(0, -1, 1));   // worked S on 2 March
    REQUIRE(fabric.knownIdle(0, -1, 0));
    REQUIRE(fabric.knownIdle(0, -3, 1));
    REQUIRE(fabric.knownIdle(1, 0, 0));          // absent
    REQUIRE_FALSE(fabric.knownIdle(1, 1, 0));
}
