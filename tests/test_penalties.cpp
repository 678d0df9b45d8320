/*
===============================================================================
TEST PENALTIES — Tests for penalties.h and objective.h
===============================================================================

OVERVIEW
--------
Validates the soft rule families and the objective assembled from them:
forbidden transitions derived from shift times, violation indicators that
fire exactly when their condition holds, availability-weighted fairness,
the optional weekly minimum and the optional weekly rotation order.

TEST ORGANIZATION
-----------------
• Section A: Rest between shift types
• Section B: Penalty pool contents
• Section C: Rest time and consecutive days under a solve
• Section D: Fairness under a solve
• Section E: Weekly minimum hours
• Section F: Team rotation

TEST STRATEGY
-------------
• Count tests pin down exactly which rule instances get an indicator
• Solve tests force a roster with locks and check the evaluated breakdown

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• penalties.h, objective.h - Systems under test
• fabric.h, hard_constraints.h - Model under the penalties
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

    /// Full roster model without the ModelBuilder shell
    struct PenaltyHarness {
        PenaltyHarness(const ProblemInstance& inst, const SolverConfig& cfg)
            : model(quietEnv()), fabric(inst, vars, cons)
        {
            fabric.addAssignments(model);
            fabric.addIndicators(model);
            HardConstraintBuilder(inst, vars, cons).build(model);
            PenaltyBuilder(inst, cfg, fabric, vars, cons, pool).build(model);
            model.setObjective(assemble(pool), GRB_MINIMIZE);
            model.update();
        }

        PenaltyTotals solve() {
            model.optimize();
            REQUIRE(model.get(GRB_IntAttr_Status) == GRB_OPTIMAL);
            return evaluate(pool);
        }

        GRBModel model;
        VariableTable<RosterVar> vars;
        ConstraintTable<ConstraintFamily> cons;
        VariableFabric fabric;
        PenaltyPool pool;
    };

    /// One employee, F / N / S on demand, Mon 3 .. Sun 16 March (two ISO weeks)
    InstanceInput twoWeekRotation() {
        return fixtures::singleTeam(1, { day(3), day(16) },
            { fixtures::shift(1, "F", "06:00", "14:00", 0, 1),
              fixtures::shift(2, "S", "14:00", "22:00", 0, 1),
              fixtures::shift(3, "N", "22:00", "06:00", 0, 1) });
    }

    SolverConfig rotationConfig() {
        auto cfg = fixtures::testConfig();
        cfg.rotation = RotationPolicy::Soft;
        return cfg;
    }

} // namespace

// ============================================================================
// SECTION A: REST BETWEEN SHIFT TYPES
// ============================================================================

/**
 * @test Transitions::StandardRotation
 * @brief Late->early, night->early and night->late leave under 11h
 *
 * @covers restHoursBetween(), forbiddenTransitions()
 */
TEST_CASE("A1: Transitions::StandardRotation", "[penalties][transitions]")
{
    auto shifts = standardShiftTypes();   // F, S, N

    REQUIRE(restHoursBetween(shifts[1], shifts[0]) == Catch::Approx(8.0));
    REQUIRE(restHoursBetween(shifts[2], shifts[0]) == Catch::Approx(0.0));
    REQUIRE(restHoursBetween(shifts[2], shifts[1]) == Catch::Approx(8.0));
    REQUIRE(restHoursBetween(shifts[0], shifts[2]) == Catch::Approx(32.0));

    auto forbidden = forbiddenTransitions(shifts, 11.0);
    REQUIRE(forbidden == std::vector<std::pair<int, int>>{ { 1, 0 }, { 2, 0 }, { 2, 1 } });
}

/**
 * @test Transitions::ThresholdMatters
 * @brief The forbidden set follows the configured minimum rest
 *
 * @covers forbiddenTransitions()
 */
TEST_CASE("A2: Transitions::ThresholdMatters", "[penalties][transitions]")
{
    auto shifts = fixtures::earlyLate();   // S 14-22 then F 06-14 leaves 8h

    REQUIRE(forbiddenTransitions(shifts, 11.0) == std::vector<std::pair<int, int>>{ { 1, 0 } });
    REQUIRE(forbiddenTransitions(shifts, 8.0).empty());
    REQUIRE(forbiddenTransitions(shifts, 20.0).size() == 3);
}

// ============================================================================
// SECTION B: PENALTY POOL CONTENTS
// ============================================================================

/**
 * @test Pool::TermsPerFamily
 * @brief One week, four employees, default configuration
 *
 * @then Rest: 6 day pairs x 4 employees (the pair into the horizon has no
 *       history). Streak: one 7-day window per employee and shift.
 *       Fairness: one deviation per team member. No minimum-hours terms.
 *
 * @covers PenaltyBuilder::build(), PenaltyPool::count()
 */
TEST_CASE("B1: Pool::TermsPerFamily", "[penalties][pool]")
{
    auto inst = ProblemInstance::build(fixtures::week());
    auto cfg = fixtures::testConfig();
    PenaltyHarness h(inst, cfg);

    REQUIRE(h.pool.count(PenaltyFamily::RestTime) == 24);
    REQUIRE(h.pool.count(PenaltyFamily::ConsecutiveDays) == 8);
    REQUIRE(h.pool.count(PenaltyFamily::Fairness) == 4);
    REQUIRE(h.pool.count(PenaltyFamily::MinimumHours) == 0);
    REQUIRE(h.pool.size() == 36);

    REQUIRE(h.cons.count(ConstraintFamily::RestLink) == 24);
    REQUIRE(h.cons.count(ConstraintFamily::FairnessLink) == 8);
    REQUIRE(h.vars.get(RosterVar::RestViolation).contains(0, 0, 1, 0));
    REQUIRE_FALSE(h.vars.get(RosterVar::RestViolation).contains(0, -1, 1, 0));
}

/**
 * @test Pool::HistoryAddsBoundaryTerms
 * @brief A late shift the day before the horizon creates a rest term into day 0
 *
 * @covers PenaltyBuilder::addRestTime()
 */
TEST_CASE("B2: Pool::HistoryAddsBoundaryTerms", "[penalties][pool][history]")
{
    auto in = fixtures::week();
    in.history.push_back({ 1, day(2), 2 });
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    PenaltyHarness h(inst, cfg);

    REQUIRE(h.pool.count(PenaltyFamily::RestTime) == 25);
    REQUIRE(h.vars.get(RosterVar::RestViolation).contains(0, -1, 1, 0));
}

/**
 * @test Pool::MinimumHoursOnlyWhenSoft
 * @brief The weekly minimum is modelled only under MinimumHoursPolicy::Soft
 *
 * @covers PenaltyBuilder::addMinimumHours()
 */
TEST_CASE("B3: Pool::MinimumHoursOnlyWhenSoft", "[penalties][pool][minimum_hours]")
{
    auto inst = ProblemInstance::build(fixtures::week());
    auto cfg = fixtures::testConfig();
    cfg.minimumHours = MinimumHoursPolicy::Soft;
    PenaltyHarness h(inst, cfg);

    REQUIRE(h.pool.count(PenaltyFamily::MinimumHours) == 4);
    REQUIRE(h.cons.count(ConstraintFamily::MinimumHoursLink) == 4);
}

/**
 * @test Pool::SingleMemberTeamHasNoFairness
 * @brief Fairness needs at least two available members
 *
 * @covers PenaltyBuilder::addFairness()
 */
TEST_CASE("B4: Pool::SingleMemberTeamHasNoFairness", "[penalties][pool][fairness]")
{
    auto in = fixtures::week();
    in.absences.push_back({ 2, "U", { day(1), day(20) } });
    in.absences.push_back({ 3, "U", { day(1), day(20) } });
    in.absences.push_back({ 4, "U", { day(1), day(20) } });
    in.shiftTypes = fixtures::earlyLate(0, 2);
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    PenaltyHarness h(inst, cfg);

    REQUIRE(h.pool.count(PenaltyFamily::Fairness) == 0);
}

// ============================================================================
// SECTION C: REST TIME AND CONSECUTIVE DAYS UNDER A SOLVE
// ============================================================================

/**
 * @test RestTime::ForcedViolationIsCounted
 * @brief Locked S then F on consecutive days costs exactly one rest violation
 *
 * @scenario One employee, two days, no staffing minimum
 * @then evaluate() reports one RestTime violation worth its weight
 *
 * @covers PenaltyBuilder::addRestTime(), assemble(), evaluate()
 */
TEST_CASE("C1: RestTime::ForcedViolationIsCounted", "[penalties][solve][rest]")
{
    auto in = fixtures::singleTeam(1, { day(3), day(4) }, fixtures::earlyLate(0, 1));
    in.locks.push_back({ 1, day(3), 2 });
    in.locks.push_back({ 1, day(4), 1 });
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    PenaltyHarness h(inst, cfg);

    auto totals = h.solve();

    REQUIRE(totals.violations[PenaltyFamily::RestTime] == 1);
    REQUIRE(totals.penalty[PenaltyFamily::RestTime] == Catch::Approx(cfg.weights.restTime));
    REQUIRE(totals.totalViolations() == 1);
    REQUIRE(h.model.get(GRB_DoubleAttr_ObjVal) == Catch::Approx(totals.total()));
}

/**
 * @test RestTime::HistoryViolationIsCounted
 * @brief A late shift before the horizon followed by a locked early shift
 *
 * @covers PenaltyBuilder::addRestTime()
 */
TEST_CASE("C2: RestTime::HistoryViolationIsCounted", "[penalties][solve][rest][history]")
{
    auto in = fixtures::singleTeam(1, { day(3), day(3) }, fixtures::earlyLate(0, 1));
    in.history.push_back({ 1, day(2), 2 });
    in.locks.push_back({ 1, day(3), 1 });
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    PenaltyHarness h(inst, cfg);

    auto totals = h.solve();
    REQUIRE(totals.violations[PenaltyFamily::RestTime] == 1);
}

/**
 * @test ConsecutiveDays::OverlongStreakIsCounted
 * @brief Four locked night-style days with a limit of three fire one window
 *
 * @covers PenaltyBuilder::addConsecutiveDays()
 */
TEST_CASE("C3: ConsecutiveDays::OverlongStreakIsCounted", "[penalties][solve][streak]")
{
    auto f = fixtures::shift(1, "F", "06:00", "14:00", 0, 1);
    f.maxConsecutiveDays = 3;
    auto in = fixtures::singleTeam(1, { day(3), day(6) }, { f });
    for (unsigned d = 3; d <= 6; ++d) {
        in.locks.push_back({ 1, day(d), 1 });
    }
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    PenaltyHarness h(inst, cfg);

    REQUIRE(h.pool.count(PenaltyFamily::ConsecutiveDays) == 1);

    auto totals = h.solve();
    REQUIRE(totals.violations[PenaltyFamily::ConsecutiveDays] == 1);
    REQUIRE(totals.penalty[PenaltyFamily::ConsecutiveDays] == Catch::Approx(cfg.weights.consecutiveDays));
}

/**
 * @test ConsecutiveDays::StreakContinuesFromHistory
 * @brief Days worked before the horizon count toward the streak
 *
 * @scenario Limit 3; F worked on the two days before the horizon
 * @then Two locked horizon days complete a 4-day window
 *
 * @covers PenaltyBuilder::addConsecutiveDays()
 */
TEST_CASE("C4: ConsecutiveDays::StreakContinuesFromHistory", "[penalties][solve][streak][history]")
{
    auto f = fixtures::shift(1, "F", "06:00", "14:00", 0, 1);
    f.maxConsecutiveDays = 3;
    auto in = fixtures::singleTeam(1, { day(3), day(4) }, { f });
    in.history.push_back({ 1, day(1), 1 });
    in.history.push_back({ 1, day(2), 1 });
    in.locks.push_back({ 1, day(3), 1 });
    in.locks.push_back({ 1, day(4), 1 });
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    PenaltyHarness h(inst, cfg);

    auto totals = h.solve();
    REQUIRE(totals.violations[PenaltyFamily::ConsecutiveDays] == 1);
}

// ============================================================================
// SECTION D: FAIRNESS UNDER A SOLVE
// ============================================================================

/**
 * @test Fairness::LockedImbalance
 * @brief One member working everything deviates from the team mean
 *
 * @scenario Two members, two days, F needs exactly one; member 1 locked
 *           on both days
 * @then Hours 16 / 0 against a mean of 8: total deviation 16
 *
 * @covers PenaltyBuilder::addFairness()
 */
TEST_CASE("D1: Fairness::LockedImbalance", "[penalties][solve][fairness]")
{
    auto in = fixtures::singleTeam(2, { day(3), day(4) },
        { fixtures::shift(1, "F", "06:00", "14:00", 1, 1) });
    in.locks.push_back({ 1, day(3), 1 });
    in.locks.push_back({ 1, day(4), 1 });
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    PenaltyHarness h(inst, cfg);

    auto totals = h.solve();
    REQUIRE(totals.violations[PenaltyFamily::Fairness] == 2);
    REQUIRE(totals.penalty[PenaltyFamily::Fairness] == Catch::Approx(16.0));
    REQUIRE(h.model.get(GRB_DoubleAttr_ObjVal) == Catch::Approx(16.0));
}

/**
 * @test Fairness::BalancedWhenFree
 * @brief Without locks the optimum splits the work evenly
 *
 * @covers PenaltyBuilder::addFairness()
 */
TEST_CASE("D2: Fairness::BalancedWhenFree", "[penalties][solve][fairness]")
{
    auto in = fixtures::singleTeam(2, { day(3), day(4) },
        { fixtures::shift(1, "F", "06:00", "14:00", 1, 1) });
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    PenaltyHarness h(inst, cfg);

    auto totals = h.solve();
    REQUIRE(totals.totalViolations() == 0);
    REQUIRE(h.model.get(GRB_DoubleAttr_ObjVal) == Catch::Approx(0.0).margin(1e-6));
}

/**
 * @test Fairness::WeightedByAvailability
 * @brief A member absent half the horizon is expected to work half as much
 *
 * @scenario Member 2 is absent on the second day, so shares are 2/3 and 1/3
 * @then The optimum gives member 2 the first day; deviation 2 * 8/3
 *
 * @covers PenaltyBuilder::addFairness()
 */
TEST_CASE("D3: Fairness::WeightedByAvailability", "[penalties][solve][fairness]")
{
    auto in = fixtures::singleTeam(2, { day(3), day(4) },
        { fixtures::shift(1, "F", "06:00", "14:00", 1, 1) });
    in.absences.push_back({ 2, "U", { day(4), day(4) } });
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    PenaltyHarness h(inst, cfg);

    auto totals = h.solve();
    REQUIRE(totals.penalty[PenaltyFamily::Fairness] == Catch::Approx(16.0 / 3.0));
    REQUIRE(isSet(h.vars.var(RosterVar::Assign, 1, 0, 0)));
    REQUIRE(isSet(h.vars.var(RosterVar::Assign, 0, 1, 0)));
}

// ============================================================================
// SECTION E: WEEKLY MINIMUM HOURS
// ============================================================================

/**
 * @test MinimumHours::SoftTargetIsMet
 * @brief With the soft minimum on, a lone employee works at least 40h
 *
 * @scenario One employee, one ISO week, no staffing minimum
 * @then Objective 0 and at least five 8h shifts
 *
 * @covers PenaltyBuilder::addMinimumHours()
 */
TEST_CASE("E1: MinimumHours::SoftTargetIsMet", "[penalties][solve][minimum_hours]")
{
    auto in = fixtures::singleTeam(1, { day(3), day(9) },
        { fixtures::shift(1, "F", "06:00", "14:00", 0, 1) });
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    cfg.minimumHours = MinimumHoursPolicy::Soft;
    PenaltyHarness h(inst, cfg);

    auto totals = h.solve();
    REQUIRE(totals.violations[PenaltyFamily::MinimumHours] == 0);

    int worked = 0;
    h.vars.get(RosterVar::Assign).forEach([&](const GRBVar& x, const std::vector<int>&) {
        worked += isSet(x) ? 1 : 0;
    });
    REQUIRE(worked >= 5);
}

/**
 * @test MinimumHours::ShortfallIsPenalized
 * @brief A target out of reach costs exactly one MinimumHours violation
 *
 * @scenario Weekly ceiling 24h, nominal weekly hours 40h
 * @then Three shifts are worked, the week is one violation and nothing else
 *
 * @covers PenaltyBuilder::addMinimumHours(), evaluate()
 */
TEST_CASE("E2: MinimumHours::ShortfallIsPenalized", "[penalties][solve][minimum_hours]")
{
    auto f = fixtures::shift(1, "F", "06:00", "14:00", 0, 1);
    f.maxWeeklyHours = 24.0;
    auto in = fixtures::singleTeam(1, { day(3), day(9) }, { f });
    auto inst = ProblemInstance::build(in);
    auto cfg = fixtures::testConfig();
    cfg.minimumHours = MinimumHoursPolicy::Soft;
    PenaltyHarness h(inst, cfg);

    auto totals = h.solve();
    REQUIRE(totals.violations[PenaltyFamily::MinimumHours] == 1);
    REQUIRE(totals.penalty[PenaltyFamily::MinimumHours] == Catch::Approx(cfg.weights.minimumHours));
    REQUIRE(totals.totalViolations() == 1);
    REQUIRE(h.cons.count(ConstraintFamily::WeeklyHoursCeiling) == 1);
}

// ============================================================================
// SECTION F: TEAM ROTATION
// ============================================================================

/**
 * @test Rotation::TermsPerWeekPair
 * @brief Each rotation shift of week k pairs with the two non-successors of
 *        week k+1
 *
 * @then 3 x 2 terms for one employee and one week pair; none when disabled
 *
 * @covers PenaltyBuilder::addTeamRotation()
 */
TEST_CASE("F1: Rotation::TermsPerWeekPair", "[penalties][pool][rotation]")
{
    auto inst = ProblemInstance::build(twoWeekRotation());

    SECTION("soft")
    {
        auto cfg = rotationConfig();
        PenaltyHarness h(inst, cfg);
        REQUIRE(h.pool.count(PenaltyFamily::TeamRotation) == 6);
        REQUIRE(h.vars.get(RosterVar::RotationWeek).size() == 6);
    }

    SECTION("disabled")
    {
        auto cfg = fixtures::testConfig();
        PenaltyHarness h(inst, cfg);
        REQUIRE(h.pool.count(PenaltyFamily::TeamRotation) == 0);
    }
}

/**
 * @test Rotation::BreakIsPenalized
 * @brief Early in one week followed by late in the next breaks F -> N -> S
 *
 * @covers PenaltyBuilder::addTeamRotation(), evaluate()
 */
TEST_CASE("F2: Rotation::BreakIsPenalized", "[penalties][solve][rotation]")
{
    auto in = twoWeekRotation();
    in.locks.push_back({ 1, day(3), 1 });
    in.locks.push_back({ 1, day(10), 2 });
    auto inst = ProblemInstance::build(in);
    auto cfg = rotationConfig();
    PenaltyHarness h(inst, cfg);

    auto totals = h.solve();
    REQUIRE(totals.violations[PenaltyFamily::TeamRotation] == 1);
    REQUIRE(totals.penalty[PenaltyFamily::TeamRotation] == Catch::Approx(cfg.weights.teamRotation));
}

/**
 * @test Rotation::SuccessorIsFree
 * @brief Early followed by night, and night followed by late, cost nothing
 *
 * @covers PenaltyBuilder::addTeamRotation()
 */
TEST_CASE("F3: Rotation::SuccessorIsFree", "[penalties][solve][rotation]")
{
    auto in = twoWeekRotation();
    auto cfg = rotationConfig();

    SECTION("early then night")
    {
        in.locks.push_back({ 1, day(4), 1 });
        in.locks.push_back({ 1, day(12), 3 });
    }

    SECTION("night then late")
    {
        in.locks.push_back({ 1, day(4), 3 });
        in.locks.push_back({ 1, day(12), 2 });
    }

    SECTION("late then early")
    {
        in.locks.push_back({ 1, day(4), 2 });
        in.locks.push_back({ 1, day(12), 1 });
    }

    auto inst = ProblemInstance::build(in);
    PenaltyHarness h(inst, cfg);
    auto totals = h.solve();
    REQUIRE(totals.violations[PenaltyFamily::TeamRotation] == 0);
}

/**
 * @test Rotation::UnknownCodeSkipsRule
 * @brief A rotation naming a shift code the instance lacks adds nothing
 *
 * @covers PenaltyBuilder::addTeamRotation()
 */
TEST_CASE("F4: Rotation::UnknownCodeSkipsRule", "[penalties][pool][rotation]")
{
    auto inst = ProblemInstance::build(fixtures::singleTeam(1, { day(3), day(16) }, fixtures::earlyLate(0, 1)));
    auto cfg = rotationConfig();
    PenaltyHarness h(inst, cfg);
    REQUIRE(h.pool.count(PenaltyFamily::TeamRotation) == 0);
}
