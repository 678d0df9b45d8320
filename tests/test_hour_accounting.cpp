/*
===============================================================================
TEST HOUR ACCOUNTING — Tests for hour_accounting.h
===============================================================================

OVERVIEW
--------
Validates the reconciliation of worked and credited hours for a published
roster and the activity buckets used for headcount reporting. No solver is
involved.

TEST ORGANIZATION
-----------------
• Section A: Credited hours
• Section B: Windows and edge cases
• Section C: Activity buckets

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• hour_accounting.h - System under test
• roster_fixtures.h - Dates and employees

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "roster_fixtures.h"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>

using namespace roster;
using fixtures::day;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {

    const DateRange kMarch{ day(1), day(31) };

    /// 8h early shifts for one employee on every March day but the ones skipped
    std::vector<ShiftAssignment> marchShifts(EmployeeId e, std::initializer_list<unsigned> skipped) {
        std::vector<ShiftAssignment> out;
        for (unsigned d = 1; d <= 31; ++d) {
            if (std::find(skipped.begin(), skipped.end(), d) != skipped.end()) {
                continue;
            }
            out.push_back({ e, day(d), 1, "F", 8.0 });
        }
        return out;
    }

} // namespace

// ============================================================================
// SECTION A: CREDITED HOURS
// ============================================================================

/**
 * @test Hours::TrainingWeekCredited
 * @brief Shifts inside a training absence are replaced by the daily credit
 *
 * @scenario 27 shifts of 8h; training "L" Mon 10 .. Sun 16 March, of which
 *           six days carried a shift
 * @then 216 - 6×8 + 7×8 = 224h
 *
 * @covers accountHours(), HourSummary::total()
 */
TEST_CASE("A1: Hours::TrainingWeekCredited", "[hours][credit]")
{
    auto shifts = marchShifts(7, { 1, 2, 16, 30 });
    REQUIRE(shifts.size() == 27);
    std::vector<Absence> absences{ { 7, "L", { day(10), day(16) } } };

    auto s = accountHours(7, kMarch, shifts, absences, CreditRule{});

    REQUIRE(s.employee == 7);
    REQUIRE(s.shiftCount == 21);
    REQUIRE(s.retractedShifts == 6);
    REQUIRE(s.creditedDays == 7);
    REQUIRE(s.shiftHours == Catch::Approx(168.0));
    REQUIRE(s.creditedHours == Catch::Approx(56.0));
    REQUIRE(s.total() == Catch::Approx(224.0));
    REQUIRE(creditedHours(7, kMarch, shifts, absences) == Catch::Approx(224.0));
}

/**
 * @test Hours::NonCreditAbsence
 * @brief Vacation retracts shifts but credits nothing
 *
 * @covers accountHours()
 */
TEST_CASE("A2: Hours::NonCreditAbsence", "[hours][credit]")
{
    auto shifts = marchShifts(7, { 1, 2, 16, 30 });
    std::vector<Absence> absences{ { 7, "U", { day(10), day(16) } } };

    auto s = accountHours(7, kMarch, shifts, absences, CreditRule{});
    REQUIRE(s.retractedShifts == 6);
    REQUIRE(s.creditedDays == 0);
    REQUIRE(s.total() == Catch::Approx(168.0));
}

/**
 * @test Hours::OverlappingCreditCountsOnce
 * @brief Two overlapping training absences credit the union of their days
 *
 * @covers accountHours()
 */
TEST_CASE("A3: Hours::OverlappingCreditCountsOnce", "[hours][credit]")
{
    std::vector<Absence> absences{
        { 7, "L", { day(3), day(6) } },
        { 7, "L", { day(5), day(8) } },
    };

    auto s = accountHours(7, kMarch, {}, absences, CreditRule{});
    REQUIRE(s.creditedDays == 6);
    REQUIRE(s.total() == Catch::Approx(48.0));
}

/**
 * @test Hours::CustomCreditRule
 * @brief The credited type and the hours per day are configurable
 *
 * @covers accountHours(), CreditRule
 */
TEST_CASE("A4: Hours::CustomCreditRule", "[hours][credit]")
{
    std::vector<Absence> absences{
        { 7, "L", { day(3), day(4) } },
        { 7, "SEM", { day(10), day(12) } },
    };
    CreditRule rule{ "SEM", 7.5 };

    auto s = accountHours(7, kMarch, {}, absences, rule);
    REQUIRE(s.creditedDays == 3);
    REQUIRE(s.creditedHours == Catch::Approx(22.5));
}

// ============================================================================
// SECTION B: WINDOWS AND EDGE CASES
// ============================================================================

/**
 * @test Window::StraddlingAbsenceClipped
 * @brief Only the days of an absence inside the window are credited
 *
 * @scenario Training 26 Feb .. 3 Mar, window is March
 * @then Three credited days
 *
 * @covers accountHours()
 */
TEST_CASE("B1: Window::StraddlingAbsenceClipped", "[hours][window]")
{
    std::vector<Absence> absences{ { 7, "L", { makeDate(2025, 2, 26), day(3) } } };

    auto s = accountHours(7, kMarch, {}, absences, CreditRule{});
    REQUIRE(s.creditedDays == 3);
    REQUIRE(s.total() == Catch::Approx(24.0));
}

/**
 * @test Window::OtherEmployeesAndDatesIgnored
 * @brief Assignments outside the window or of someone else do not count
 *
 * @covers accountHours(), summarize()
 */
TEST_CASE("B2: Window::OtherEmployeesAndDatesIgnored", "[hours][window]")
{
    std::vector<ShiftAssignment> shifts{
        { 7, day(3), 1, "F", 8.0 },
        { 7, makeDate(2025, 4, 1), 1, "F", 8.0 },
        { 8, day(3), 2, "S", 8.0 },
        { 8, day(4), 3, "N", 8.0 },
    };
    std::vector<Absence> absences{ { 8, "AU", { day(4), day(4) } } };
    std::vector<Employee> employees{ fixtures::employee(7, 1), fixtures::employee(8, 1) };

    auto all = summarize(kMarch, employees, shifts, absences);
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].employee == 7);
    REQUIRE(all[0].total() == Catch::Approx(8.0));
    REQUIRE(all[1].shiftCount == 1);
    REQUIRE(all[1].retractedShifts == 1);
    REQUIRE(all[1].total() == Catch::Approx(8.0));
}

/**
 * @test Window::InvalidWindowThrows
 * @brief A window that ends before it starts is rejected
 *
 * @covers accountHours()
 */
TEST_CASE("B3: Window::InvalidWindowThrows", "[hours][window]")
{
    DateRange backwards{ day(10), day(5) };
    REQUIRE_THROWS_AS(accountHours(7, backwards, {}, {}, CreditRule{}), std::invalid_argument);
}

// ============================================================================
// SECTION C: ACTIVITY BUCKETS
// ============================================================================

/**
 * @test Activity::ThreeDisjointBuckets
 * @brief Employees split into planning-active, system-only and inactive
 *
 * @scenario {1 active, no team}, {2 active, team 1}, {3 active, no team},
 *           {4 inactive, team 1}
 * @then system-active 3, planning-active 1, inactive 1, total 4
 *
 * @covers classifyActivity()
 */
TEST_CASE("C1: Activity::ThreeDisjointBuckets", "[hours][activity]")
{
    std::vector<Employee> employees{
        fixtures::employee(1, std::nullopt),
        fixtures::employee(2, 1),
        fixtures::employee(3, std::nullopt),
        fixtures::employee(4, 1, false),
    };

    auto snap = classifyActivity(employees);
    REQUIRE(snap.systemActive() == 3);
    REQUIRE(snap.planningActive() == 1);
    REQUIRE(snap.activeWithoutTeam == 2);
    REQUIRE(snap.inactive == 1);
    REQUIRE(snap.total() == 4);
}

/**
 * @test Activity::ResolvedFromInstance
 * @brief Team membership resolved by the instance gives the same buckets
 *
 * @covers classifyActivity(const ProblemInstance&)
 */
TEST_CASE("C2: Activity::ResolvedFromInstance", "[hours][activity]")
{
    auto in = fixtures::week();
    in.employees[2].active = false;
    in.employees.push_back(fixtures::employee(5, std::nullopt));
    auto inst = ProblemInstance::build(in);

    auto snap = classifyActivity(inst);
    REQUIRE(snap.planningActive() == 3);
    REQUIRE(snap.activeWithoutTeam == 1);
    REQUIRE(snap.inactive == 1);
    REQUIRE(snap.total() == 5);
}
