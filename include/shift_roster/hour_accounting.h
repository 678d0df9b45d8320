#pragma once
/*
===============================================================================
HOUR ACCOUNTING — Worked and credited hours of a published roster
===============================================================================

OVERVIEW
--------
Reporting only; nothing here feeds back into the model and nothing here
touches the solver.

For one employee and a reporting window [first, last]:

    total = Σ hours of assignments in the window not on an absence day
          + credit.hoursPerDay × |credit-type absence days ∩ window|

    * An assignment on a day covered by any absence of the employee is
      retracted: it counts zero and is reported in retractedShifts.
    * Credit days are a set of dates, so overlapping credit-type absences
      count each day once.
    * Absences of any other type contribute nothing.

Example: 27 shifts of 8h (216h), then a Mon-Sun training absence over six of
those shifts: 216 - 6×8 + 7×8 = 224h.

classifyActivity() splits employees into three disjoint buckets:

    activeWithTeam     available for shift planning
    activeWithoutTeam  active in the system, never rostered
    inactive           deactivated, with or without team

===============================================================================
*/

#include <set>
#include <vector>
#include <stdexcept>
#include <format>

#include "calendar.h"
#include "entities.h"
#include "config.h"

namespace roster {

    // ============================================================================
    // CREDITED HOURS
    // ============================================================================

    struct HourSummary {
        EmployeeId employee = 0;
        double shiftHours = 0.0;          ///< assignments kept in the window
        double creditedHours = 0.0;       ///< credit-type absence days × hours per day
        int shiftCount = 0;
        int creditedDays = 0;
        int retractedShifts = 0;          ///< assignments dropped for an absence

        [[nodiscard]] double total() const noexcept { return shiftHours + creditedHours; }
    };

    /**
     * @brief Hours of one employee over a reporting window
     * @throws std::invalid_argument if the window ends before it starts
     */
    inline HourSummary accountHours(EmployeeId employee,
        const DateRange& window,
        const std::vector<ShiftAssignment>& assignments,
        const std::vector<Absence>& absences,
        const CreditRule& credit)
    {
        if (!window.valid()) {
            throw std::invalid_argument(std::format("accountHours: window {}..{} ends before it starts",
                formatDate(window.first), formatDate(window.last)));
        }

        std::vector<DateRange> blocked;
        std::set<Date> creditDays;
        for (const auto& a : absences) {
            if (a.employee != employee || !a.range.valid()) {
                continue;
            }
            blocked.push_back(a.range);
            if (a.type != credit.absenceType) {
                continue;
            }
            if (auto clip = a.range.intersect(window)) {
                for (Date d : clip->days()) {
                    creditDays.insert(d);
                }
            }
        }

        HourSummary summary;
        summary.employee = employee;

        for (const auto& s : assignments) {
            if (s.employee != employee || !window.contains(s.date)) {
                continue;
            }
            bool retracted = false;
            for (const auto& r : blocked) {
                if (r.contains(s.date)) {
                    retracted = true;
                    break;
                }
            }
            if (retracted) {
                ++summary.retractedShifts;
                continue;
            }
            summary.shiftHours += s.hours;
            ++summary.shiftCount;
        }

        summary.creditedDays = static_cast<int>(creditDays.size());
        summary.creditedHours = credit.hoursPerDay * summary.creditedDays;
        return summary;
    }

    /// @brief Total credited hours of one employee over a window
    inline double creditedHours(EmployeeId employee,
        const DateRange& window,
        const std::vector<ShiftAssignment>& assignments,
        const std::vector<Absence>& absences,
        const CreditRule& credit = {})
    {
        return accountHours(employee, window, assignments, absences, credit).total();
    }

    /**
     * @brief One HourSummary per employee, in the order given
     */
    inline std::vector<HourSummary> summarize(const DateRange& window,
        const std::vector<Employee>& employees,
        const std::vector<ShiftAssignment>& assignments,
        const std::vector<Absence>& absences,
        const CreditRule& credit = {})
    {
        std::vector<HourSummary> out;
        out.reserve(employees.size());
        for (const auto& e : employees) {
            out.push_back(accountHours(e.id, window, assignments, absences, credit));
        }
        return out;
    }

    // ============================================================================
    // ACTIVITY BUCKETS
    // ============================================================================

    struct ActivitySnapshot {
        int activeWithTeam = 0;
        int activeWithoutTeam = 0;
        int inactive = 0;

        /// @brief Employees available for shift planning
        [[nodiscard]] int planningActive() const noexcept { return activeWithTeam; }
        [[nodiscard]] int systemActive() const noexcept { return activeWithTeam + activeWithoutTeam; }
        [[nodiscard]] int total() const noexcept { return systemActive() + inactive; }
    };

    inline ActivitySnapshot classifyActivity(const std::vector<Employee>& employees) {
        ActivitySnapshot snap;
        for (const auto& e : employees) {
            if (!e.active) {
                ++snap.inactive;
            }
            else if (e.team) {
                ++snap.activeWithTeam;
            }
            else {
                ++snap.activeWithoutTeam;
            }
        }
        return snap;
    }

    /// @brief Same buckets, with team membership as resolved by the instance
    inline ActivitySnapshot classifyActivity(const ProblemInstance& inst) {
        ActivitySnapshot snap;
        for (int e = 0; e < inst.employeeCount(); ++e) {
            if (!inst.employees()[static_cast<std::size_t>(e)].active) {
                ++snap.inactive;
            }
            else if (inst.teamIndexOf(e) >= 0) {
                ++snap.activeWithTeam;
            }
            else {
                ++snap.activeWithoutTeam;
            }
        }
        return snap;
    }

} // namespace roster
