#pragma once
/*
===============================================================================
HARD CONSTRAINTS — Rules no roster may violate
===============================================================================

OVERVIEW
--------
Adds the business rules that are never relaxed. Each family is registered in
the ConstraintTable under its ConstraintFamily key and named "<family>[...]",
so an IIS member maps straight back to the rule it belongs to.

    family               index      rule
    -------------------  ---------  ------------------------------------------
    OneShiftPerDay       [e,d]      Σ_s x[e,d,s] <= 1
    StaffingMin          [d,s]      Σ_e x[e,d,s] >= min(day class of d)
    StaffingMax          [d,s]      Σ_e x[e,d,s] <= max(day class of d)
    LockedAssignment     [e,d,s]    x[e,d,s] == 1
    WeeklyHoursCeiling   [e,d0]     Σ hours·x over the ISO week starting at
                                    horizon day d0 <= ceiling - prior hours
    FloaterReserve       [d]        Σ_{floaters f} Σ_s x[f,d,s] <= floaters - 1

Absence blocking and team eligibility need no constraint: candidate
generation never creates an x for a blocked day or an uncovered shift type.

PRE-CHECK
---------
precheck() runs on the instance alone. When fewer eligible, unblocked
employees exist than a shift's minimum requires, or more locks point at a
shift than its maximum allows, the driver reports INFEASIBLE without ever
building a model.

===============================================================================
*/

#include <map>
#include <vector>
#include <algorithm>
#include <format>

#include "absl/log/log.h"
#include "gurobi_c++.h"

#include "entities.h"
#include "keys.h"
#include "variables.h"
#include "constraints.h"
#include "expressions.h"
#include "diagnostics.h"

namespace roster {

    /**
     * @brief Staffing and lock conflicts visible without a solver
     * @return one reason per violated (day, shift); empty when none found
     */
    inline std::vector<InfeasibilityReason> precheck(const ProblemInstance& inst) {
        std::vector<InfeasibilityReason> reasons;
        const auto plannable = inst.plannableEmployees();

        std::map<std::pair<int, int>, int> lockedPerShift;
        for (const auto& l : inst.locks()) {
            ++lockedPerShift[{ l[1], l[2] }];
        }

        for (int d = 0; d < inst.dayCount(); ++d) {
            const auto& day = inst.days()[static_cast<std::size_t>(d)];
            for (int s : day.activeShifts) {
                const auto& st = inst.shiftTypes()[static_cast<std::size_t>(s)];
                const auto& b = st.bounds(day.dayClass);

                int eligible = static_cast<int>(std::count_if(plannable.begin(), plannable.end(),
                    [&](int e) { return inst.isCandidate(e, d, s); }));

                if (eligible < b.min) {
                    InfeasibilityReason r;
                    r.kind = ReasonKind::StaffingShortfall;
                    r.family = ConstraintFamily::StaffingMin;
                    r.date = day.date;
                    r.shiftCode = st.code;
                    r.message = std::format("shift {} on {} needs {} employees, only {} eligible",
                        st.code, formatDate(day.date), b.min, eligible);
                    reasons.push_back(std::move(r));
                }

                auto it = lockedPerShift.find({ d, s });
                if (it != lockedPerShift.end() && it->second > b.max) {
                    InfeasibilityReason r;
                    r.kind = ReasonKind::LockedOverStaffing;
                    r.family = ConstraintFamily::StaffingMax;
                    r.date = day.date;
                    r.shiftCode = st.code;
                    r.message = std::format("shift {} on {} allows {} employees, {} are locked",
                        st.code, formatDate(day.date), b.max, it->second);
                    reasons.push_back(std::move(r));
                }
            }
        }
        return reasons;
    }

    /**
     * @class HardConstraintBuilder
     * @brief Adds every hard-rule family to a model whose x variables exist
     */
    class HardConstraintBuilder {
    public:
        HardConstraintBuilder(const ProblemInstance& instance,
            const VariableTable<RosterVar>& vars,
            ConstraintTable<ConstraintFamily>& cons)
            : inst_(instance), X_(vars.get(RosterVar::Assign)), cons_(cons) {}

        void build(GRBModel& model) {
            addOneShiftPerDay(model);
            addStaffingBounds(model);
            addLockedAssignments(model);
            addWeeklyHoursCeilings(model);
            addFloaterReserve(model);

            forEachEnum<ConstraintFamily>([&](ConstraintFamily f) {
                if (isHardRule(f)) {
                    VLOG(1) << "hard rule " << familyName(f) << ": " << cons_.count(f) << " constraints";
                }
            });
        }

        void addOneShiftPerDay(GRBModel& model) {
            for (int e : inst_.plannableEmployees()) {
                for (int d = 0; d < inst_.dayCount(); ++d) {
                    auto xs = assignmentsOf(e, d);
                    if (xs.size() < 2) {
                        continue;  // a single candidate cannot double-book
                    }
                    ConstraintFactory::add(model, cons_, ConstraintFamily::OneShiftPerDay, { e, d },
                        sum(xs) <= 1.0);
                }
            }
        }

        void addStaffingBounds(GRBModel& model) {
            const auto plannable = inst_.plannableEmployees();

            for (int d = 0; d < inst_.dayCount(); ++d) {
                const auto& day = inst_.days()[static_cast<std::size_t>(d)];
                for (int s : day.activeShifts) {
                    const auto& b = inst_.shiftTypes()[static_cast<std::size_t>(s)].bounds(day.dayClass);

                    std::vector<GRBVar> xs;
                    for (int e : plannable) {
                        if (const GRBVar* x = X_.try_get(e, d, s)) {
                            xs.push_back(*x);
                        }
                    }

                    GRBLinExpr staffed = sum(xs);
                    if (b.min > 0) {
                        ConstraintFactory::add(model, cons_, ConstraintFamily::StaffingMin, { d, s },
                            staffed >= static_cast<double>(b.min));
                    }
                    if (static_cast<int>(xs.size()) > b.max) {
                        ConstraintFactory::add(model, cons_, ConstraintFamily::StaffingMax, { d, s },
                            staffed <= static_cast<double>(b.max));
                    }
                }
            }
        }

        void addLockedAssignments(GRBModel& model) {
            for (const auto& [e, d, s] : inst_.locks()) {
                ConstraintFactory::add(model, cons_, ConstraintFamily::LockedAssignment, { e, d, s },
                    X_.at(e, d, s) == 1.0);
            }
        }

        /**
         * @brief Weekly hours ceiling per employee and ISO week
         *
         * @details The ceiling is the largest maxWeeklyHours among the shift
         *          types the employee's team covers. Hours worked before the
         *          horizon in the same week lower the right-hand side. Weeks
         *          whose largest possible load cannot exceed the ceiling get
         *          no constraint.
         */
        void addWeeklyHoursCeilings(GRBModel& model) {
            for (int e : inst_.plannableEmployees()) {
                double ceiling = 0.0;
                for (int s = 0; s < inst_.shiftCount(); ++s) {
                    if (inst_.covers(e, s)) {
                        ceiling = std::max(ceiling, shiftHoursCap(s));
                    }
                }

                for (const auto& [monday, days] : weeks()) {
                    double prior = priorHoursInWeek(e, monday);

                    GRBLinExpr load = 0.0;
                    double maxLoad = 0.0;
                    for (int d : days) {
                        double best = 0.0;
                        for (int s = 0; s < inst_.shiftCount(); ++s) {
                            if (const GRBVar* x = X_.try_get(e, d, s)) {
                                double h = hoursOf(s);
                                load += h * (*x);
                                best = std::max(best, h);
                            }
                        }
                        maxLoad += best;
                    }

                    if (maxLoad + prior <= ceiling) {
                        continue;
                    }
                    ConstraintFactory::add(model, cons_, ConstraintFamily::WeeklyHoursCeiling, { e, days.front() },
                        load <= ceiling - prior);
                }
            }
        }

        /**
         * @brief Keep at least one relief worker unassigned every day
         *
         * @details Counts the plannable floaters. Days on which absences
         *          already keep one of them free get no constraint.
         */
        void addFloaterReserve(GRBModel& model) {
            std::vector<int> floaters;
            for (int e : inst_.plannableEmployees()) {
                if (inst_.floater(e)) {
                    floaters.push_back(e);
                }
            }
            if (floaters.empty()) {
                return;
            }

            const int reserveCap = static_cast<int>(floaters.size()) - 1;
            for (int d = 0; d < inst_.dayCount(); ++d) {
                std::vector<GRBVar> xs;
                int available = 0;
                for (int f : floaters) {
                    auto mine = assignmentsOf(f, d);
                    if (!mine.empty()) {
                        ++available;
                        xs.insert(xs.end(), mine.begin(), mine.end());
                    }
                }
                if (available <= reserveCap) {
                    continue;
                }
                ConstraintFactory::add(model, cons_, ConstraintFamily::FloaterReserve, { d },
                    sum(xs) <= static_cast<double>(reserveCap));
            }
        }

    private:
        std::vector<GRBVar> assignmentsOf(int e, int d) const {
            std::vector<GRBVar> xs;
            for (int s = 0; s < inst_.shiftCount(); ++s) {
                if (const GRBVar* x = X_.try_get(e, d, s)) {
                    xs.push_back(*x);
                }
            }
            return xs;
        }

        double hoursOf(int s) const {
            return inst_.shiftTypes()[static_cast<std::size_t>(s)].hours;
        }

        double shiftHoursCap(int s) const {
            return inst_.shiftTypes()[static_cast<std::size_t>(s)].maxWeeklyHours;
        }

        /// Horizon day indices grouped by the Monday of their ISO week.
        std::map<Date, std::vector<int>> weeks() const {
            std::map<Date, std::vector<int>> out;
            for (int d = 0; d < inst_.dayCount(); ++d) {
                out[weekStart(inst_.days()[static_cast<std::size_t>(d)].date)].push_back(d);
            }
            return out;
        }

        double priorHoursInWeek(int e, Date monday) const {
            double hours = 0.0;
            for (int t = -inst_.lookback(); t < 0; ++t) {
                if (weekStart(inst_.timelineDate(t)) != monday) {
                    continue;
                }
                int s = inst_.priorShift(e, t);
                if (s >= 0) {
                    hours += hoursOf(s);
                }
            }
            return hours;
        }

        const ProblemInstance& inst_;
        const IndexedVariableSet& X_;
        ConstraintTable<ConstraintFamily>& cons_;
    };

} // namespace roster
