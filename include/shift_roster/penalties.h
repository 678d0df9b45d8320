#pragma once
/*
===============================================================================
PENALTIES — Soft rules and the penalty pool
===============================================================================

OVERVIEW
--------
Every soft-rule instance gets its own violation indicator, linked to the
condition it detects, and one PenaltyTerm (family, weight, indicator, label)
in the PenaltyPool. The objective (objective.h) is nothing but the weighted
sum of that pool.

    family            indicator                 link
    ----------------  ------------------------  ---------------------------------
    RestTime          v_rest[e,t,a,b]  binary   v >= w[e,t,a] + w[e,t+1,b] - 1
    ConsecutiveDays   v_streak[e,s,u]  binary   Σ_{k=0..m} w[e,u+k,s] - m <= v
    Fairness          dev[e]           >= 0     dev >= ±(h_e - share_e · H_team)
    MinimumHours      v_hours[e,d0]    binary   target·v >= target - Σ hours·x
    TeamRotation      v_rot[e,k,a,c]   binary   v >= u[e,k,a] + u[e,k+1,c] - 1
                      u_rot[e,k,s]     binary   u >= w[e,d,s] for d in week k

(a, b) is a forbidden transition when the rest between the end of a on one
day and the start of b on the next is under the configured minimum rest.
Sums run over w, never over x, so history days take part through their
pinned indicators (see fabric.h).

Fairness compares every member's hours with a share of the team total
proportional to the number of days the member is available; with equal
availability that is the plain team average.

MinimumHours is only built under MinimumHoursPolicy::Soft.

TeamRotation is only built under RotationPolicy::Soft. With the rotation
order F, N, S an employee who works F in one ISO week should work N, and
only N, in the next; any other shift of the rotation in week k+1 is a
break (c != successor of a).

===============================================================================
*/

#include <string>
#include <vector>
#include <utility>
#include <algorithm>
#include <format>

#include "absl/log/log.h"
#include "gurobi_c++.h"

#include "entities.h"
#include "config.h"
#include "keys.h"
#include "enum_utils.h"
#include "variables.h"
#include "constraints.h"
#include "expressions.h"
#include "fabric.h"

namespace roster {

    // ============================================================================
    // PENALTY POOL
    // ============================================================================

    struct PenaltyTerm {
        PenaltyFamily family;
        double weight = 0.0;
        GRBVar indicator;
        std::string label;
    };

    /**
     * @class PenaltyPool
     * @brief Weighted violation terms consumed by the objective
     */
    class PenaltyPool {
    public:
        void add(PenaltyTerm term) {
            ++counts_[term.family];
            terms_.push_back(std::move(term));
        }

        [[nodiscard]] const std::vector<PenaltyTerm>& terms() const noexcept { return terms_; }
        [[nodiscard]] std::size_t size() const noexcept { return terms_.size(); }
        [[nodiscard]] bool empty() const noexcept { return terms_.empty(); }

        /// @brief Number of terms of one family
        [[nodiscard]] std::size_t count(PenaltyFamily f) const noexcept { return counts_[f]; }

    private:
        std::vector<PenaltyTerm> terms_;
        EnumArray<PenaltyFamily, std::size_t> counts_{ 0 };
    };

    // ============================================================================
    // FORBIDDEN TRANSITIONS
    // ============================================================================

    /**
     * @brief Rest in hours between shift a on one day and shift b on the next
     *
     * @details Negative when a, ending after midnight, overlaps b.
     */
    [[nodiscard]] inline double restHoursBetween(const ShiftType& a, const ShiftType& b) noexcept {
        double endOfA = a.start.minutes + a.hours * 60.0;
        double startOfB = 24.0 * 60.0 + b.start.minutes;
        return (startOfB - endOfA) / 60.0;
    }

    /**
     * @brief Ordered (a, b) shift index pairs that leave less than minRestHours
     *
     * @example With the standard rotation and 11 h: S->F, N->F, N->S.
     */
    inline std::vector<std::pair<int, int>> forbiddenTransitions(const std::vector<ShiftType>& shiftTypes,
        double minRestHours)
    {
        std::vector<std::pair<int, int>> out;
        const int n = static_cast<int>(shiftTypes.size());
        for (int a = 0; a < n; ++a) {
            for (int b = 0; b < n; ++b) {
                if (restHoursBetween(shiftTypes[static_cast<std::size_t>(a)],
                        shiftTypes[static_cast<std::size_t>(b)]) < minRestHours) {
                    out.emplace_back(a, b);
                }
            }
        }
        return out;
    }

    // ============================================================================
    // PENALTY BUILDER
    // ============================================================================

    /**
     * @class PenaltyBuilder
     * @brief Adds the soft-rule families and fills the penalty pool
     *
     * @note Requires the fabric (x and w) to be complete.
     */
    class PenaltyBuilder {
    public:
        PenaltyBuilder(const ProblemInstance& instance,
            const SolverConfig& config,
            const VariableFabric& fabric,
            VariableTable<RosterVar>& vars,
            ConstraintTable<ConstraintFamily>& cons,
            PenaltyPool& pool)
            : inst_(instance), cfg_(config), fabric_(fabric), vars_(vars), cons_(cons), pool_(pool) {}

        void build(GRBModel& model) {
            addRestTime(model);
            addConsecutiveDays(model);
            addFairness(model);
            if (cfg_.minimumHours == MinimumHoursPolicy::Soft) {
                addMinimumHours(model);
            }
            if (cfg_.rotation == RotationPolicy::Soft) {
                addTeamRotation(model);
            }
            checkTierDominance();

            forEachEnum<PenaltyFamily>([&](PenaltyFamily f) {
                VLOG(1) << "soft rule " << familyName(f) << ": " << pool_.count(f) << " penalty terms";
            });
        }

        void addRestTime(GRBModel& model) {
            const auto forbidden = forbiddenTransitions(inst_.shiftTypes(), cfg_.minimumRestHours);
            const auto& W = vars_.get(RosterVar::Works);
            const double weight = cfg_.weights.of(PenaltyFamily::RestTime);
            const std::string base(familyName(RosterVar::RestViolation));
            IndexedVariableSet V;

            for (int e : inst_.plannableEmployees()) {
                for (int t = -1; t + 1 < inst_.dayCount(); ++t) {
                    for (const auto& [a, b] : forbidden) {
                        if (fabric_.knownIdle(e, t, a) || fabric_.knownIdle(e, t + 1, b)) {
                            continue;
                        }
                        GRBVar v = VariableFactory::append(V, model, GRB_BINARY, 0.0, 1.0, base, { e, t, a, b });
                        ConstraintFactory::add(model, cons_, ConstraintFamily::RestLink, { e, t, a, b },
                            v >= W.at(e, t, a) + W.at(e, t + 1, b) - 1.0);

                        pool_.add({ PenaltyFamily::RestTime, weight, v,
                            std::format("rest {}->{} employee {} {}", codeOf(a), codeOf(b),
                                employeeId(e), formatDate(inst_.timelineDate(t + 1))) });
                    }
                }
            }
            vars_.set(RosterVar::RestViolation, std::move(V));
        }

        /**
         * @brief One indicator per window of maxConsecutiveDays + 1 days
         *
         * @details Windows end inside the horizon and may start in the
         *          history. A window containing a day on which the shift is
         *          known not to be worked can never be full and is skipped.
         */
        void addConsecutiveDays(GRBModel& model) {
            const auto& W = vars_.get(RosterVar::Works);
            const double weight = cfg_.weights.of(PenaltyFamily::ConsecutiveDays);
            const std::string base(familyName(RosterVar::StreakViolation));
            IndexedVariableSet V;

            for (int e : inst_.plannableEmployees()) {
                for (int s = 0; s < inst_.shiftCount(); ++s) {
                    const int m = inst_.shiftTypes()[static_cast<std::size_t>(s)].maxConsecutiveDays;

                    for (int u = -m; u + m < inst_.dayCount(); ++u) {
                        if (u < -inst_.lookback()) {
                            continue;
                        }

                        bool possible = true;
                        std::vector<GRBVar> window;
                        for (int k = 0; k <= m && possible; ++k) {
                            possible = !fabric_.knownIdle(e, u + k, s);
                            window.push_back(W.at(e, u + k, s));
                        }
                        if (!possible) {
                            continue;
                        }

                        GRBVar v = VariableFactory::append(V, model, GRB_BINARY, 0.0, 1.0, base, { e, s, u });
                        ConstraintFactory::add(model, cons_, ConstraintFamily::StreakLink, { e, s, u },
                            sum(window) - static_cast<double>(m) <= v);

                        pool_.add({ PenaltyFamily::ConsecutiveDays, weight, v,
                            std::format("{} x{} employee {} ending {}", codeOf(s), m + 1,
                                employeeId(e), formatDate(inst_.timelineDate(u + m))) });
                    }
                }
            }
            vars_.set(RosterVar::StreakViolation, std::move(V));
        }

        void addFairness(GRBModel& model) {
            const double weight = cfg_.weights.of(PenaltyFamily::Fairness);
            const std::string base(familyName(RosterVar::HoursDeviation));
            IndexedVariableSet V;

            std::vector<std::vector<int>> members(inst_.teams().size());
            for (int e : inst_.plannableEmployees()) {
                if (availableDays(e, 0, inst_.dayCount()) > 0) {
                    members[static_cast<std::size_t>(inst_.teamIndexOf(e))].push_back(e);
                }
            }

            for (std::size_t t = 0; t < members.size(); ++t) {
                const auto& team = members[t];
                if (team.size() < 2) {
                    continue;
                }

                double teamDays = 0.0;
                for (int e : team) {
                    teamDays += availableDays(e, 0, inst_.dayCount());
                }
                GRBLinExpr teamHours = sum(team, [&](int e) { return hoursExpr(e, 0, inst_.dayCount()); });

                for (int e : team) {
                    double share = availableDays(e, 0, inst_.dayCount()) / teamDays;
                    GRBLinExpr gap = hoursExpr(e, 0, inst_.dayCount()) - share * teamHours;

                    GRBVar dev = VariableFactory::append(V, model, GRB_CONTINUOUS, 0.0, GRB_INFINITY, base, { e });
                    ConstraintFactory::add(model, cons_, ConstraintFamily::FairnessLink, { e, 0 }, dev >= gap);
                    ConstraintFactory::add(model, cons_, ConstraintFamily::FairnessLink, { e, 1 }, dev >= -gap);

                    pool_.add({ PenaltyFamily::Fairness, weight, dev,
                        std::format("hours deviation employee {} team {}", employeeId(e),
                            inst_.teams()[t].name) });
                }
            }
            vars_.set(RosterVar::HoursDeviation, std::move(V));
        }

        /**
         * @brief Weekly hours under the nominal target, per employee and ISO week
         *
         * @details target = smallest nominal weeklyHours of the team's shift
         *          types, scaled by the available days of that week / 7.
         */
        void addMinimumHours(GRBModel& model) {
            const double weight = cfg_.weights.of(PenaltyFamily::MinimumHours);
            const std::string base(familyName(RosterVar::HoursShortfall));
            IndexedVariableSet V;

            for (int e : inst_.plannableEmployees()) {
                double nominal = -1.0;
                for (int s = 0; s < inst_.shiftCount(); ++s) {
                    if (inst_.covers(e, s)) {
                        double h = inst_.shiftTypes()[static_cast<std::size_t>(s)].weeklyHours;
                        nominal = nominal < 0.0 ? h : std::min(nominal, h);
                    }
                }
                if (nominal <= 0.0) {
                    continue;
                }

                int d0 = 0;
                while (d0 < inst_.dayCount()) {
                    Date monday = weekStart(inst_.days()[static_cast<std::size_t>(d0)].date);
                    int d1 = d0;
                    while (d1 < inst_.dayCount() && weekStart(inst_.days()[static_cast<std::size_t>(d1)].date) == monday) {
                        ++d1;
                    }

                    double target = nominal * availableDays(e, d0, d1) / 7.0;
                    if (target > 0.0) {
                        GRBVar v = VariableFactory::append(V, model, GRB_BINARY, 0.0, 1.0, base, { e, d0 });
                        ConstraintFactory::add(model, cons_, ConstraintFamily::MinimumHoursLink, { e, d0 },
                            target * v >= target - hoursExpr(e, d0, d1));

                        pool_.add({ PenaltyFamily::MinimumHours, weight, v,
                            std::format("under {:.1f}h employee {} week of {}", target,
                                employeeId(e), formatDate(monday)) });
                    }
                    d0 = d1;
                }
            }
            vars_.set(RosterVar::HoursShortfall, std::move(V));
        }

        /**
         * @brief Week-to-week changes against the configured rotation order
         *
         * @details Weeks are the ISO weeks intersecting the horizon, k counted
         *          from the first. The rule is skipped with a warning when a
         *          rotation code names no shift type of the instance.
         */
        void addTeamRotation(GRBModel& model) {
            std::vector<int> order;
            for (const auto& code : cfg_.rotationOrder) {
                auto it = std::find_if(inst_.shiftTypes().begin(), inst_.shiftTypes().end(),
                    [&](const ShiftType& st) { return st.code == code; });
                if (it == inst_.shiftTypes().end()) {
                    LOG(WARNING) << "rotation order names unknown shift code '" << code << "'; rule skipped";
                    return;
                }
                order.push_back(static_cast<int>(it - inst_.shiftTypes().begin()));
            }

            std::vector<std::pair<int, int>> weeks;   // [d0, d1)
            for (int d0 = 0; d0 < inst_.dayCount();) {
                Date monday = weekStart(inst_.days()[static_cast<std::size_t>(d0)].date);
                int d1 = d0;
                while (d1 < inst_.dayCount() && weekStart(inst_.days()[static_cast<std::size_t>(d1)].date) == monday) {
                    ++d1;
                }
                weeks.emplace_back(d0, d1);
                d0 = d1;
            }
            if (weeks.size() < 2) {
                return;
            }

            const auto& W = vars_.get(RosterVar::Works);
            const double weight = cfg_.weights.of(PenaltyFamily::TeamRotation);
            IndexedVariableSet U;
            IndexedVariableSet V;
            const std::string uBase(familyName(RosterVar::RotationWeek));
            const std::string vBase(familyName(RosterVar::RotationBreak));

            for (int e : inst_.plannableEmployees()) {
                for (int k = 0; k < static_cast<int>(weeks.size()); ++k) {
                    const auto [d0, d1] = weeks[static_cast<std::size_t>(k)];
                    for (int s : order) {
                        std::vector<int> days;
                        for (int d = d0; d < d1; ++d) {
                            if (!fabric_.knownIdle(e, d, s)) {
                                days.push_back(d);
                            }
                        }
                        if (days.empty()) {
                            continue;
                        }
                        GRBVar u = VariableFactory::append(U, model, GRB_BINARY, 0.0, 1.0, uBase, { e, k, s });
                        for (int d : days) {
                            ConstraintFactory::add(model, cons_, ConstraintFamily::RotationLink, { e, d, s },
                                u >= W.at(e, d, s));
                        }
                    }
                }

                for (int k = 0; k + 1 < static_cast<int>(weeks.size()); ++k) {
                    for (std::size_t i = 0; i < order.size(); ++i) {
                        const int a = order[i];
                        const int next = order[(i + 1) % order.size()];
                        const GRBVar* ua = U.try_get(e, k, a);
                        if (ua == nullptr) {
                            continue;
                        }
                        for (int c : order) {
                            const GRBVar* uc = U.try_get(e, k + 1, c);
                            if (c == next || uc == nullptr) {
                                continue;
                            }
                            GRBVar v = VariableFactory::append(V, model, GRB_BINARY, 0.0, 1.0, vBase, { e, k, a, c });
                            ConstraintFactory::add(model, cons_, ConstraintFamily::RotationLink, { e, k, a, c },
                                v >= *ua + *uc - 1.0);

                            pool_.add({ PenaltyFamily::TeamRotation, weight, v,
                                std::format("rotation {}->{} employee {} week of {}", codeOf(a), codeOf(c),
                                    employeeId(e), formatDate(weekStart(
                                        inst_.days()[static_cast<std::size_t>(weeks[static_cast<std::size_t>(k + 1)].first)].date))) });
                        }
                    }
                }
            }
            vars_.set(RosterVar::RotationWeek, std::move(U));
            vars_.set(RosterVar::RotationBreak, std::move(V));
        }

    private:
        /// Horizon days in [d0, d1) with at least one candidate for e.
        double availableDays(int e, int d0, int d1) const {
            int n = 0;
            for (int d = d0; d < d1; ++d) {
                for (int s = 0; s < inst_.shiftCount(); ++s) {
                    if (inst_.isCandidate(e, d, s)) {
                        ++n;
                        break;
                    }
                }
            }
            return static_cast<double>(n);
        }

        GRBLinExpr hoursExpr(int e, int d0, int d1) const {
            const auto& X = vars_.get(RosterVar::Assign);
            GRBLinExpr expr = 0.0;
            for (int d = d0; d < d1; ++d) {
                for (int s = 0; s < inst_.shiftCount(); ++s) {
                    if (const GRBVar* x = X.try_get(e, d, s)) {
                        expr += inst_.shiftTypes()[static_cast<std::size_t>(s)].hours * (*x);
                    }
                }
            }
            return expr;
        }

        /**
         * @brief Warn when the fairness tier could outweigh one rest violation
         *
         * @details Every hour moved between two members changes at most two
         *          deviations, so twice the largest assignable load bounds the
         *          fairness total.
         */
        void checkTierDominance() const {
            double maxHours = 0.0;
            for (int e : inst_.plannableEmployees()) {
                for (int d = 0; d < inst_.dayCount(); ++d) {
                    double best = 0.0;
                    for (int s = 0; s < inst_.shiftCount(); ++s) {
                        if (inst_.isCandidate(e, d, s)) {
                            best = std::max(best, inst_.shiftTypes()[static_cast<std::size_t>(s)].hours);
                        }
                    }
                    maxHours += best;
                }
            }

            double fairnessBound = 2.0 * cfg_.weights.fairness * maxHours;
            if (pool_.count(PenaltyFamily::Fairness) > 0 && fairnessBound >= cfg_.weights.restTime) {
                LOG(WARNING) << "fairness penalties can reach " << fairnessBound
                             << ", not dominated by one rest-time violation (" << cfg_.weights.restTime << ")";
            }
        }

        const std::string& codeOf(int s) const {
            return inst_.shiftTypes()[static_cast<std::size_t>(s)].code;
        }

        EmployeeId employeeId(int e) const {
            return inst_.employees()[static_cast<std::size_t>(e)].id;
        }

        const ProblemInstance& inst_;
        const SolverConfig& cfg_;
        const VariableFabric& fabric_;
        VariableTable<RosterVar>& vars_;
        ConstraintTable<ConstraintFamily>& cons_;
        PenaltyPool& pool_;
    };

} // namespace roster
