#pragma once
/*
===============================================================================
CONFIG — Per-solve configuration: weights, policies, budgets
===============================================================================

OVERVIEW
--------
A SolverConfig is built by the caller, validated once and passed by const
reference into every stage of a solve. There is no process-wide "current"
configuration; two solves with different tuning can run side by side.

WEIGHT TABLE
------------
Soft rules are ranked by an explicit constant table. One violation of a
higher tier must outweigh anything the tiers below can contribute:

    tier  family            default     unit
    ----  ----------------  ----------  ---------------------------------
     1    RestTime          1 000 000   per forbidden transition
     2    ConsecutiveDays     100 000   per over-long window
     3    MinimumHours          1 000   per employee-week under target
     4    Fairness                  1   per hour of deviation from team mean
     4    TeamRotation              1   per week-to-week change against the
                                        rotation order

validate() rejects any table that breaks this ordering. TeamRotation is only
bounded by MinimumHours; it competes with Fairness on equal terms.

USAGE
-----
    roster::SolverConfig cfg(120.0);          // time budget is mandatory
    cfg.minimumHours = MinimumHoursPolicy::Soft;
    cfg.weights.fairness = 2.0;
    cfg.validate();

===============================================================================
*/

#include <string>
#include <vector>
#include <format>
#include <utility>

#include "errors.h"
#include "keys.h"

namespace roster {

    /// Weights of the soft rule families. See the tier table above.
    struct WeightTable {
        double restTime = 1'000'000.0;
        double consecutiveDays = 100'000.0;
        double minimumHours = 1'000.0;
        double fairness = 1.0;
        double teamRotation = 1.0;

        [[nodiscard]] double of(PenaltyFamily f) const noexcept {
            switch (f) {
                case PenaltyFamily::RestTime:        return restTime;
                case PenaltyFamily::ConsecutiveDays: return consecutiveDays;
                case PenaltyFamily::MinimumHours:    return minimumHours;
                case PenaltyFamily::Fairness:        return fairness;
                case PenaltyFamily::TeamRotation:    return teamRotation;
                case PenaltyFamily::COUNT:           break;
            }
            return 0.0;
        }
    };

    /// How the legacy weekly minimum-hours rule takes part in the model.
    enum class MinimumHoursPolicy {
        Disabled,   ///< not modelled
        Soft        ///< penalized under the MinimumHours weight
    };

    /// Whether the weekly shift rotation order is encouraged.
    enum class RotationPolicy {
        Disabled,
        Soft        ///< penalized under the TeamRotation weight
    };

    /**
     * @struct CreditRule
     * @brief Absence type that counts as worked time in hour reports
     */
    struct CreditRule {
        std::string absenceType = "L";
        double hoursPerDay = 8.0;
    };

    /**
     * @struct SolverConfig
     * @brief Immutable input of one solve besides the problem instance
     */
    struct SolverConfig {
        /// @param budgetSeconds wall-clock budget of the solve, must be > 0
        explicit SolverConfig(double budgetSeconds) : timeBudgetSeconds(budgetSeconds) {}

        WeightTable weights;
        MinimumHoursPolicy minimumHours = MinimumHoursPolicy::Disabled;
        RotationPolicy rotation = RotationPolicy::Disabled;
        std::vector<std::string> rotationOrder{ "F", "N", "S" };   ///< shift codes, cyclic

        double timeBudgetSeconds;
        int threads = 0;             ///< 0 lets the solver decide
        int seed = 0;
        double mipGap = 1e-4;
        bool solverOutput = false;

        double minimumRestHours = 11.0;
        CreditRule credit;

        /**
         * @brief Check budgets and the weight ordering
         * @throws ModelConstructionError listing every problem found
         */
        void validate() const {
            std::vector<std::string> issues;

            if (!(timeBudgetSeconds > 0.0)) {
                issues.push_back(std::format("time budget must be positive, got {}", timeBudgetSeconds));
            }
            if (threads < 0) {
                issues.push_back(std::format("thread count must not be negative, got {}", threads));
            }
            if (seed < 0) {
                issues.push_back(std::format("seed must not be negative, got {}", seed));
            }
            if (mipGap < 0.0) {
                issues.push_back(std::format("MIP gap must not be negative, got {}", mipGap));
            }
            if (minimumRestHours < 0.0) {
                issues.push_back(std::format("minimum rest must not be negative, got {}h", minimumRestHours));
            }
            if (!(credit.hoursPerDay >= 0.0)) {
                issues.push_back(std::format("credited hours per day must not be negative, got {}", credit.hoursPerDay));
            }

            const auto& w = weights;
            if (w.fairness < 0.0) {
                issues.push_back("fairness weight must not be negative");
            }
            if (!(w.restTime > w.consecutiveDays)) {
                issues.push_back(std::format("rest-time weight {} must exceed consecutive-days weight {}",
                    w.restTime, w.consecutiveDays));
            }
            if (!(w.consecutiveDays > w.minimumHours)) {
                issues.push_back(std::format("consecutive-days weight {} must exceed minimum-hours weight {}",
                    w.consecutiveDays, w.minimumHours));
            }
            if (!(w.minimumHours >= w.fairness)) {
                issues.push_back(std::format("minimum-hours weight {} must not be below fairness weight {}",
                    w.minimumHours, w.fairness));
            }

            if (w.teamRotation < 0.0 || w.teamRotation > w.minimumHours) {
                issues.push_back(std::format("team-rotation weight {} must lie in [0, {}]",
                    w.teamRotation, w.minimumHours));
            }
            if (rotation == RotationPolicy::Soft) {
                for (std::size_t i = 0; i < rotationOrder.size(); ++i) {
                    for (std::size_t j = i + 1; j < rotationOrder.size(); ++j) {
                        if (rotationOrder[i] == rotationOrder[j]) {
                            issues.push_back(std::format("rotation order lists '{}' twice", rotationOrder[i]));
                        }
                    }
                }
                if (rotationOrder.size() < 2) {
                    issues.push_back("rotation order needs at least two shift codes");
                }
            }

            if (!issues.empty()) {
                throw ModelConstructionError(std::move(issues));
            }
        }
    };

} // namespace roster
