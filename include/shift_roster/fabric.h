#pragma once
/*
===============================================================================
FABRIC — Decision variables of the roster model
===============================================================================

OVERVIEW
--------
Two variable families carry the roster:

    x[e,d,s]  Assign   binary, one per assignment candidate (horizon days only)
    w[e,t,s]  Works    binary, one per plannable employee, timeline day
                       t in [-lookback, D) and shift type s

Soft rules (rest time, consecutive days) only ever sum w, never x, so every
element of those sums is a real variable:

    * horizon day with candidates:  w = OR(x_i), written as two implications
          w >= x_i   for every underlying x_i
          w <= Σ x_i
    * horizon day without candidate: w == 0
    * history day (t < 0):           w == 1 if the employee worked s that day,
                                     w == 0 otherwise

Pinned values are equality constraints in the WorksPin family, never bare
constants mixed into a sum.

===============================================================================
*/

#include <array>
#include <string>
#include <vector>
#include <utility>

#include "absl/log/log.h"
#include "gurobi_c++.h"

#include "entities.h"
#include "keys.h"
#include "variables.h"
#include "constraints.h"
#include "expressions.h"

namespace roster {

    struct FabricStats {
        std::size_t assignments = 0;   ///< x variables
        std::size_t indicators = 0;    ///< w variables
        std::size_t linked = 0;        ///< w tied to at least one x
        std::size_t pinned = 0;        ///< w fixed by equality
    };

    /**
     * @class VariableFabric
     * @brief Creates the x and w families and the constraints tying them
     */
    class VariableFabric {
    public:
        VariableFabric(const ProblemInstance& instance,
            VariableTable<RosterVar>& vars,
            ConstraintTable<ConstraintFamily>& cons)
            : inst_(instance), vars_(vars), cons_(cons) {}

        /**
         * @brief One binary x per assignment candidate
         */
        void addAssignments(GRBModel& model) {
            std::vector<std::array<int, 3>> candidates;
            for (int e : inst_.plannableEmployees()) {
                for (int d = 0; d < inst_.dayCount(); ++d) {
                    for (int s = 0; s < inst_.shiftCount(); ++s) {
                        if (inst_.isCandidate(e, d, s)) {
                            candidates.push_back({ e, d, s });
                        }
                    }
                }
            }

            auto X = VariableFactory::addIndexed(model, GRB_BINARY, 0.0, 1.0,
                std::string(familyName(RosterVar::Assign)), candidates);
            stats_.assignments = X.size();
            vars_.set(RosterVar::Assign, std::move(X));
        }

        /**
         * @brief One binary w per (plannable employee, timeline day, shift type)
         *
         * @note Requires addAssignments() first.
         */
        void addIndicators(GRBModel& model) {
            IndexedVariableSet W;
            const auto& X = vars_.get(RosterVar::Assign);
            const std::string base(familyName(RosterVar::Works));

            for (int e : inst_.plannableEmployees()) {
                for (int t = -inst_.lookback(); t < inst_.dayCount(); ++t) {
                    for (int s = 0; s < inst_.shiftCount(); ++s) {
                        GRBVar w = VariableFactory::append(W, model, GRB_BINARY, 0.0, 1.0, base, { e, t, s });

                        if (t < 0) {
                            double worked = inst_.priorShift(e, t) == s ? 1.0 : 0.0;
                            ConstraintFactory::add(model, cons_, ConstraintFamily::WorksPin, { e, t, s }, w == worked);
                            ++stats_.pinned;
                            continue;
                        }

                        std::vector<GRBVar> underlying;
                        if (const GRBVar* x = X.try_get(e, t, s)) {
                            underlying.push_back(*x);
                        }

                        if (underlying.empty()) {
                            ConstraintFactory::add(model, cons_, ConstraintFamily::WorksPin, { e, t, s }, w == 0.0);
                            ++stats_.pinned;
                            continue;
                        }

                        // w <= Σx : w implies some x
                        ConstraintFactory::add(model, cons_, ConstraintFamily::WorksLink, { e, t, s, 0 },
                            w <= sum(underlying));
                        // w >= x_i : each x implies w
                        for (std::size_t i = 0; i < underlying.size(); ++i) {
                            ConstraintFactory::add(model, cons_, ConstraintFamily::WorksLink,
                                { e, t, s, static_cast<int>(i) + 1 }, w >= underlying[i]);
                        }
                        ++stats_.linked;
                    }
                }
            }

            stats_.indicators = W.size();
            vars_.set(RosterVar::Works, std::move(W));

            VLOG(1) << "fabric: " << stats_.assignments << " assignment vars, " << stats_.indicators
                    << " indicators (" << stats_.linked << " linked, " << stats_.pinned << " pinned)";
        }

        /**
         * @brief The indicator w[e,t,s] is fixed to zero by construction
         *
         * @details Lets the penalty builder skip rule instances that can never
         *          fire. The indicator itself exists either way.
         */
        [[nodiscard]] bool knownIdle(int e, int t, int s) const {
            if (t < 0) {
                return inst_.priorShift(e, t) != s;
            }
            return !inst_.isCandidate(e, t, s);
        }

        [[nodiscard]] const FabricStats& stats() const noexcept { return stats_; }

    private:
        const ProblemInstance& inst_;
        VariableTable<RosterVar>& vars_;
        ConstraintTable<ConstraintFamily>& cons_;
        FabricStats stats_;
    };

} // namespace roster
