#pragma once
/*
===============================================================================
OBJECTIVE — Weighted penalty sum and its post-solve breakdown
===============================================================================

    minimize  Σ_i weight_i · indicator_i       over the whole PenaltyPool

No normalization across families: the tier ordering lives entirely in the
WeightTable (config.h). After a solve, evaluate() reads every indicator once
and reports per-family violation counts and penalty subtotals.

===============================================================================
*/

#include <vector>

#include "gurobi_c++.h"

#include "enum_utils.h"
#include "keys.h"
#include "variables.h"
#include "expressions.h"
#include "penalties.h"

namespace roster {

    /// @brief Σ weight · indicator over every term of the pool
    inline GRBLinExpr assemble(const PenaltyPool& pool) {
        std::vector<GRBVar> vars;
        std::vector<double> weights;
        vars.reserve(pool.size());
        weights.reserve(pool.size());
        for (const auto& t : pool.terms()) {
            vars.push_back(t.indicator);
            weights.push_back(t.weight);
        }
        return weightedSum(vars, weights);
    }

    /**
     * @struct PenaltyTotals
     * @brief Violations and weighted penalty per soft-rule family
     */
    struct PenaltyTotals {
        EnumArray<PenaltyFamily, int> violations{ 0 };
        EnumArray<PenaltyFamily, double> penalty{ 0.0 };

        [[nodiscard]] double total() const noexcept {
            double sum = 0.0;
            for (double p : penalty) {
                sum += p;
            }
            return sum;
        }

        [[nodiscard]] int totalViolations() const noexcept {
            int n = 0;
            for (int v : violations) {
                n += v;
            }
            return n;
        }
    };

    /**
     * @brief Read the loaded solution and break the objective down by family
     *
     * @details A binary indicator counts as a violation when it is set; a
     *          continuous one (fairness deviation) when it is positive.
     * @throws GRBException if no solution is loaded
     */
    inline PenaltyTotals evaluate(const PenaltyPool& pool) {
        constexpr double tolerance = 1e-6;
        PenaltyTotals totals;
        for (const auto& t : pool.terms()) {
            double v = value(t.indicator);
            bool violated = t.family == PenaltyFamily::Fairness ? v > tolerance : v > 0.5;
            if (violated) {
                ++totals.violations[t.family];
                totals.penalty[t.family] += t.weight * v;
            }
        }
        return totals;
    }

} // namespace roster
