#pragma once
/*
===============================================================================
EXPRESSIONS — Helpers for building GRBLinExpr
===============================================================================

    sum(range, f)        Σ_{i in range} f(i), f returns GRBVar, GRBLinExpr or double
    sum(vars)            Σ v over a vector of variables
    weightedSum(v, c)    Σ c_i v_i
    sum(set)             Σ over every variable of an IndexedVariableSet

Each call builds a fresh expression; nothing is cached.

===============================================================================
*/

#include <vector>
#include <stdexcept>
#include <format>

#include "gurobi_c++.h"
#include "variables.h"

namespace roster {

    namespace expr_detail {

        inline void add_term(GRBLinExpr& acc, const GRBVar& v) { acc += v; }
        inline void add_term(GRBLinExpr& acc, const GRBLinExpr& e) { acc += e; }
        inline void add_term(GRBLinExpr& acc, double c) { acc += c; }

    } // namespace expr_detail

    /**
     * @brief Sum a term generator over a range
     *
     * @example
     *     auto load = sum(days, [&](int d) { return hours[s] * X(e, d, s); });
     */
    template<typename Range, typename Func>
    GRBLinExpr sum(const Range& range, Func&& f) {
        GRBLinExpr expr = 0.0;
        for (const auto& i : range) {
            expr_detail::add_term(expr, f(i));
        }
        return expr;
    }

    inline GRBLinExpr sum(const std::vector<GRBVar>& vars) {
        GRBLinExpr expr = 0.0;
        for (const auto& v : vars) {
            expr += v;
        }
        return expr;
    }

    /**
     * @brief Weighted sum Σ coeffs[i] * vars[i]
     * @throws std::invalid_argument on a size mismatch
     */
    inline GRBLinExpr weightedSum(const std::vector<GRBVar>& vars, const std::vector<double>& coeffs) {
        if (vars.size() != coeffs.size()) {
            throw std::invalid_argument(
                std::format("weightedSum: {} variables but {} coefficients", vars.size(), coeffs.size()));
        }
        GRBLinExpr expr = 0.0;
        if (!vars.empty()) {
            expr.addTerms(coeffs.data(), vars.data(), static_cast<int>(vars.size()));
        }
        return expr;
    }

    inline GRBLinExpr sum(const IndexedVariableSet& set) {
        GRBLinExpr expr = 0.0;
        for (const auto& e : set) {
            expr += e.var;
        }
        return expr;
    }

} // namespace roster
