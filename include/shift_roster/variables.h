#pragma once
/*
===============================================================================
VARIABLES — Sparse, index-keyed containers of Gurobi variables
===============================================================================

OVERVIEW
--------
Roster models are sparse: an (employee, day, shift) triple only gets a
variable when it is an assignment candidate. Variables are therefore kept in
IndexedVariableSet, a flat list of (GRBVar, index tuple) entries with an O(1)
hash lookup, and registered by family in an enum-keyed VariableTable.

KEY COMPONENTS
--------------
• IndexedVariableSet — variables keyed by an integer tuple, e.g. (e, d, s)
• VariableFactory    — creates sets over a domain, or appends single entries
• VariableTable      — one IndexedVariableSet per RosterVar family
• value(), isSet()   — solution extraction

USAGE EXAMPLES
--------------
    std::vector<std::array<int, 3>> domain = { {0, 0, 1}, {0, 1, 2} };
    auto X = VariableFactory::addIndexed(model, GRB_BINARY, 0, 1, "x", domain);

    GRBVar& x = X.at(0, 1, 2);
    if (const GRBVar* y = X.try_get(4, 4, 4)) { ... }   // nullptr: no candidate

    vars.set(RosterVar::Assign, std::move(X));
    GRBVar& same = vars.var(RosterVar::Assign, 0, 1, 2);

NAMING
------
Variable names come from make_name::math (debug builds only): "x[0,1,2]".

THREAD SAFETY
-------------
• Value types; concurrent const access is safe
• Adding variables mutates the GRBModel and needs external synchronization

EXCEPTION SAFETY
----------------
• at(): std::out_of_range when the tuple is absent
• try_get(): noexcept, nullptr when absent
• value(): propagates GRBException when no solution is loaded

===============================================================================
*/

#include <string>
#include <vector>
#include <array>
#include <iterator>
#include <utility>
#include <stdexcept>
#include <type_traits>
#include <format>
#include <unordered_map>

#include "gurobi_c++.h"
#include "naming.h"
#include "enum_utils.h"

namespace roster {

    // ============================================================================
    // INDEXED VARIABLE SET
    // ============================================================================
    /**
     * @class IndexedVariableSet
     * @brief Variables keyed by integer tuples of a fixed arity
     */
    class IndexedVariableSet {
    public:
        /**
         * @struct Entry
         * @brief A variable with its index tuple
         */
        struct Entry {
            GRBVar var;
            std::vector<int> index;
        };

    private:
        std::vector<Entry> entries;
        std::unordered_map<std::string, std::size_t> indexMap;

        static std::string makeKeyFromVector(const std::vector<int>& idx) {
            std::string key;
            for (std::size_t k = 0; k < idx.size(); ++k) {
                if (k > 0) {
                    key.push_back('_');
                }
                key.append(std::to_string(idx[k]));
            }
            return key;
        }

        template<typename... I>
        static std::string makeKey(I... idx) {
            static_assert((std::is_integral_v<I> && ...),
                "IndexedVariableSet::makeKey: indices must be integral");
            return makeKeyFromVector({ static_cast<int>(idx)... });
        }

        /// @throws std::invalid_argument on a duplicate tuple
        void addEntry(GRBVar&& v, std::vector<int>&& idx) {
            std::size_t pos = entries.size();
            if (!indexMap.emplace(makeKeyFromVector(idx), pos).second) {
                throw std::invalid_argument(
                    std::format("IndexedVariableSet: duplicate index {}", makeKeyFromVector(idx)));
            }
            entries.push_back(Entry{ std::move(v), std::move(idx) });
        }

    public:
        IndexedVariableSet() = default;

        [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

        using const_iterator = std::vector<Entry>::const_iterator;

        const_iterator begin() const noexcept { return entries.begin(); }
        const_iterator end() const noexcept { return entries.end(); }

        const std::vector<Entry>& all() const noexcept { return entries; }

        /**
         * @brief Variable at a tuple
         * @throws std::out_of_range if the tuple has no variable
         */
        template<typename... I>
        GRBVar& at(I... idx) {
            std::string key = makeKey(idx...);
            auto it = indexMap.find(key);
            if (it == indexMap.end()) {
                throw std::out_of_range(
                    std::format("IndexedVariableSet::at: index {} not found", key));
            }
            return entries[it->second].var;
        }

        template<typename... I>
        const GRBVar& at(I... idx) const {
            return const_cast<IndexedVariableSet*>(this)->at(idx...);
        }

        template<typename... I>
        GRBVar& operator()(I... idx) { return at(idx...); }

        template<typename... I>
        const GRBVar& operator()(I... idx) const { return at(idx...); }

        /// @brief Variable at a tuple, or nullptr
        template<typename... I>
        const GRBVar* try_get(I... idx) const noexcept {
            try {
                auto it = indexMap.find(makeKey(idx...));
                return it == indexMap.end() ? nullptr : &entries[it->second].var;
            }
            catch (const std::bad_alloc&) {
                return nullptr;
            }
        }

        template<typename... I>
        [[nodiscard]] bool contains(I... idx) const noexcept {
            return try_get(idx...) != nullptr;
        }

        /**
         * @brief Visit every entry in insertion order
         * @tparam Fn callable (const GRBVar&, const std::vector<int>&)
         */
        template<typename Fn>
        void forEach(Fn&& fn) const {
            for (const auto& e : entries) {
                fn(e.var, e.index);
            }
        }

    private:
        friend class VariableFactory;
    };

    // ============================================================================
    // VARIABLE FACTORY
    // ============================================================================
    /**
     * @class VariableFactory
     * @brief Creates variables and files them into IndexedVariableSets
     */
    class VariableFactory {
    public:
        /**
         * @brief One variable per element of a domain of index tuples
         *
         * @param domain Iterable of tuples (std::array<int, N> or std::vector<int>)
         *
         * @example
         *     auto X = VariableFactory::addIndexed(model, GRB_BINARY, 0, 1, "x", candidates);
         */
        template<typename Domain>
        static IndexedVariableSet addIndexed(GRBModel& model,
            char vtype,
            double lb,
            double ub,
            const std::string& baseName,
            const Domain& domain)
        {
            IndexedVariableSet result;
            for (const auto& rawIdx : domain) {
                append(result, model, vtype, lb, ub, baseName,
                    std::vector<int>(std::begin(rawIdx), std::end(rawIdx)));
            }
            return result;
        }

        /**
         * @brief Add a single variable to an existing set
         * @return the new variable
         * @throws std::invalid_argument if idx is already present
         */
        static GRBVar append(IndexedVariableSet& set,
            GRBModel& model,
            char vtype,
            double lb,
            double ub,
            const std::string& baseName,
            std::vector<int> idx)
        {
            GRBVar v = addVarOpt(model, lb, ub, vtype, make_name::math(baseName, idx));
            set.addEntry(GRBVar(v), std::move(idx));
            return v;
        }

    private:
        static GRBVar addVarOpt(GRBModel& model,
            double lb,
            double ub,
            char vtype,
            const std::string& name)
        {
            if constexpr (naming_enabled()) {
                return model.addVar(lb, ub, 0.0, vtype, name);
            }
            else {
                return model.addVar(lb, ub, 0.0, vtype);
            }
        }
    };

    // ============================================================================
    // VARIABLE TABLE
    // ============================================================================
    /**
     * @class VariableTable
     * @brief Enum-keyed registry of variable families
     *
     * @tparam EnumT Enum declared with DECLARE_ENUM_WITH_COUNT
     */
    template<typename EnumT>
    class VariableTable {
    private:
        static constexpr std::size_t MAX = enum_size_v<EnumT>;
        std::array<IndexedVariableSet, MAX> table_;

        static std::size_t checked(EnumT key, const char* where) {
            std::size_t idx = enum_index(key);
            if (idx >= MAX) {
                throw std::out_of_range(std::format("VariableTable::{}: key {} >= {}", where, idx, MAX));
            }
            return idx;
        }

    public:
        void set(EnumT key, IndexedVariableSet&& vars) {
            table_[checked(key, "set")] = std::move(vars);
        }

        IndexedVariableSet& get(EnumT key) { return table_[checked(key, "get")]; }
        const IndexedVariableSet& get(EnumT key) const { return table_[checked(key, "get")]; }

        IndexedVariableSet& operator()(EnumT key) { return get(key); }
        const IndexedVariableSet& operator()(EnumT key) const { return get(key); }

        /// @brief Direct access to one variable of a family
        template<typename... I>
        GRBVar& var(EnumT key, I... idx) { return get(key).at(idx...); }

        template<typename... I>
        const GRBVar& var(EnumT key, I... idx) const { return get(key).at(idx...); }

        /// @brief Total number of variables over all families
        [[nodiscard]] std::size_t totalSize() const noexcept {
            std::size_t n = 0;
            for (const auto& s : table_) {
                n += s.size();
            }
            return n;
        }
    };

    // ============================================================================
    // SOLUTION EXTRACTION
    // ============================================================================

    /**
     * @brief Value of a variable in the loaded solution
     * @throws GRBException if no solution is available
     */
    inline double value(const GRBVar& v) {
        return v.get(GRB_DoubleAttr_X);
    }

    /// @brief Binary variable is 1 in the loaded solution
    inline bool isSet(const GRBVar& v) {
        return value(v) > 0.5;
    }

} // namespace roster
