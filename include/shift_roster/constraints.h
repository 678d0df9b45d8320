#pragma once
/*
===============================================================================
CONSTRAINTS — Constraint registry keyed by constraint family
===============================================================================

OVERVIEW
--------
Mirrors variables.h for constraints. Every constraint the engine adds goes
through ConstraintFactory, which

    * names it "<family>[i,j,...]" with force_name:: (always, also in
      release builds) so an IIS member can be traced to its family,
    * files it into the IndexedConstraintSet of its ConstraintFamily.

KEY COMPONENTS
--------------
• IndexedConstraintSet — constraints keyed by integer tuples
• ConstraintFactory    — add(model, table, family, index, temp constraint)
• ConstraintTable      — one IndexedConstraintSet per family, plus counts

USAGE EXAMPLES
--------------
    ConstraintTable<ConstraintFamily> cons;
    ConstraintFactory::add(model, cons, ConstraintFamily::StaffingMin,
        { d, s }, sum(...) >= bounds.min);

    cons.count(ConstraintFamily::StaffingMin);   // constraints in the family

THREAD SAFETY
-------------
• Value types; mutation needs external synchronization

EXCEPTION SAFETY
----------------
• Duplicate index in one family: std::invalid_argument
• Gurobi failures propagate as GRBException

===============================================================================
*/

#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <stdexcept>
#include <format>
#include <unordered_map>

#include "gurobi_c++.h"
#include "naming.h"
#include "enum_utils.h"
#include "keys.h"

namespace roster {

    // ============================================================================
    // INDEXED CONSTRAINT SET
    // ============================================================================
    /**
     * @class IndexedConstraintSet
     * @brief Constraints keyed by integer tuples
     */
    class IndexedConstraintSet {
    public:
        struct Entry {
            GRBConstr constr;
            std::vector<int> index;
        };

    private:
        std::vector<Entry> entries;
        std::unordered_map<std::string, std::size_t> indexMap;

        static std::string makeKey(const std::vector<int>& idx) {
            std::string key;
            for (std::size_t k = 0; k < idx.size(); ++k) {
                if (k > 0) {
                    key.push_back('_');
                }
                key.append(std::to_string(idx[k]));
            }
            return key;
        }

        void addEntry(GRBConstr&& c, std::vector<int>&& idx) {
            std::size_t pos = entries.size();
            if (!indexMap.emplace(makeKey(idx), pos).second) {
                throw std::invalid_argument(
                    std::format("IndexedConstraintSet: duplicate index {}", makeKey(idx)));
            }
            entries.push_back(Entry{ std::move(c), std::move(idx) });
        }

    public:
        [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

        const std::vector<Entry>& all() const noexcept { return entries; }

        /// @throws std::out_of_range if the tuple has no constraint
        const GRBConstr& at(const std::vector<int>& idx) const {
            auto it = indexMap.find(makeKey(idx));
            if (it == indexMap.end()) {
                throw std::out_of_range(
                    std::format("IndexedConstraintSet::at: index {} not found", makeKey(idx)));
            }
            return entries[it->second].constr;
        }

        [[nodiscard]] bool contains(const std::vector<int>& idx) const {
            return indexMap.find(makeKey(idx)) != indexMap.end();
        }

    private:
        friend class ConstraintFactory;
    };

    // ============================================================================
    // CONSTRAINT TABLE
    // ============================================================================
    /**
     * @class ConstraintTable
     * @brief Enum-keyed registry of constraint families
     */
    template<typename EnumT>
    class ConstraintTable {
    private:
        static constexpr std::size_t MAX = enum_size_v<EnumT>;
        std::array<IndexedConstraintSet, MAX> table_;

    public:
        IndexedConstraintSet& get(EnumT key) {
            std::size_t idx = enum_index(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("ConstraintTable::get: key {} >= {}", idx, MAX));
            }
            return table_[idx];
        }

        const IndexedConstraintSet& get(EnumT key) const {
            return const_cast<ConstraintTable*>(this)->get(key);
        }

        IndexedConstraintSet& operator()(EnumT key) { return get(key); }
        const IndexedConstraintSet& operator()(EnumT key) const { return get(key); }

        [[nodiscard]] std::size_t count(EnumT key) const { return get(key).size(); }

        [[nodiscard]] std::size_t totalSize() const noexcept {
            std::size_t n = 0;
            for (const auto& s : table_) {
                n += s.size();
            }
            return n;
        }
    };

    // ============================================================================
    // CONSTRAINT FACTORY
    // ============================================================================
    /**
     * @class ConstraintFactory
     * @brief Adds named constraints and registers them by family
     */
    class ConstraintFactory {
    public:
        /**
         * @brief Add one constraint of a family
         *
         * @param index tuple identifying the constraint inside its family
         * @param tc    temporary constraint, e.g. expr <= rhs
         * @return the created GRBConstr
         *
         * @throws std::invalid_argument if the family already holds index
         */
        static GRBConstr add(GRBModel& model,
            ConstraintTable<ConstraintFamily>& table,
            ConstraintFamily family,
            std::vector<int> index,
            const GRBTempConstr& tc)
        {
            GRBConstr c = model.addConstr(tc, force_name::math(familyName(family), index));
            table.get(family).addEntry(GRBConstr(c), std::move(index));
            return c;
        }
    };

    /// @brief Name of a constraint as stored in the model
    inline std::string constrName(const GRBConstr& c) {
        return c.get(GRB_StringAttr_ConstrName);
    }

} // namespace roster
