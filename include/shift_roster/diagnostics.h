#pragma once
/*
===============================================================================
DIAGNOSTICS — Status names, model statistics and infeasibility reasons
===============================================================================

Overview
--------
Free functions over GRBModel plus the engine's own reason type:

    * statusString(int)          Gurobi status code -> "OPTIMAL", ...
    * computeStatistics(model)   variable / constraint counts
    * modelSummary(model)        "1200 vars (1150 bin), 3400 constrs"
    * computeIIS(model)          IIS members with their names
    * explainIIS(iis, instance)  IIS -> InfeasibilityReason per hard rule

An InfeasibilityReason names the violated hard-constraint family and, when
the constraint index allows it, the day / shift / employee involved. The
staffing pre-check (hard_constraints.h) produces the same type, so callers
see one reason format whether or not the solver ran.

Typical Usage
-------------
    if (builder.isInfeasible()) {
        auto iis = roster::computeIIS(builder.model());
        for (const auto& r : roster::explainIIS(iis, instance)) {
            LOG(WARNING) << r.message;
        }
    }

===============================================================================
*/

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <optional>
#include <charconv>
#include <memory>
#include <system_error>
#include <format>

#include "gurobi_c++.h"

#include "keys.h"
#include "naming.h"
#include "entities.h"

namespace roster {

    // =============================================================================
    // STATUS STRING CONVERSION
    // =============================================================================

    /**
     * @brief Gurobi status code as its symbolic name
     */
    inline std::string statusString(int status) {
        switch (status) {
            case GRB_LOADED:          return "LOADED";
            case GRB_OPTIMAL:         return "OPTIMAL";
            case GRB_INFEASIBLE:      return "INFEASIBLE";
            case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
            case GRB_UNBOUNDED:       return "UNBOUNDED";
            case GRB_CUTOFF:          return "CUTOFF";
            case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
            case GRB_NODE_LIMIT:      return "NODE_LIMIT";
            case GRB_TIME_LIMIT:      return "TIME_LIMIT";
            case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
            case GRB_INTERRUPTED:     return "INTERRUPTED";
            case GRB_NUMERIC:         return "NUMERIC";
            case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
            case GRB_INPROGRESS:      return "INPROGRESS";
            case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
            default:                  return "UNKNOWN(" + std::to_string(status) + ")";
        }
    }

    // =============================================================================
    // INFEASIBILITY REASONS
    // =============================================================================

    enum class ReasonKind {
        StaffingShortfall,   ///< fewer eligible employees than the minimum (pre-check)
        LockedOverStaffing,  ///< more locked assignments than the maximum (pre-check)
        HardConstraint       ///< member of an IIS
    };

    /**
     * @struct InfeasibilityReason
     * @brief One diagnosable cause of an infeasible instance
     */
    struct InfeasibilityReason {
        ReasonKind kind = ReasonKind::HardConstraint;
        std::optional<ConstraintFamily> family;
        std::optional<Date> date;
        std::string shiftCode;
        std::optional<EmployeeId> employee;
        std::string message;
    };

    // =============================================================================
    // MODEL STATISTICS
    // =============================================================================

    struct ModelStatistics {
        int numVars = 0;
        int numConstrs = 0;
        int numBinary = 0;
        int numInteger = 0;      ///< general integers, binaries excluded
        int numContinuous = 0;
        int numNonZeros = 0;
    };

    inline ModelStatistics computeStatistics(const GRBModel& model) {
        ModelStatistics stats;

        stats.numVars = model.get(GRB_IntAttr_NumVars);
        stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
        stats.numBinary = model.get(GRB_IntAttr_NumBinVars);
        // NumIntVars includes binaries
        stats.numInteger = model.get(GRB_IntAttr_NumIntVars) - stats.numBinary;
        stats.numNonZeros = model.get(GRB_IntAttr_NumNZs);
        stats.numContinuous = stats.numVars - stats.numBinary - stats.numInteger;

        return stats;
    }

    inline std::string modelSummary(const ModelStatistics& stats) {
        std::string result = std::to_string(stats.numVars) + " vars";
        if (stats.numBinary > 0 || stats.numContinuous > 0) {
            result += std::format(" ({} bin, {} cont)", stats.numBinary, stats.numContinuous);
        }
        result += ", " + std::to_string(stats.numConstrs) + " constrs";
        return result;
    }

    inline std::string modelSummary(const GRBModel& model) {
        return modelSummary(computeStatistics(model));
    }

    // =============================================================================
    // IIS (IRREDUCIBLE INCONSISTENT SUBSYSTEM)
    // =============================================================================

    struct IISResult {
        /// Constraints in the IIS (name, constraint)
        std::vector<std::pair<std::string, GRBConstr>> constraints;

        /// Variables whose bounds are in the IIS
        std::vector<std::string> bounds;

        bool empty() const { return constraints.empty() && bounds.empty(); }
        size_t size() const { return constraints.size() + bounds.size(); }
    };

    /**
     * @brief Compute an IIS of an infeasible model
     *
     * @note Only valid for INFEASIBLE / INF_OR_UNBD models. Can be expensive.
     * @throws GRBException if the model is not infeasible
     */
    inline IISResult computeIIS(GRBModel& model) {
        IISResult result;

        model.computeIIS();

        int numConstrs = model.get(GRB_IntAttr_NumConstrs);
        std::unique_ptr<GRBConstr[]> constrs(model.getConstrs());
        for (int i = 0; i < numConstrs; ++i) {
            if (constrs[i].get(GRB_IntAttr_IISConstr) > 0) {
                result.constraints.emplace_back(constrs[i].get(GRB_StringAttr_ConstrName), constrs[i]);
            }
        }

        int numVars = model.get(GRB_IntAttr_NumVars);
        std::unique_ptr<GRBVar[]> vars(model.getVars());
        for (int i = 0; i < numVars; ++i) {
            if (vars[i].get(GRB_IntAttr_IISLB) > 0 || vars[i].get(GRB_IntAttr_IISUB) > 0) {
                result.bounds.push_back(vars[i].get(GRB_StringAttr_VarName));
            }
        }

        return result;
    }

    namespace diag_detail {

        /// "staff_min[3,1]" -> {3, 1}; empty on malformed suffix
        inline std::vector<int> parseIndices(std::string_view name) {
            std::vector<int> out;
            auto open = name.find('[');
            auto close = name.rfind(']');
            if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
                return out;
            }
            std::string_view body = name.substr(open + 1, close - open - 1);
            while (!body.empty()) {
                auto comma = body.find(',');
                std::string_view field = body.substr(0, comma);
                int v = 0;
                auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), v);
                if (ec != std::errc{} || ptr != field.data() + field.size()) {
                    return {};
                }
                out.push_back(v);
                if (comma == std::string_view::npos) {
                    break;
                }
                body.remove_prefix(comma + 1);
            }
            return out;
        }

    } // namespace diag_detail

    /**
     * @brief Translate the hard-rule members of an IIS into reasons
     *
     * @details Linearization families (links, pins) are skipped; they only
     *          appear in an IIS together with the business rule they serve.
     *          When the IIS holds no hard-rule member, a single generic reason
     *          is returned so the caller never sees an empty reason set.
     */
    inline std::vector<InfeasibilityReason> explainIIS(const IISResult& iis, const ProblemInstance& inst) {
        std::vector<InfeasibilityReason> reasons;

        auto dateOf = [&](int d) -> std::optional<Date> {
            if (d < 0 || d >= inst.dayCount()) return std::nullopt;
            return inst.days()[static_cast<std::size_t>(d)].date;
        };
        auto codeOf = [&](int s) -> std::string {
            if (s < 0 || s >= inst.shiftCount()) return {};
            return inst.shiftTypes()[static_cast<std::size_t>(s)].code;
        };
        auto employeeOf = [&](int e) -> std::optional<EmployeeId> {
            if (e < 0 || e >= inst.employeeCount()) return std::nullopt;
            return inst.employees()[static_cast<std::size_t>(e)].id;
        };

        for (const auto& [name, constr] : iis.constraints) {
            auto family = parseConstraintFamily(baseOf(name));
            if (!family || !isHardRule(*family)) {
                continue;
            }

            InfeasibilityReason r;
            r.kind = ReasonKind::HardConstraint;
            r.family = family;
            auto idx = diag_detail::parseIndices(name);

            switch (*family) {
                case ConstraintFamily::StaffingMin:
                case ConstraintFamily::StaffingMax:
                    if (idx.size() == 2) {
                        r.date = dateOf(idx[0]);
                        r.shiftCode = codeOf(idx[1]);
                    }
                    break;
                case ConstraintFamily::OneShiftPerDay:
                    if (idx.size() == 2) {
                        r.employee = employeeOf(idx[0]);
                        r.date = dateOf(idx[1]);
                    }
                    break;
                case ConstraintFamily::LockedAssignment:
                    if (idx.size() == 3) {
                        r.employee = employeeOf(idx[0]);
                        r.date = dateOf(idx[1]);
                        r.shiftCode = codeOf(idx[2]);
                    }
                    break;
                case ConstraintFamily::WeeklyHoursCeiling:
                    if (idx.size() == 2) {
                        r.employee = employeeOf(idx[0]);
                        r.date = dateOf(idx[1]);
                    }
                    break;
                case ConstraintFamily::FloaterReserve:
                    if (idx.size() == 1) {
                        r.date = dateOf(idx[0]);
                    }
                    break;
                default:
                    break;
            }

            r.message = std::format("{} violated by {}", familyName(*family), name);
            if (r.date) {
                r.message += std::format(" on {}", formatDate(*r.date));
            }
            if (!r.shiftCode.empty()) {
                r.message += std::format(" shift {}", r.shiftCode);
            }
            if (r.employee) {
                r.message += std::format(" employee {}", *r.employee);
            }
            reasons.push_back(std::move(r));
        }

        if (reasons.empty()) {
            InfeasibilityReason r;
            r.message = std::format("no hard-rule member isolated ({} IIS elements)", iis.size());
            reasons.push_back(std::move(r));
        }
        return reasons;
    }

} // namespace roster
