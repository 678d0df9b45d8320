#pragma once
/*
===============================================================================
SOLVER DRIVER — One solve from a frozen instance to a RosterResult
===============================================================================

OVERVIEW
--------
SolverDriver::solve() is the single entry point of the engine. A solve is a
pure function of (instance, config); nothing survives between two calls.

    Built ──► Solving ──► Optimal | Feasible | Infeasible | Timeout | Error

    1. empty instance (nothing to assign)   -> Optimal, empty roster,
                                               no solver environment created
    2. staffing pre-check fails             -> Infeasible, one reason per
                                               short (day, shift)
    3. build and optimize (RosterBuilder)
    4. classify the Gurobi status:

       OPTIMAL                               Optimal
       SUBOPTIMAL, SOLUTION_LIMIT            Feasible (incumbent required)
       INTERRUPTED with incumbent            Feasible
       INTERRUPTED without incumbent         Timeout
       TIME_LIMIT                            Timeout (incumbent kept if any)
       INFEASIBLE, INF_OR_UNBD               Infeasible, reasons from the IIS
       anything else                         Error

    5. with an incumbent: read every x once and derive the assignment list,
       the schedule view and the per-employee grid from that one read.

A GRBException anywhere in steps 3-5 becomes SolverInternalError. Invalid
configuration or instances never reach this point (ModelConstructionError).

===============================================================================
*/

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <tuple>
#include <chrono>
#include <optional>
#include <algorithm>

#include "absl/log/log.h"
#include "gurobi_c++.h"

#include "entities.h"
#include "config.h"
#include "errors.h"
#include "keys.h"
#include "variables.h"
#include "objective.h"
#include "diagnostics.h"
#include "hard_constraints.h"
#include "solve_monitor.h"
#include "roster_builder.h"

namespace roster {

    // ============================================================================
    // RESULT TYPES
    // ============================================================================

    enum class SolveStatus { Built, Solving, Optimal, Feasible, Infeasible, Timeout, Error };

    [[nodiscard]] constexpr std::string_view toString(SolveStatus s) noexcept {
        switch (s) {
            case SolveStatus::Built:      return "BUILT";
            case SolveStatus::Solving:    return "SOLVING";
            case SolveStatus::Optimal:    return "OPTIMAL";
            case SolveStatus::Feasible:   return "FEASIBLE";
            case SolveStatus::Infeasible: return "INFEASIBLE";
            case SolveStatus::Timeout:    return "TIMEOUT";
            case SolveStatus::Error:      return "ERROR";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Map a Gurobi status code onto the engine's terminal states
     * @param hasIncumbent at least one feasible solution is loaded
     */
    [[nodiscard]] constexpr SolveStatus classifyStatus(int gurobiStatus, bool hasIncumbent) noexcept {
        switch (gurobiStatus) {
            case GRB_OPTIMAL:
                return SolveStatus::Optimal;
            case GRB_SUBOPTIMAL:
            case GRB_SOLUTION_LIMIT:
                return hasIncumbent ? SolveStatus::Feasible : SolveStatus::Error;
            case GRB_INTERRUPTED:
                return hasIncumbent ? SolveStatus::Feasible : SolveStatus::Timeout;
            case GRB_TIME_LIMIT:
                return SolveStatus::Timeout;
            case GRB_INFEASIBLE:
            case GRB_INF_OR_UNBD:
                return SolveStatus::Infeasible;
            default:
                return SolveStatus::Error;
        }
    }

    /// date -> shift code -> employee ids in ascending order
    using ScheduleView = std::map<Date, std::map<std::string, std::vector<EmployeeId>>>;

    struct DayCell {
        enum class Kind { Off, Shift, Absence };

        Kind kind = Kind::Off;
        std::string code;        ///< shift code, absence type, or "OFF"

        bool operator==(const DayCell&) const = default;
    };

    struct EmployeeRow {
        EmployeeId employee = 0;
        std::vector<DayCell> cells;   ///< one per horizon day
    };

    /**
     * @struct SolveReport
     * @brief Everything a caller needs to judge a solve besides the roster
     */
    struct SolveReport {
        SolveStatus status = SolveStatus::Built;
        bool optimal = false;
        bool cancelled = false;
        std::vector<InfeasibilityReason> reasons;

        std::optional<double> objective;
        std::optional<double> bound;
        std::optional<double> gap;
        double wallSeconds = 0.0;
        double solverSeconds = 0.0;
        int gurobiStatus = -1;           ///< -1 when the solver never ran

        PenaltyTotals penalties;
        ModelStatistics statistics;
        std::map<std::string, double> parameters;
        std::vector<LockedAssignment> droppedLocks;
    };

    struct RosterResult {
        SolveStatus status = SolveStatus::Built;
        std::vector<ShiftAssignment> assignments;   ///< sorted by date, then employee id
        ScheduleView schedule;
        std::vector<EmployeeRow> grid;              ///< one row per employee, by id
        SolveReport report;

        /// @brief A roster was extracted (possibly empty for an empty instance)
        [[nodiscard]] bool hasRoster() const noexcept {
            return status == SolveStatus::Optimal || status == SolveStatus::Feasible ||
                   (status == SolveStatus::Timeout && report.objective.has_value());
        }
    };

    // ============================================================================
    // SOLVER DRIVER
    // ============================================================================

    class SolverDriver {
    public:
        /// @throws ModelConstructionError if the configuration is invalid
        explicit SolverDriver(SolverConfig config) : cfg_(std::move(config)) {
            cfg_.validate();
        }

        [[nodiscard]] const SolverConfig& config() const noexcept { return cfg_; }

        /**
         * @brief Solve one frozen instance
         *
         * @details The staffing pre-check runs first, so an instance without
         *          candidates is only an empty Optimal roster when no shift
         *          needs anyone. A stop requested before the first incumbent
         *          ends the solve as Timeout without a roster; after it, the
         *          incumbent is extracted and the status is Feasible.
         *
         * @param token    stop flag checked by the solver callback
         * @param listener optional progress observer (runs on the solver thread)
         *
         * @throws SolverInternalError when the optimizer fails
         */
        RosterResult solve(const ProblemInstance& inst,
            CancellationToken token = {},
            SolveMonitor::Listener listener = {}) const
        {
            const auto started = std::chrono::steady_clock::now();
            RosterResult result;
            result.report.droppedLocks = inst.droppedLocks();

            if (auto reasons = precheck(inst); !reasons.empty()) {
                for (const auto& r : reasons) {
                    LOG(WARNING) << "infeasible: " << r.message;
                }
                result.report.reasons = std::move(reasons);
                finish(result, SolveStatus::Infeasible, started);
                return result;
            }

            if (inst.empty()) {
                LOG(INFO) << "nothing to assign; returning an empty roster";
                finish(result, SolveStatus::Optimal, started);
                result.report.optimal = true;
                result.report.objective = 0.0;
                extract(inst, {}, result);
                return result;
            }

            SolveMonitor monitor(std::move(token), std::move(listener));
            RosterBuilder builder(inst, cfg_, monitor);

            try {
                advance(result, SolveStatus::Solving);
                builder.optimize();

                auto& report = result.report;
                report.gurobiStatus = builder.status();
                report.statistics = computeStatistics(builder.model());
                report.parameters = builder.parameters();
                report.cancelled = monitor.cancelled();
                report.solverSeconds = builder.runtime();

                bool incumbent = builder.solutionCount() > 0;
                SolveStatus status = classifyStatus(report.gurobiStatus, incumbent);

                if (incumbent && status != SolveStatus::Error) {
                    report.objective = builder.objVal();
                    report.bound = builder.objBound();
                    report.gap = builder.mipGap();
                    report.penalties = evaluate(builder.penalties());
                    extract(inst, selected(builder), result);
                }
                else if (status == SolveStatus::Infeasible) {
                    report.reasons = explainIIS(computeIIS(builder.model()), inst);
                    for (const auto& r : report.reasons) {
                        LOG(WARNING) << "infeasible: " << r.message;
                    }
                }
                else if (status == SolveStatus::Error) {
                    LOG(ERROR) << "unexpected solver status " << statusString(report.gurobiStatus);
                }

                report.optimal = status == SolveStatus::Optimal;
                finish(result, status, started);
            }
            catch (const GRBException& e) {
                LOG(ERROR) << "solver error " << e.getErrorCode() << ": " << e.getMessage();
                throw SolverInternalError(e.getErrorCode(), e.getMessage());
            }

            return result;
        }

    private:
        using Triple = std::tuple<int, int, int>;

        /// (e, d, s) of every x set in the loaded solution, in one pass.
        static std::vector<Triple> selected(const RosterBuilder& builder) {
            std::vector<Triple> out;
            for (const auto& entry : builder.variables().get(RosterVar::Assign)) {
                if (isSet(entry.var)) {
                    out.emplace_back(entry.index[0], entry.index[1], entry.index[2]);
                }
            }
            return out;
        }

        /**
         * @brief Assignment list, schedule view and grid from the same triples
         */
        static void extract(const ProblemInstance& inst, const std::vector<Triple>& chosen, RosterResult& result) {
            const auto& shifts = inst.shiftTypes();
            const auto& employees = inst.employees();

            std::vector<std::vector<int>> shiftOn(employees.size(), std::vector<int>(inst.days().size(), -1));
            for (const auto& [e, d, s] : chosen) {
                shiftOn[static_cast<std::size_t>(e)][static_cast<std::size_t>(d)] = s;
            }

            for (const auto& day : inst.days()) {
                auto& slot = result.schedule[day.date];
                for (int s : day.activeShifts) {
                    slot[shifts[static_cast<std::size_t>(s)].code];
                }
            }

            // employees are sorted by id, so walking e ascending keeps each
            // per-day list ordered
            for (int d = 0; d < inst.dayCount(); ++d) {
                const Date date = inst.days()[static_cast<std::size_t>(d)].date;
                for (int e = 0; e < inst.employeeCount(); ++e) {
                    int s = shiftOn[static_cast<std::size_t>(e)][static_cast<std::size_t>(d)];
                    if (s < 0) {
                        continue;
                    }
                    const auto& st = shifts[static_cast<std::size_t>(s)];
                    const auto& emp = employees[static_cast<std::size_t>(e)];
                    result.assignments.push_back({ emp.id, date, st.id, st.code, st.hours });
                    result.schedule[date][st.code].push_back(emp.id);
                }
            }

            result.grid.reserve(employees.size());
            for (int e = 0; e < inst.employeeCount(); ++e) {
                EmployeeRow row{ employees[static_cast<std::size_t>(e)].id, {} };
                row.cells.reserve(inst.days().size());
                for (int d = 0; d < inst.dayCount(); ++d) {
                    int s = shiftOn[static_cast<std::size_t>(e)][static_cast<std::size_t>(d)];
                    if (auto absence = inst.absenceOn(e, d)) {
                        row.cells.push_back({ DayCell::Kind::Absence, *absence });
                    }
                    else if (s >= 0) {
                        row.cells.push_back({ DayCell::Kind::Shift, shifts[static_cast<std::size_t>(s)].code });
                    }
                    else {
                        row.cells.push_back({ DayCell::Kind::Off, "OFF" });
                    }
                }
                result.grid.push_back(std::move(row));
            }
        }

        static void advance(RosterResult& result, SolveStatus next) {
            VLOG(1) << "solve " << toString(result.report.status) << " -> " << toString(next);
            result.status = next;
            result.report.status = next;
        }

        static void finish(RosterResult& result, SolveStatus terminal,
            std::chrono::steady_clock::time_point started)
        {
            advance(result, terminal);
            result.report.wallSeconds =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            LOG(INFO) << "solve " << toString(terminal) << ": " << result.assignments.size()
                      << " assignments in " << result.report.wallSeconds << "s";
        }

        SolverConfig cfg_;
    };

} // namespace roster
