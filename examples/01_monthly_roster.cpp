/*
================================================================================
EXAMPLE 01: MONTHLY ROSTER - One team, three shifts, one month
================================================================================
DIFFICULTY: Intermediate
PROBLEM TYPE: Mixed-Integer Programming (MIP)

PROBLEM DESCRIPTION
-------------------
A dispatch center staffs an early (F), a late (S) and a night (N) shift every
day of March 2025. Twenty employees form one team, two of them relief
workers of whom one always stays free. Some are on vacation,
sick or in training; one has a fixed night shift; one worked a night shift
on the last day of February. The roster must staff every shift within its
weekday/weekend bounds while keeping rest times, streak limits and hours
fair across the team.

MODEL
-----
Hard:   one shift per day, staffing min/max, locked assignments,
        48h weekly ceiling, floater reserve
Soft:   11h rest (1e6) > streak limits (1e5) > minimum hours (1e3)
        > fairness (1), weekly F -> N -> S rotation (1)

After the solve the example prints the roster grid, the per-employee hour
summary with credited training days, and the headcount buckets.

USAGE
-----
    monthly_roster --time_budget=60 --threads=4 --min_hours --rotation

================================================================================
*/

#include <iostream>
#include <iomanip>
#include <chrono>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"

#include <shift_roster/shift_roster.h>

ABSL_FLAG(double, time_budget, 60.0, "Solver time budget in seconds.");
ABSL_FLAG(int, threads, 0, "Solver threads (0 lets Gurobi decide).");
ABSL_FLAG(int, seed, 0, "Solver random seed.");
ABSL_FLAG(bool, min_hours, false, "Penalize shortfalls against nominal weekly hours.");
ABSL_FLAG(bool, rotation, false, "Encourage the weekly F -> N -> S rotation.");
ABSL_FLAG(bool, solver_output, false, "Show the Gurobi log.");

namespace {

    roster::Date march(unsigned d) { return roster::makeDate(2025, 3, d); }

    roster::InstanceInput buildInstance() {
        roster::InstanceInput in;
        in.horizon = { march(1), march(31) };
        in.shiftTypes = roster::standardShiftTypes();

        roster::Team team;
        team.id = 1;
        team.name = "Leitstelle";
        for (const auto& st : in.shiftTypes) {
            team.shiftTypes.push_back(st.id);
        }

        for (int id = 1; id <= 20; ++id) {
            roster::Employee e;
            e.id = id;
            e.name = "Disponent " + std::to_string(id);
            e.team = team.id;
            if (id >= 19) {
                e.designation = roster::Designation::Floater;
            }
            in.employees.push_back(e);
            team.members.push_back(id);
        }
        in.teams.push_back(team);

        // one system account without team and one deactivated employee
        roster::Employee admin;
        admin.id = 90;
        admin.name = "Admin";
        admin.designation = roster::Designation::Administrator;
        in.employees.push_back(admin);

        roster::Employee former;
        former.id = 91;
        former.name = "Former";
        former.active = false;
        in.employees.push_back(former);

        in.absences = {
            { 3, "U", { march(10), march(21) } },
            { 7, "L", { march(17), march(23) } },
            { 12, "AU", { march(3), march(5) } },
        };
        in.locks = { { 1, march(1), 3 } };
        in.history = { { 2, roster::makeDate(2025, 2, 28), 3 } };
        return in;
    }

    void printGrid(const roster::ProblemInstance& inst, const roster::RosterResult& result) {
        std::cout << std::setw(14) << "Employee";
        for (const auto& day : inst.days()) {
            std::cout << std::setw(4) << static_cast<unsigned>(std::chrono::year_month_day(day.date).day());
        }
        std::cout << "\n" << std::string(14 + 4 * inst.days().size(), '-') << "\n";

        for (const auto& row : result.grid) {
            std::cout << std::setw(14) << inst.employees()[static_cast<std::size_t>(inst.employeeIndex(row.employee))].name;
            for (const auto& cell : row.cells) {
                std::cout << std::setw(4) << (cell.kind == roster::DayCell::Kind::Off ? "." : cell.code);
            }
            std::cout << "\n";
        }
    }

    void printHours(const roster::ProblemInstance& inst, const roster::RosterResult& result,
        const roster::CreditRule& credit)
    {
        std::vector<roster::Employee> rostered;
        for (int e : inst.plannableEmployees()) {
            rostered.push_back(inst.employees()[static_cast<std::size_t>(e)]);
        }
        auto summaries = roster::summarize(inst.horizon(), rostered, result.assignments, inst.absences(), credit);

        std::cout << std::setw(14) << "Employee" << std::setw(8) << "Shifts" << std::setw(10) << "Worked"
                  << std::setw(10) << "Credited" << std::setw(10) << "Total" << "\n";
        std::cout << std::string(52, '-') << "\n";
        for (const auto& s : summaries) {
            std::cout << std::setw(14) << s.employee << std::setw(8) << s.shiftCount
                      << std::setw(10) << s.shiftHours << std::setw(10) << s.creditedHours
                      << std::setw(10) << s.total() << "\n";
        }
    }

} // namespace

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main(int argc, char** argv) {
    absl::SetProgramUsageMessage("Builds and solves a one-month roster for a single dispatch team.");
    absl::ParseCommandLine(argc, argv);
    absl::InitializeLog();

    try {
        auto inst = roster::ProblemInstance::build(buildInstance());

        roster::SolverConfig cfg(absl::GetFlag(FLAGS_time_budget));
        cfg.threads = absl::GetFlag(FLAGS_threads);
        cfg.seed = absl::GetFlag(FLAGS_seed);
        cfg.solverOutput = absl::GetFlag(FLAGS_solver_output);
        if (absl::GetFlag(FLAGS_min_hours)) {
            cfg.minimumHours = roster::MinimumHoursPolicy::Soft;
        }
        if (absl::GetFlag(FLAGS_rotation)) {
            cfg.rotation = roster::RotationPolicy::Soft;
        }

        auto activity = roster::classifyActivity(inst);
        LOG(INFO) << "employees: " << activity.planningActive() << " planning-active, "
                  << activity.activeWithoutTeam << " system-only, " << activity.inactive << " inactive";

        auto result = roster::SolverDriver(cfg).solve(inst);
        const auto& report = result.report;

        std::cout << "Status: " << roster::toString(result.status) << "\n";
        std::cout << "Solver: " << roster::statusString(report.gurobiStatus)
                  << " in " << report.solverSeconds << "s\n";
        std::cout << "Model: " << report.statistics.numVars << " vars, "
                  << report.statistics.numConstrs << " constrs\n";

        for (const auto& lock : report.droppedLocks) {
            std::cout << "Dropped lock: employee " << lock.employee << " on "
                      << roster::formatDate(lock.date) << "\n";
        }

        if (!result.hasRoster()) {
            for (const auto& reason : report.reasons) {
                std::cout << "  - " << reason.message << "\n";
            }
            return 2;
        }

        std::cout << std::fixed << std::setprecision(1);
        std::cout << "Objective: " << report.objective.value_or(0.0) << "\n";
        roster::forEachEnum<roster::PenaltyFamily>([&](roster::PenaltyFamily f) {
            std::cout << "  " << std::setw(18) << std::left << roster::familyName(f) << std::right
                      << std::setw(6) << report.penalties.violations[f] << " violations\n";
        });
        std::cout << "\n";

        printGrid(inst, result);
        std::cout << "\n";
        printHours(inst, result, cfg.credit);

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (roster::RosterError& e) {
        std::cerr << "Roster Error: " << e.what() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
