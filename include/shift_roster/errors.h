#pragma once
/*
===============================================================================
ERRORS — Exception types raised by the roster engine
===============================================================================

    RosterError (std::runtime_error)
     ├─ ModelConstructionError   malformed input, detected before solving
     └─ SolverInternalError      the optimizer itself failed (GRBException)

Infeasible and timed-out solves are not errors: they are reported through
SolveStatus in the RosterResult (see solver_driver.h).

===============================================================================
*/

#include <stdexcept>
#include <string>
#include <vector>
#include <format>
#include <utility>

namespace roster {

    /// @brief Root of the engine's exception hierarchy
    class RosterError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class ModelConstructionError
     * @brief One or more input records violate an invariant of the data model
     *
     * @details Validation collects every problem it finds before throwing, so
     *          issues() lists all of them. The what() string joins them.
     */
    class ModelConstructionError : public RosterError {
    public:
        explicit ModelConstructionError(std::vector<std::string> issues)
            : RosterError(join(issues)), issues_(std::move(issues)) {}

        explicit ModelConstructionError(const std::string& issue)
            : ModelConstructionError(std::vector<std::string>{ issue }) {}

        [[nodiscard]] const std::vector<std::string>& issues() const noexcept { return issues_; }

    private:
        static std::string join(const std::vector<std::string>& issues) {
            std::string msg = std::format("invalid problem instance ({} issue{})",
                issues.size(), issues.size() == 1 ? "" : "s");
            for (const auto& i : issues) {
                msg.append("\n  - ").append(i);
            }
            return msg;
        }

        std::vector<std::string> issues_;
    };

    /**
     * @class SolverInternalError
     * @brief Wraps a failure reported by the optimizer
     *
     * @details Carries the Gurobi error code. Never retried by the engine.
     */
    class SolverInternalError : public RosterError {
    public:
        SolverInternalError(int code, const std::string& message)
            : RosterError(std::format("solver error {}: {}", code, message)), code_(code) {}

        [[nodiscard]] int code() const noexcept { return code_; }

    private:
        int code_;
    };

} // namespace roster
