#pragma once
/*
===============================================================================
SOLVE MONITOR — Progress reporting and cooperative cancellation
===============================================================================

Overview
--------
SolveMonitor is the GRBCallback attached to every roster solve. It

    * checks a CancellationToken at every callback point and calls abort()
      once a stop was requested; Gurobi then returns INTERRUPTED with the
      incumbent still loaded, so the driver extracts a complete roster
      (a stop before the first incumbent leaves nothing to extract),
    * turns GRB_CB_MIP / GRB_CB_MIPSOL into a Progress snapshot, logs new
      incumbents at VLOG(1) and forwards each snapshot to an optional
      listener.

Key Components
--------------
• CancellationToken — copyable handle on a shared stop flag
• Progress          — runtime, incumbent, bound, gap, node and solution count
• SolveMonitor      — the callback itself

Typical Usage
-------------
    roster::CancellationToken token;
    std::jthread watchdog([token] { ...; token.requestStop(); });
    auto result = driver.solve(instance, token);

Thread Safety
-------------
• requestStop() may be called from any thread
• The listener runs on Gurobi's callback thread; it must not touch the model

Exception Safety
----------------
• std::exception thrown inside the callback is rethrown as GRBException
  (GRB_ERROR_CALLBACK), which Gurobi reports from optimize()

===============================================================================
*/

#include <algorithm>
#include <atomic>
#include <cmath>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

#include "absl/log/log.h"
#include "gurobi_c++.h"

namespace roster {

    // =============================================================================
    // CANCELLATION
    // =============================================================================

    /**
     * @brief Shared stop flag; copies observe the same request
     */
    class CancellationToken {
    public:
        CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        void requestStop() noexcept { flag_->store(true, std::memory_order_relaxed); }

        [[nodiscard]] bool stopRequested() const noexcept {
            return flag_->load(std::memory_order_relaxed);
        }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

    // =============================================================================
    // PROGRESS
    // =============================================================================

    /**
     * @brief Optimization progress at one callback point
     *
     * @note Values not reported at the current point keep their defaults.
     */
    struct Progress {
        double runtime = 0.0;
        double bestObj = GRB_INFINITY;
        double bestBound = -GRB_INFINITY;
        double gap = GRB_INFINITY;
        int nodeCount = 0;
        int solutionCount = 0;

        bool hasSolution() const noexcept { return solutionCount > 0; }
    };

    // =============================================================================
    // SOLVE MONITOR
    // =============================================================================

    class SolveMonitor : public GRBCallback {
    public:
        using Listener = std::function<void(const Progress&)>;

        explicit SolveMonitor(CancellationToken token, Listener listener = {})
            : token_(std::move(token)), listener_(std::move(listener)) {}

        /// @brief The solve was aborted on request
        [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }

        [[nodiscard]] int incumbents() const noexcept { return incumbents_; }

        [[nodiscard]] const Progress& last() const noexcept { return last_; }

    protected:
        void callback() override {
            try {
                if (token_.stopRequested() && !cancelled_) {
                    VLOG(1) << "solve cancelled by caller";
                    cancelled_ = true;
                    abort();
                    return;
                }

                switch (where) {
                    case GRB_CB_MIPSOL: {
                        Progress p;
                        p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
                        p.bestObj = getDoubleInfo(GRB_CB_MIPSOL_OBJBST);
                        p.bestBound = getDoubleInfo(GRB_CB_MIPSOL_OBJBND);
                        p.nodeCount = static_cast<int>(getDoubleInfo(GRB_CB_MIPSOL_NODCNT));
                        p.solutionCount = getIntInfo(GRB_CB_MIPSOL_SOLCNT) + 1;
                        p.bestObj = std::min(p.bestObj, getDoubleInfo(GRB_CB_MIPSOL_OBJ));
                        p.gap = relativeGap(p);
                        ++incumbents_;
                        VLOG(1) << "incumbent " << incumbents_ << ": obj " << p.bestObj
                                << " bound " << p.bestBound << " at " << p.runtime << "s";
                        report(p);
                        break;
                    }

                    case GRB_CB_MIP: {
                        Progress p;
                        p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
                        p.bestObj = getDoubleInfo(GRB_CB_MIP_OBJBST);
                        p.bestBound = getDoubleInfo(GRB_CB_MIP_OBJBND);
                        p.nodeCount = static_cast<int>(getDoubleInfo(GRB_CB_MIP_NODCNT));
                        p.solutionCount = getIntInfo(GRB_CB_MIP_SOLCNT);
                        p.gap = relativeGap(p);
                        report(p);
                        break;
                    }

                    default:
                        break;
                }
            } catch (const GRBException&) {
                throw;
            } catch (const std::exception& e) {
                throw GRBException(e.what(), GRB_ERROR_CALLBACK);
            }
        }

    private:
        static double relativeGap(const Progress& p) {
            if (p.solutionCount == 0 || std::abs(p.bestObj) < 1e-10) {
                return p.solutionCount == 0 ? GRB_INFINITY : std::abs(p.bestObj - p.bestBound);
            }
            return std::abs(p.bestObj - p.bestBound) / std::abs(p.bestObj);
        }

        void report(const Progress& p) {
            last_ = p;
            if (listener_) {
                listener_(p);
            }
        }

        CancellationToken token_;
        Listener listener_;
        bool cancelled_ = false;
        int incumbents_ = 0;
        Progress last_;
    };

} // namespace roster
