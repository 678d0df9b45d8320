#pragma once
/*
===============================================================================
ROSTER BUILDER — The roster model on top of ModelBuilder
===============================================================================

Fills the ModelBuilder hooks for one (instance, config) pair:

    configureEnvironment   OutputFlag from SolverConfig::solverOutput
    addVariables           x and w (fabric.h)
    addConstraints         w links and pins, hard rules, soft-rule links
    addParameters          time budget, threads, seed, MIP gap, output
    addObjective           minimize Σ weight · indicator
    beforeOptimize         attach the SolveMonitor, log the model size
    afterOptimize          log status and objective

The builder owns the penalty pool, so the driver can evaluate penalty
totals against the same terms the objective was built from.

===============================================================================
*/

#include "absl/log/log.h"
#include "gurobi_c++.h"

#include "model_builder.h"
#include "entities.h"
#include "config.h"
#include "keys.h"
#include "fabric.h"
#include "hard_constraints.h"
#include "penalties.h"
#include "objective.h"
#include "solve_monitor.h"
#include "diagnostics.h"

namespace roster {

    class RosterBuilder : public ModelBuilder<RosterVar, ConstraintFamily> {
    public:
        RosterBuilder(const ProblemInstance& instance, const SolverConfig& config, SolveMonitor& monitor)
            : inst_(instance), cfg_(config), monitor_(monitor), fabric_(instance, vars_, cons_) {}

        [[nodiscard]] const PenaltyPool& penalties() const noexcept { return pool_; }
        [[nodiscard]] const VariableFabric& fabric() const noexcept { return fabric_; }

        void configureEnvironment(GRBEnv& env) override {
            env.set(GRB_IntParam_OutputFlag, cfg_.solverOutput ? 1 : 0);
        }

        void addVariables() override {
            fabric_.addAssignments(model());
            fabric_.addIndicators(model());
        }

        void addConstraints() override {
            HardConstraintBuilder(inst_, vars_, cons_).build(model());
            PenaltyBuilder(inst_, cfg_, fabric_, vars_, cons_, pool_).build(model());
        }

        void addParameters() override {
            timeLimit(cfg_.timeBudgetSeconds);
            mipGapLimit(cfg_.mipGap);
            threads(cfg_.threads);
            seed(cfg_.seed);
            if (cfg_.solverOutput) {
                verbose();
            }
            else {
                quiet();
            }
        }

        void addObjective() override {
            minimize(assemble(pool_));
        }

        void beforeOptimize() override {
            model().update();
            model().setCallback(&monitor_);
            LOG(INFO) << "roster model: " << modelSummary(model()) << ", " << pool_.size() << " penalty terms";
        }

        void afterOptimize() override {
            LOG(INFO) << "solver finished: " << statusString(status()) << " after " << runtime() << "s";
            if (solutionCount() > 0) {
                LOG(INFO) << "objective " << objVal() << ", bound " << objBound();
            }
        }

    private:
        const ProblemInstance& inst_;
        const SolverConfig& cfg_;
        SolveMonitor& monitor_;
        VariableFabric fabric_;
        PenaltyPool pool_;
    };

} // namespace roster
