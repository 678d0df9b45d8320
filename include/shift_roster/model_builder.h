#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method orchestration of one Gurobi solve
===============================================================================

Overview
--------
ModelBuilder owns the solver environment and model of exactly one solve and
runs the construction steps in a fixed order:

    initialize()
    optimize() {
        addVariables();
        addConstraints();
        addParameters();
        addObjective();
        beforeOptimize();
        model.optimize();
        afterOptimize();
    }

Derived builders (see roster_builder.h) override the hooks. The base class
only knows about environments, parameters and status queries.

Key Features
------------
1. Lazy initialization: the constructor touches no solver state; the GRBEnv
   is created (deferred start), configured through configureEnvironment()
   and started on first use.
2. One environment per builder: nothing is shared between two solves.
3. Enum-keyed registries: variables() and constraints() are tables keyed by
   VarEnum / ConEnum.
4. Parameter setters (timeLimit, threads, seed, ...) record the values they
   apply in parameters(), so a solve report can show what was used.
5. Status helpers: status(), hasSolution(), objVal(), runtime(), ...

===============================================================================
*/

#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "gurobi_c++.h"

#include "variables.h"
#include "constraints.h"

namespace roster {

    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarTable = VariableTable<VarEnum>;
        using ConTable = ConstraintTable<ConEnum>;

    private:
        std::unique_ptr<GRBEnv>   env_;
        std::unique_ptr<GRBModel> model_;

        bool initialized_ = false;

    protected:
        VarTable vars_;
        ConTable cons_;

        // Parameters applied through the named setters, by Gurobi name.
        std::map<std::string, double> params_;

    public:
        ModelBuilder() = default;
        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // -------------------------------------------------------------------------
        // Initialization
        // -------------------------------------------------------------------------
        /**
         * @brief Create, configure and start the environment, then the model
         *
         * @note Runs once; later calls return immediately.
         * @throws GRBException when no licence is available
         */
        void initialize()
        {
            if (initialized_)
                return;

            env_ = std::make_unique<GRBEnv>(true);  // defer licence check and load
            configureEnvironment(*env_);
            env_->start();
            model_ = std::make_unique<GRBModel>(*env_);

            initialized_ = true;
        }

        [[nodiscard]] bool initialized() const noexcept { return initialized_; }

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------

        /// @brief Mutable model, initializing on first use
        GRBModel& model()
        {
            if (!initialized_)
                initialize();
            return *model_;
        }

        /// @brief Const model; requires a prior initialize()
        const GRBModel& model() const
        {
            if (!initialized_)
                throw std::logic_error("ModelBuilder::model: builder is not initialized");
            return *model_;
        }

        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        const std::map<std::string, double>& parameters() const noexcept { return params_; }

        // -------------------------------------------------------------------------
        // Parameter Configuration
        // -------------------------------------------------------------------------

        /// @brief Wall-clock limit in seconds
        void timeLimit(double seconds) {
            model().set(GRB_DoubleParam_TimeLimit, seconds);
            params_["TimeLimit"] = seconds;
        }

        /// @brief Relative MIP gap at which the solve stops as optimal
        void mipGapLimit(double gap) {
            model().set(GRB_DoubleParam_MIPGap, gap);
            params_["MIPGap"] = gap;
        }

        /// @brief Worker threads (0 = automatic)
        void threads(int n) {
            model().set(GRB_IntParam_Threads, n);
            params_["Threads"] = n;
        }

        /// @brief Random seed; fixed seeds make repeated solves comparable
        void seed(int s) {
            model().set(GRB_IntParam_Seed, s);
            params_["Seed"] = s;
        }

        void quiet() {
            model().set(GRB_IntParam_OutputFlag, 0);
            params_["OutputFlag"] = 0;
        }

        void verbose() {
            model().set(GRB_IntParam_OutputFlag, 1);
            params_["OutputFlag"] = 1;
        }

        // -------------------------------------------------------------------------
        // Objective Helpers
        // -------------------------------------------------------------------------

        void minimize(const GRBLinExpr& expr) {
            model().setObjective(expr, GRB_MINIMIZE);
        }

        // -------------------------------------------------------------------------
        // Solution Diagnostics
        // -------------------------------------------------------------------------

        int status() const {
            return model().get(GRB_IntAttr_Status);
        }

        bool isOptimal() const {
            return status() == GRB_OPTIMAL;
        }

        int solutionCount() const {
            return model().get(GRB_IntAttr_SolCount);
        }

        /**
         * @brief A solution is loaded and can be read
         * @note Limit and interrupt statuses count only when an incumbent exists
         */
        bool hasSolution() const {
            int s = status();
            return s == GRB_OPTIMAL ||
                   ((s == GRB_SUBOPTIMAL ||
                     s == GRB_SOLUTION_LIMIT ||
                     s == GRB_TIME_LIMIT ||
                     s == GRB_NODE_LIMIT ||
                     s == GRB_INTERRUPTED) && solutionCount() > 0);
        }

        bool isInfeasible() const {
            int s = status();
            return s == GRB_INFEASIBLE || s == GRB_INF_OR_UNBD;
        }

        /// @throws GRBException if no solution available
        double objVal() const {
            return model().get(GRB_DoubleAttr_ObjVal);
        }

        double objBound() const {
            return model().get(GRB_DoubleAttr_ObjBound);
        }

        double mipGap() const {
            return model().get(GRB_DoubleAttr_MIPGap);
        }

        double runtime() const {
            return model().get(GRB_DoubleAttr_Runtime);
        }

        // -------------------------------------------------------------------------
        // Template-method hooks for derived classes
        // -------------------------------------------------------------------------

        /// @brief Configure the environment before it starts (output, licence)
        virtual void configureEnvironment(GRBEnv& env) { (void)env; }

        virtual void addVariables() {}
        virtual void addConstraints() {}
        virtual void addParameters() {}
        virtual void addObjective() {}

        /// @brief Last chance before the solve (callbacks, logging)
        virtual void beforeOptimize() {}

        /// @brief Runs after the solve returns, whatever its status
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------

        /**
         * @brief Build and solve using the template workflow
         * @return the solved model
         */
        GRBModel& optimize()
        {
            initialize();

            addVariables();
            addConstraints();
            addParameters();
            addObjective();

            beforeOptimize();
            model().optimize();
            afterOptimize();

            return model();
        }
    };

} // namespace roster
