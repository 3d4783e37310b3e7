#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method lifecycle for a Gurobi model
===============================================================================

Overview
--------
ModelBuilder owns one GRBEnv and one GRBModel and drives their construction
through virtual hooks:

    build() {
        initialize();          // env + model, once
        addVariables();
        addConstraints();
        addObjective();
    }
    optimize() {
        build();               // once
        addParameters();
        beforeOptimize();
        model.optimize();
        afterOptimize();
    }

Splitting build() from optimize() lets a caller inspect the finished model
(row counts, coefficients) before handing it to a solver, and lets an engine
apply its own limits between the two. Parameters are applied on every
optimize() call, after the build.

Key Features
------------
1. Lazy initialization: the constructor touches no solver state. The
   environment (and the license check) happens on first model() access.
2. One builder, one model: nothing is shared between builders, so separate
   solves may run on separate threads.
3. Named parameter setters (timeLimit, mipGapLimit, threads, quiet, verbose)
   that record the applied values in store() under "param:<Name>".
4. Solution accessors (status, hasSolution, objVal, objBound, mipGap, ...)
   so callers never spell GRB attribute macros.

Typical Usage
-------------
    WAVEPICK_DECLARE_ENUM_WITH_COUNT(Vars, X);
    WAVEPICK_DECLARE_ENUM_WITH_COUNT(Cons, Cap);

    class Knapsack : public wavepick::ModelBuilder<Vars, Cons> {
    protected:
        void addVariables() override {
            variables().set(Vars::X,
                VariableFactory::add(model(), GRB_BINARY, 0, 1, "x", n));
        }
        void addConstraints() override { ... }
        void addObjective() override { maximize(...); }
    };

    Knapsack k;
    k.timeLimit(10.0);
    k.optimize();
    if (k.hasSolution()) { ... }

Design Notes
------------
* configureEnvironment() runs once, before GRBEnv::start().
* Setters called before build() are safe: they initialize the model first.
* Accessors are only meaningful after optimize(); Gurobi throws
  GRBException for attributes that are not available.

===============================================================================
*/

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "gurobi_c++.h"

#include "constraints.h"
#include "data_store.h"
#include "variables.h"

namespace wavepick {

    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarTable = VariableTable<VarEnum>;
        using ConTable = ConstraintTable<ConEnum>;

    private:
        std::unique_ptr<GRBEnv>   env_;
        std::unique_ptr<GRBModel> model_;

        bool initialized_ = false;
        bool built_ = false;

    protected:
        VarTable vars_;
        ConTable cons_;
        DataStore store_;

    public:
        ModelBuilder() = default;
        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // -------------------------------------------------------------------------
        // Initialization
        // -------------------------------------------------------------------------

        /**
         * @brief Create the environment and model if not already done
         *
         * @throws GRBException if the environment cannot start (e.g. license)
         */
        void initialize()
        {
            if (initialized_)
                return;

            env_ = std::make_unique<GRBEnv>(true);  // defer start until configured
            configureEnvironment(*env_);
            env_->start();
            model_ = std::make_unique<GRBModel>(*env_);

            initialized_ = true;
        }

        [[nodiscard]] bool isInitialized() const noexcept { return initialized_; }
        [[nodiscard]] bool isBuilt() const noexcept { return built_; }

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

        /**
         * @brief Const model
         * @throws std::logic_error before initialize()
         */
        const GRBModel& model() const
        {
            if (!initialized_)
                throw std::logic_error("ModelBuilder::model: not initialized");
            return *model_;
        }

        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        // -------------------------------------------------------------------------
        // Parameter Configuration
        // -------------------------------------------------------------------------

        /// @brief Raw Gurobi parameter, not tracked in store()
        template <typename Param, typename Val>
        void setParam(Param p, Val&& value)
        {
            model().set(p, std::forward<Val>(value));
        }

        /// @brief Time limit in seconds; tracked as "param:TimeLimit"
        void timeLimit(double seconds) {
            setParam(GRB_DoubleParam_TimeLimit, seconds);
            store_["param:TimeLimit"] = seconds;
        }

        /// @brief Relative MIP gap; tracked as "param:MIPGap"
        void mipGapLimit(double gap) {
            setParam(GRB_DoubleParam_MIPGap, gap);
            store_["param:MIPGap"] = gap;
        }

        /// @brief Thread count (0 = all cores); tracked as "param:Threads"
        void threads(int n) {
            setParam(GRB_IntParam_Threads, n);
            store_["param:Threads"] = n;
        }

        /// @brief Suppress the Gurobi log; tracked as "param:OutputFlag"
        void quiet() {
            setParam(GRB_IntParam_OutputFlag, 0);
            store_["param:OutputFlag"] = 0;
        }

        /// @brief Enable the Gurobi log; tracked as "param:OutputFlag"
        void verbose() {
            setParam(GRB_IntParam_OutputFlag, 1);
            store_["param:OutputFlag"] = 1;
        }

        // -------------------------------------------------------------------------
        // Objective
        // -------------------------------------------------------------------------

        void maximize(const GRBLinExpr& expr) {
            model().setObjective(expr, GRB_MAXIMIZE);
        }

        // -------------------------------------------------------------------------
        // Solution Diagnostics
        // -------------------------------------------------------------------------

        /// @brief Gurobi status code (GRB_OPTIMAL, GRB_INFEASIBLE, ...)
        int status() const {
            return model().get(GRB_IntAttr_Status);
        }

        bool isOptimal() const {
            return status() == GRB_OPTIMAL;
        }

        /**
         * @brief True if variable values can be read
         *
         * @details Besides OPTIMAL, limit statuses and user interruption count
         *          when at least one incumbent was found.
         */
        bool hasSolution() const {
            int s = status();
            return s == GRB_OPTIMAL ||
                   s == GRB_SUBOPTIMAL ||
                   s == GRB_SOLUTION_LIMIT ||
                   ((s == GRB_TIME_LIMIT ||
                     s == GRB_NODE_LIMIT ||
                     s == GRB_WORK_LIMIT ||
                     s == GRB_MEM_LIMIT ||
                     s == GRB_INTERRUPTED) && solutionCount() > 0);
        }

        /// @brief INFEASIBLE, or INF_OR_UNBD (every model built here is bounded)
        bool isInfeasible() const {
            const int s = status();
            return s == GRB_INFEASIBLE || s == GRB_INF_OR_UNBD;
        }

        /// @throws GRBException if no solution is available
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

        int solutionCount() const {
            return model().get(GRB_IntAttr_SolCount);
        }

        // -------------------------------------------------------------------------
        // Template-method hooks for derived classes
        // -------------------------------------------------------------------------

        /// @brief Environment parameters that must be set before start()
        virtual void configureEnvironment(GRBEnv& env) { (void)env; }

        virtual void addVariables() {}
        virtual void addConstraints() {}
        virtual void addObjective() {}

        /// @brief Model parameters, applied on every optimize()
        virtual void addParameters() {}

        virtual void beforeOptimize() {}
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------

        /**
         * @brief Run the construction hooks once and flush them into the model
         *
         * @details Subsequent calls are no-ops. GRBModel::update() is called so
         *          that attribute queries on the fresh model succeed.
         */
        GRBModel& build()
        {
            if (built_)
                return model();

            initialize();

            addVariables();
            addConstraints();
            addObjective();

            model().update();
            built_ = true;
            return model();
        }

        /**
         * @brief Build (if needed), apply parameters and optimize
         */
        GRBModel& optimize()
        {
            build();

            addParameters();

            beforeOptimize();
            model().optimize();
            afterOptimize();

            return model();
        }
    };

} // namespace wavepick
