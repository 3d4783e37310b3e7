#pragma once
/*
===============================================================================
VARIABLES — Decision variable groups for the wave model
===============================================================================

OVERVIEW
--------
The wave formulation has two kinds of decision variables:

    orderVar[i], aisleVar[j]   one binary per catalog entry (1-D groups)
    N, D, Z                    single variables (scalar groups)

VariableGroup stores either shape behind one interface, VariableFactory
creates them on a GRBModel, and VariableTable files them under enum keys so
that the formulation, the engine, and the tests address them by name
instead of by position.

KEY COMPONENTS
--------------
• VariableGroup   — scalar or 1-D array of GRBVar
• VariableFactory — add(model, vtype, lb, ub, name[, n])
• VariableTable   — enum-keyed registry (one slot per enumerator)
• value / values  — solution accessors (GRB_DoubleAttr_X)

USAGE
-----
    WAVEPICK_DECLARE_ENUM_WITH_COUNT(Vars, Order, Units);

    VariableTable<Vars> vars;
    vars.set(Vars::Order,
        VariableFactory::add(model, GRB_BINARY, 0.0, 1.0, "order", numOrders));
    vars.set(Vars::Units,
        VariableFactory::add(model, GRB_INTEGER, lb, ub, "N"));

    GRBVar& x3 = vars(Vars::Order)(3);
    GRBVar& n  = vars(Vars::Units).scalar();

    model.optimize();
    std::vector<double> picks = values(vars(Vars::Order));

EXCEPTION SAFETY
----------------
• Index errors throw std::out_of_range, shape errors std::logic_error.
• Solution accessors propagate GRBException when no solution is loaded.

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "gurobi_c++.h"
#include "enum_utils.h"
#include "naming.h"

namespace wavepick {

    // ============================================================================
    // VARIABLE GROUP
    // ============================================================================
    /**
     * @class VariableGroup
     * @brief Scalar or 1-D collection of GRBVar
     *
     * @details A scalar group holds exactly one variable. A 1-D group holds
     *          size() variables addressed 0..size()-1; a default-constructed
     *          group is 1-D and empty.
     */
    class VariableGroup {
    private:
        std::vector<GRBVar> vars_;
        bool scalar_ = false;

    public:
        VariableGroup() = default;

        /// @brief Scalar group
        explicit VariableGroup(GRBVar v)
            : vars_{ std::move(v) }, scalar_(true) {
        }

        /// @brief 1-D group
        explicit VariableGroup(std::vector<GRBVar> vars)
            : vars_(std::move(vars)), scalar_(false) {
        }

        [[nodiscard]] bool isScalar() const noexcept { return scalar_; }
        [[nodiscard]] bool empty() const noexcept { return vars_.empty(); }

        /// @brief Number of variables (1 for scalars)
        [[nodiscard]] std::size_t size() const noexcept { return vars_.size(); }

        /**
         * @brief Variable at position i of a 1-D group
         * @throws std::logic_error on a scalar group
         * @throws std::out_of_range if i is outside [0, size())
         */
        GRBVar& at(int i) {
            if (scalar_) {
                throw std::logic_error("VariableGroup::at: group is scalar");
            }
            if (i < 0 || static_cast<std::size_t>(i) >= vars_.size()) {
                throw std::out_of_range(
                    std::format("VariableGroup::at: index {} out of range [0, {})",
                        i, vars_.size()));
            }
            return vars_[static_cast<std::size_t>(i)];
        }

        const GRBVar& at(int i) const {
            return const_cast<VariableGroup*>(this)->at(i);
        }

        GRBVar& operator()(int i) { return at(i); }
        const GRBVar& operator()(int i) const { return at(i); }

        /**
         * @brief The variable of a scalar group
         * @throws std::logic_error if the group is not scalar
         */
        GRBVar& scalar() {
            if (!scalar_) {
                throw std::logic_error(
                    std::format("VariableGroup::scalar: group holds {} variables",
                        vars_.size()));
            }
            return vars_.front();
        }

        const GRBVar& scalar() const {
            return const_cast<VariableGroup*>(this)->scalar();
        }

        /**
         * @brief Visit every variable with its position
         * @tparam Fn Callable (const GRBVar&, int); position is 0 for scalars
         */
        template<typename Fn>
        void forEach(Fn&& fn) const {
            for (std::size_t i = 0; i < vars_.size(); ++i) {
                fn(vars_[i], static_cast<int>(i));
            }
        }
    };

    // ============================================================================
    // VARIABLE FACTORY
    // ============================================================================
    /**
     * @class VariableFactory
     * @brief Creates variables on a model, naming them through make_name::
     */
    class VariableFactory {
    public:
        /**
         * @brief Scalar variable
         * @return Scalar VariableGroup named baseName (debug builds)
         */
        static VariableGroup add(GRBModel& model,
            char vtype,
            double lb,
            double ub,
            const std::string& baseName)
        {
            return VariableGroup(addVarOpt(model, lb, ub, vtype,
                ::make_name::math(baseName)));
        }

        /**
         * @brief n variables baseName[0] .. baseName[n-1]
         * @throws std::invalid_argument if n is negative
         */
        static VariableGroup add(GRBModel& model,
            char vtype,
            double lb,
            double ub,
            const std::string& baseName,
            int n)
        {
            if (n < 0) {
                throw std::invalid_argument(
                    std::format("VariableFactory::add: negative size {}", n));
            }

            std::vector<GRBVar> vars;
            vars.reserve(static_cast<std::size_t>(n));
            for (int i = 0; i < n; ++i) {
                vars.push_back(addVarOpt(model, lb, ub, vtype,
                    ::make_name::math(baseName, i)));
            }
            return VariableGroup(std::move(vars));
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
                (void)name;
                return model.addVar(lb, ub, 0.0, vtype);
            }
        }
    };

    // ============================================================================
    // VARIABLE TABLE
    // ============================================================================
    /**
     * @class VariableTable
     * @brief Enum-keyed registry of variable groups
     *
     * @tparam EnumT Enum class declared with WAVEPICK_DECLARE_ENUM_WITH_COUNT
     */
    template<typename EnumT>
    class VariableTable {
    public:
        static constexpr std::size_t MAX = enum_size_v<EnumT>;

    private:
        std::array<VariableGroup, MAX> table_;
        std::array<bool, MAX> filled_{};

        static std::size_t slot(EnumT key) {
            const std::size_t idx = enum_index(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("VariableTable: key {} >= {}", idx, MAX));
            }
            return idx;
        }

    public:
        void set(EnumT key, VariableGroup group) {
            const std::size_t idx = slot(key);
            table_[idx] = std::move(group);
            filled_[idx] = true;
        }

        /**
         * @throws std::out_of_range if key is invalid or the slot was never set
         */
        VariableGroup& get(EnumT key) {
            const std::size_t idx = slot(key);
            if (!filled_[idx]) {
                throw std::out_of_range(
                    std::format("VariableTable::get: slot {} is empty", idx));
            }
            return table_[idx];
        }

        const VariableGroup& get(EnumT key) const {
            return const_cast<VariableTable*>(this)->get(key);
        }

        VariableGroup& operator()(EnumT key) { return get(key); }
        const VariableGroup& operator()(EnumT key) const { return get(key); }
    };

    // ============================================================================
    // SOLUTION ACCESS
    // ============================================================================

    /// @throws GRBException if the model has no solution loaded
    inline double value(const GRBVar& v) {
        return v.get(GRB_DoubleAttr_X);
    }

    /**
     * @brief Solution values of a group, in position order
     * @throws GRBException if the model has no solution loaded
     */
    inline std::vector<double> values(const VariableGroup& vg) {
        std::vector<double> result;
        result.reserve(vg.size());
        vg.forEach([&](const GRBVar& v, int) {
            result.push_back(v.get(GRB_DoubleAttr_X));
        });
        return result;
    }

} // namespace wavepick
