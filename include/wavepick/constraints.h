#pragma once
/*
===============================================================================
CONSTRAINTS — Constraint groups for the wave model
===============================================================================

OVERVIEW
--------
Mirrors variables.h for constraints. The wave formulation creates:

    cap[item]   one row per item that occurs in some order or aisle
                (a sparse key set, not 0..numItems-1)
    aisles      Σ aisleVar = D            (scalar)
    units       Σ units·orderVar = N      (scalar)
    ratio       Z − N + UB·D ≤ UB·|A|     (scalar)

A ConstraintGroup is therefore either scalar or keyed by an IndexList of
arbitrary, possibly sparse, integer keys. ConstraintFactory builds groups from
a generator returning GRBTempConstr, ConstraintTable files them under enum
keys.

USAGE
-----
    auto cap = ConstraintFactory::addIndexed(model, "cap", items,
        [&](int item) { return demand(item) - supply(item) <= 0; });

    GRBConstr& row = cap.at(17);        // row of item 17
    cap.forEach([](const GRBConstr& r, int item) { ... });

    auto link = ConstraintFactory::add(model, "aisles",
        [&] { return sum(A, [&](int a) { return Y(a); }) == D; });

EXCEPTION SAFETY
----------------
• Unknown keys throw std::out_of_range, duplicate keys std::invalid_argument.
• Generator exceptions propagate; already-added rows stay in the model.

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gurobi_c++.h"
#include "enum_utils.h"
#include "indexing.h"
#include "naming.h"

namespace wavepick {

    // ============================================================================
    // CONSTRAINT GROUP
    // ============================================================================
    /**
     * @class ConstraintGroup
     * @brief Scalar constraint or constraints keyed by integer indices
     */
    class ConstraintGroup {
    private:
        std::vector<GRBConstr> constrs_;
        std::vector<int> keys_;
        std::unordered_map<int, std::size_t> position_;
        bool scalar_ = false;

    public:
        ConstraintGroup() = default;

        explicit ConstraintGroup(GRBConstr c)
            : constrs_{ std::move(c) }, scalar_(true) {
        }

        /**
         * @brief Append a keyed row
         * @throws std::logic_error on a scalar group
         * @throws std::invalid_argument if key is already present
         */
        void add(int key, GRBConstr c) {
            if (scalar_) {
                throw std::logic_error("ConstraintGroup::add: group is scalar");
            }
            if (!position_.emplace(key, constrs_.size()).second) {
                throw std::invalid_argument(
                    std::format("ConstraintGroup::add: duplicate key {}", key));
            }
            keys_.push_back(key);
            constrs_.push_back(std::move(c));
        }

        [[nodiscard]] bool isScalar() const noexcept { return scalar_; }
        [[nodiscard]] std::size_t size() const noexcept { return constrs_.size(); }
        [[nodiscard]] bool empty() const noexcept { return constrs_.empty(); }

        /// @throws std::out_of_range if key is not present
        GRBConstr& at(int key) {
            auto it = position_.find(key);
            if (it == position_.end()) {
                throw std::out_of_range(
                    std::format("ConstraintGroup::at: key {} not found", key));
            }
            return constrs_[it->second];
        }

        const GRBConstr& at(int key) const {
            return const_cast<ConstraintGroup*>(this)->at(key);
        }

        GRBConstr& operator()(int key) { return at(key); }
        const GRBConstr& operator()(int key) const { return at(key); }

        /// @throws std::logic_error if the group is not scalar
        GRBConstr& scalar() {
            if (!scalar_) {
                throw std::logic_error(
                    std::format("ConstraintGroup::scalar: group holds {} rows",
                        constrs_.size()));
            }
            return constrs_.front();
        }

        const GRBConstr& scalar() const {
            return const_cast<ConstraintGroup*>(this)->scalar();
        }

        /// @tparam Fn Callable (const GRBConstr&, int key), keys in insertion order; key is 0 for scalars
        template<typename Fn>
        void forEach(Fn&& fn) const {
            for (std::size_t i = 0; i < constrs_.size(); ++i) {
                fn(constrs_[i], scalar_ ? 0 : keys_[i]);
            }
        }
    };

    // ============================================================================
    // CONSTRAINT FACTORY
    // ============================================================================
    /**
     * @class ConstraintFactory
     * @brief Adds generated constraints to a model
     *
     * @details Generators return GRBTempConstr, i.e. the result of comparing
     *          expressions with <=, >= or ==.
     */
    class ConstraintFactory {
    public:
        /**
         * @brief Single named row
         * @tparam Generator Callable () -> GRBTempConstr
         */
        template<typename Generator>
        static ConstraintGroup add(GRBModel& model,
            const std::string& name,
            Generator&& gen)
        {
            return ConstraintGroup(addConstrOpt(model, gen(), ::make_name::math(name)));
        }

        /**
         * @brief One row per key of the domain, named name[key]
         * @tparam Generator Callable (int key) -> GRBTempConstr
         */
        template<typename Generator>
        static ConstraintGroup addIndexed(GRBModel& model,
            const std::string& name,
            const IndexList& domain,
            Generator&& gen)
        {
            ConstraintGroup group;
            for (int key : domain) {
                group.add(key, addConstrOpt(model, gen(key), ::make_name::math(name, key)));
            }
            return group;
        }

    private:
        static GRBConstr addConstrOpt(GRBModel& model,
            const GRBTempConstr& tc,
            const std::string& name)
        {
            if constexpr (naming_enabled()) {
                return model.addConstr(tc, name);
            }
            else {
                (void)name;
                return model.addConstr(tc);
            }
        }
    };

    // ============================================================================
    // CONSTRAINT TABLE
    // ============================================================================
    /**
     * @class ConstraintTable
     * @brief Enum-keyed registry of constraint groups
     */
    template<typename EnumT>
    class ConstraintTable {
    public:
        static constexpr std::size_t MAX = enum_size_v<EnumT>;

    private:
        std::array<ConstraintGroup, MAX> table_;
        std::array<bool, MAX> filled_{};

        static std::size_t slot(EnumT key) {
            const std::size_t idx = enum_index(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("ConstraintTable: key {} >= {}", idx, MAX));
            }
            return idx;
        }

    public:
        void set(EnumT key, ConstraintGroup group) {
            const std::size_t idx = slot(key);
            table_[idx] = std::move(group);
            filled_[idx] = true;
        }

        /// @throws std::out_of_range if key is invalid or the slot was never set
        ConstraintGroup& get(EnumT key) {
            const std::size_t idx = slot(key);
            if (!filled_[idx]) {
                throw std::out_of_range(
                    std::format("ConstraintTable::get: slot {} is empty", idx));
            }
            return table_[idx];
        }

        const ConstraintGroup& get(EnumT key) const {
            return const_cast<ConstraintTable*>(this)->get(key);
        }

        ConstraintGroup& operator()(EnumT key) { return get(key); }
        const ConstraintGroup& operator()(EnumT key) const { return get(key); }

        /// @brief Total number of rows over all filled slots
        std::size_t rowCount() const {
            std::size_t n = 0;
            for (std::size_t i = 0; i < MAX; ++i) {
                if (filled_[i]) n += table_[i].size();
            }
            return n;
        }
    };

    // ============================================================================
    // CONSTRAINT ATTRIBUTES
    // ============================================================================

    inline double rhs(const GRBConstr& c) {
        return c.get(GRB_DoubleAttr_RHS);
    }

    inline char sense(const GRBConstr& c) {
        return c.get(GRB_CharAttr_Sense);
    }

    /// @throws GRBException if the model has no solution loaded
    inline double slack(const GRBConstr& c) {
        return c.get(GRB_DoubleAttr_Slack);
    }

} // namespace wavepick
