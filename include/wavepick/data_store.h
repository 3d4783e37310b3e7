#pragma once
/*
===============================================================================
DATA STORE — String-keyed metadata attached to a model builder
===============================================================================

OVERVIEW
--------
Every ModelBuilder owns a DataStore. Parameter setters record what they
applied under "param:<Name>" keys (TimeLimit, MIPGap, Threads, OutputFlag).
WaveModelBuilder records the size of the formulation under "model:" keys:
"model:capacityRows" (one row per active item) and "model:entries" (non-zero
quantities in the instance). GurobiEngine logs both after building.

    DataStore store;
    store["param:TimeLimit"] = 540.0;
    store["model:capacityRows"] = 120;

    double limit = store["param:TimeLimit"].get<double>();
    int rows     = store.at("model:capacityRows").get<int>();

EXCEPTION SAFETY
----------------
• get<T>() throws std::bad_any_cast on a type mismatch.
• DataStore::at() throws std::out_of_range for a key never recorded.

THREAD SAFETY
-------------
• None. A store belongs to one builder, which belongs to one solve.

===============================================================================
*/

#include <any>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace wavepick {

    /**
     * @class Value
     * @brief Type-erased value with checked access
     *
     * @note Types are matched exactly: a stored int is not readable as double.
     */
    class Value
    {
        std::any storage;

    public:
        Value() = default;

        template <typename T>
            requires (!std::is_same_v<std::remove_cvref_t<T>, Value>)
        Value(T&& v)
            : storage(std::forward<T>(v))
        {
        }

        template <typename T>
            requires (!std::is_same_v<std::remove_cvref_t<T>, Value>)
        Value& operator=(T&& v)
        {
            storage = std::forward<T>(v);
            return *this;
        }

        bool has_value() const noexcept { return storage.has_value(); }

        /// @brief True if the stored value is exactly of type T
        template <typename T>
        bool is() const noexcept
        {
            return storage.type() == typeid(T);
        }

        /// @throws std::bad_any_cast if the stored type is not T
        template <typename T>
        T& get()
        {
            return std::any_cast<T&>(storage);
        }

        /// @throws std::bad_any_cast if the stored type is not T
        template <typename T>
        const T& get() const
        {
            return std::any_cast<const T&>(storage);
        }
    };

    /// @brief Metadata map used by ModelBuilder::store()
    using DataStore = std::unordered_map<std::string, Value>;

} // namespace wavepick
