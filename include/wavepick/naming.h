#pragma once
/*
===============================================================================
NAMING — Symbolic names for wave model variables and constraints
===============================================================================

OVERVIEW
--------
Gurobi accepts a name for every variable and constraint. Names make LP exports
and IIS reports readable but cost string building on models with tens of
thousands of order and aisle variables, so make_name:: produces them only in
debug builds (WAVEPICK_DEBUG or _DEBUG defined). Otherwise it returns an
empty string, which Gurobi treats as "no name".

CONVENTIONS
-----------
    make_name::math("cap", 17)    -> "cap[17]"
    make_name::math("order", 3)   -> "order[3]"
    make_name::math("N")          -> "N"

EXCEPTION SAFETY
----------------
• An empty base with indices throws std::invalid_argument when names are
  being produced.

===============================================================================
*/

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#if defined(WAVEPICK_DEBUG) || defined(_DEBUG)
inline constexpr bool WAVEPICK_DEBUG_NAMES = true;
#else
inline constexpr bool WAVEPICK_DEBUG_NAMES = false;
#endif

namespace wavepick {

    /// @brief True when make_name:: produces names (debug builds)
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return WAVEPICK_DEBUG_NAMES;
    }

    namespace naming_detail {

        template<typename T>
        concept Integral = std::is_integral_v<std::remove_cvref_t<T>>;

        inline void check_base_name(std::string_view base, bool has_indices) {
            if (has_indices && base.empty()) {
                throw std::invalid_argument(
                    "naming: base name cannot be empty when indices are present");
            }
        }

        template<Integral... Indices>
        std::string math_impl(std::string_view base, Indices... idx) {
            constexpr std::size_t N = sizeof...(idx);
            check_base_name(base, N > 0);

            std::string result(base);
            if constexpr (N > 0) {
                result.append("[");
                bool first = true;
                ((result.append(first ? (first = false, "") : ",")
                    .append(std::to_string(static_cast<long long>(idx)))), ...);
                result.append("]");
            }
            return result;
        }

    } // namespace naming_detail

} // namespace wavepick

namespace make_name {

    template<wavepick::naming_detail::Integral... Indices>
    std::string math(std::string_view base, Indices... idx) {
        if constexpr (!wavepick::naming_enabled()) {
            return {};
        }
        else {
            return wavepick::naming_detail::math_impl(base, idx...);
        }
    }

} // namespace make_name
