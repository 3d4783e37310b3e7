#pragma once
/*
===============================================================================
ENUM UTILS — Registry keys for the wave model's variable and constraint tables
===============================================================================

OVERVIEW
--------
VariableTable and ConstraintTable are fixed-size arrays indexed by an enum
class. The macro below declares such an enum together with a trailing COUNT
sentinel, so the table size follows the enumerator list without manual
bookkeeping.

USAGE
-----
    WAVEPICK_DECLARE_ENUM_WITH_COUNT(WaveVars, Order, Aisle, Units);

    // expands to:
    //   enum class WaveVars { Order, Aisle, Units, COUNT };
    //   static constexpr std::size_t WaveVars_COUNT = 3;

    VariableTable<WaveVars> vars;          // three slots
    std::size_t slot = enum_index(WaveVars::Aisle);   // 1

NOTES
-----
• COUNT is always last and is not a domain value.
• Enumerators are sequential from 0.
• Everything here is compile-time; nothing allocates or throws.

===============================================================================
*/

#include <cstddef>

/**
 * @macro WAVEPICK_DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a COUNT sentinel and a <Name>_COUNT constant
 *
 * @param Name Enumeration type name
 * @param ...  At least one enumerator
 */
#define WAVEPICK_DECLARE_ENUM_WITH_COUNT(Name, ...)                       \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace wavepick {

    /**
     * @brief Number of enumerators of a COUNT-terminated enum
     */
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    template<typename Enum>
    inline constexpr std::size_t enum_size_v = enum_size<Enum>::value;

    /// @brief Table slot of an enumerator
    template<typename Enum>
    constexpr std::size_t enum_index(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

} // namespace wavepick
