#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration utilities for the shift roster engine
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a COUNT sentinel and a matching
size constant. Every registry in the engine (variable families, constraint
families, penalty families) is keyed by such an enum, so that tables can be
fixed-size arrays and reports can iterate every family in declaration order.

KEY COMPONENTS
--------------
• DECLARE_ENUM_WITH_COUNT: enum class + <Name>_COUNT constant
• EnumArray<Enum, T>: std::array sized by the enum, indexed by enumerator
• enum_size / is_valid_enum_value / enum_index
• forEachEnum(fn): visits every enumerator in declaration order

USAGE EXAMPLES
--------------
    DECLARE_ENUM_WITH_COUNT(Shift, Early, Late, Night);

    roster::EnumArray<Shift, int> staffed{};
    staffed[Shift::Late] = 3;

    roster::forEachEnum<Shift>([&](Shift s) { total += staffed[s]; });

DEPENDENCIES
------------
• <array>, <cstddef>

THREAD SAFETY
-------------
• No mutable shared state

EXCEPTION SAFETY
----------------
• EnumArray::at throws std::out_of_range for the COUNT sentinel
• Everything else is noexcept

===============================================================================
*/

#include <array>
#include <cstddef>
#include <stdexcept>
#include <format>

/**
 * @macro DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a trailing COUNT sentinel
 *
 * @param Name The name of the enumeration type
 * @param ...  Enumerator identifiers (at least one)
 *
 * @details Expands to
 *     enum class Name { ..., COUNT };
 *     static constexpr std::size_t Name_COUNT = <number of enumerators>;
 *
 * @warning Do not list COUNT yourself.
 */
#define DECLARE_ENUM_WITH_COUNT(Name, ...)                                \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace roster {

    /**
     * @brief Compile-time enumeration size trait
     *
     * @tparam Enum Enumeration declared with DECLARE_ENUM_WITH_COUNT
     */
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    template<typename Enum>
    inline constexpr std::size_t enum_size_v = enum_size<Enum>::value;

    /// @brief Position of an enumerator, usable as an array index
    template<typename Enum>
    [[nodiscard]] constexpr std::size_t enum_index(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

    /**
     * @brief True if value names a user enumerator (not COUNT, not out of range)
     */
    template<typename Enum>
    [[nodiscard]] constexpr bool is_valid_enum_value(Enum value) noexcept {
        return enum_index(value) < enum_size_v<Enum>;
    }

    /**
     * @brief Visit every enumerator in declaration order
     *
     * @example
     *     forEachEnum<PenaltyFamily>([&](PenaltyFamily f) { log(f); });
     */
    template<typename Enum, typename Fn>
    constexpr void forEachEnum(Fn&& fn) {
        for (std::size_t i = 0; i < enum_size_v<Enum>; ++i) {
            fn(static_cast<Enum>(i));
        }
    }

    /**
     * @class EnumArray
     * @brief Fixed-size array indexed by enumerators instead of integers
     *
     * @tparam Enum Enumeration declared with DECLARE_ENUM_WITH_COUNT
     * @tparam T    Element type
     */
    template<typename Enum, typename T>
    class EnumArray {
    public:
        using storage_type = std::array<T, enum_size_v<Enum>>;

        EnumArray() = default;

        /// @brief Fill every slot with the same value
        explicit EnumArray(const T& fill) { data_.fill(fill); }

        T& operator[](Enum key) noexcept { return data_[enum_index(key)]; }
        const T& operator[](Enum key) const noexcept { return data_[enum_index(key)]; }

        /**
         * @brief Bounds-checked access
         * @throws std::out_of_range for COUNT or a cast out-of-range value
         */
        T& at(Enum key) {
            if (!is_valid_enum_value(key)) {
                throw std::out_of_range(
                    std::format("EnumArray::at: key {} >= {}", enum_index(key), enum_size_v<Enum>));
            }
            return data_[enum_index(key)];
        }

        const T& at(Enum key) const {
            return const_cast<EnumArray*>(this)->at(key);
        }

        [[nodiscard]] static constexpr std::size_t size() noexcept { return enum_size_v<Enum>; }

        auto begin() noexcept { return data_.begin(); }
        auto end() noexcept { return data_.end(); }
        auto begin() const noexcept { return data_.begin(); }
        auto end() const noexcept { return data_.end(); }

        bool operator==(const EnumArray&) const = default;

    private:
        storage_type data_{};
    };

} // namespace roster
