#pragma once
/*
===============================================================================
NAMING — Symbolic names for solver variables and constraints
===============================================================================

OVERVIEW
--------
Builds the names attached to Gurobi variables and constraints. Two flavours:

• make_name::   debug-only names. Empty strings unless ROSTER_DEBUG (or
                _DEBUG) is defined, so release models carry no name storage.
• force_name::  always-on names. Used for constraint families that must be
                recognisable after an IIS computation (see diagnostics.h).

Names follow the math style "base[i,j,k]". baseOf() recovers "base" from such
a name, which is how an IIS member is mapped back to its constraint family.

USAGE EXAMPLES
--------------
    auto v = make_name::math("x", e, d, s);        // "x[3,12,1]" or ""
    auto c = force_name::math("staff_min", d, s);  // always "staff_min[12,1]"
    baseOf("staff_min[12,1]");                     // "staff_min"

DEPENDENCIES
------------
• <string>, <string_view>, <format>, <concepts>, <vector>

THREAD SAFETY
-------------
• Stateless free functions

EXCEPTION SAFETY
----------------
• Throws std::invalid_argument on an empty base with indices
• std::bad_alloc propagates

===============================================================================
*/

#include <string>
#include <string_view>
#include <stdexcept>
#include <type_traits>
#include <concepts>
#include <format>
#include <vector>

// ============================================================================
// BUILD CONFIGURATION
// ============================================================================
#if defined(ROSTER_DEBUG) || defined(_DEBUG)
inline constexpr bool ROSTER_DEBUG_NAMES = true;
#else
inline constexpr bool ROSTER_DEBUG_NAMES = false;
#endif

namespace roster {

    /// @brief True when debug names are compiled in
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return ROSTER_DEBUG_NAMES;
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
        inline std::string math_impl(std::string_view base, Indices... idx) {
            constexpr std::size_t N = sizeof...(idx);
            check_base_name(base, N > 0);

            if constexpr (N == 0) {
                return std::string(base);
            }
            else {
                std::string result;
                result.reserve(base.size() + (N * 6) + 2);
                result.append(base).append("[");

                bool first = true;
                ((result.append(first ? (first = false, "") : ",")
                    .append(std::to_string(static_cast<long long>(idx)))), ...);

                result.append("]");
                return result;
            }
        }

        inline std::string math_impl(std::string_view base, const std::vector<int>& idx) {
            check_base_name(base, !idx.empty());
            if (idx.empty()) {
                return std::string(base);
            }

            std::string result(base);
            result.append("[");
            for (std::size_t k = 0; k < idx.size(); ++k) {
                if (k > 0) {
                    result.append(",");
                }
                result.append(std::to_string(idx[k]));
            }
            result.append("]");
            return result;
        }

    } // namespace naming_detail

    // ============================================================================
    // make_name: debug only
    // ============================================================================
    namespace make_name {

        template<naming_detail::Integral... Indices>
        inline std::string math(std::string_view base, Indices... idx) {
            if constexpr (!naming_enabled()) {
                return {};
            }
            else {
                return naming_detail::math_impl(base, idx...);
            }
        }

        inline std::string math(std::string_view base, const std::vector<int>& idx) {
            if constexpr (!naming_enabled()) {
                return {};
            }
            else {
                return naming_detail::math_impl(base, idx);
            }
        }

    } // namespace make_name

    // ============================================================================
    // force_name: always on
    // ============================================================================
    namespace force_name {

        template<naming_detail::Integral... Indices>
        inline std::string math(std::string_view base, Indices... idx) {
            return naming_detail::math_impl(base, idx...);
        }

        inline std::string math(std::string_view base, const std::vector<int>& idx) {
            return naming_detail::math_impl(base, idx);
        }

        template<typename... Args>
        inline std::string format(std::format_string<Args...> fmt, Args&&... args) {
            return std::format(fmt, std::forward<Args>(args)...);
        }

    } // namespace force_name

    /**
     * @brief Strip the index suffix of a math-style name
     * @return "base" for "base[1,2]"; the whole name if it has no '['
     */
    [[nodiscard]] inline std::string_view baseOf(std::string_view name) noexcept {
        auto pos = name.find('[');
        return pos == std::string_view::npos ? name : name.substr(0, pos);
    }

} // namespace roster
