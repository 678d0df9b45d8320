#pragma once
/*
===============================================================================
CALENDAR — Dates, clock times and planning ranges
===============================================================================

OVERVIEW
--------
Thin layer over <chrono> calendar types:

• Date        std::chrono::sys_days (day precision, arithmetic in days)
• DateRange   inclusive [first, last] with intersection and day listing
• ClockTime   minutes since midnight, parsed from "HH:MM"
• WeekdayMask which ISO weekdays (Mon=0 .. Sun=6) a shift type runs on
• DayClass    Weekday / Weekend, selects the staffing bounds of a day

Weeks are ISO weeks (Monday..Sunday); weekStart() returns the Monday.

EXCEPTION SAFETY
----------------
• Parsers throw std::invalid_argument with the offending text
• Everything else is noexcept

===============================================================================
*/

#include <chrono>
#include <string>
#include <string_view>
#include <charconv>
#include <stdexcept>
#include <format>
#include <optional>
#include <vector>
#include <bitset>
#include <algorithm>

namespace roster {

    using Date = std::chrono::sys_days;

    enum class DayClass { Weekday, Weekend };

    /// ISO weekday set, bit 0 = Monday.
    using WeekdayMask = std::bitset<7>;

    inline const WeekdayMask kEveryDay{ 0b1111111 };
    inline const WeekdayMask kMondayToFriday{ 0b0011111 };

    // ============================================================================
    // DATES
    // ============================================================================

    /**
     * @brief Build a date from calendar fields
     * @throws std::invalid_argument if the fields do not name a real date
     */
    inline Date makeDate(int y, unsigned m, unsigned d) {
        std::chrono::year_month_day ymd{ std::chrono::year{ y }, std::chrono::month{ m }, std::chrono::day{ d } };
        if (!ymd.ok()) {
            throw std::invalid_argument(std::format("makeDate: {}-{}-{} is not a valid date", y, m, d));
        }
        return Date{ ymd };
    }

    namespace calendar_detail {

        inline int parseField(std::string_view text, std::string_view whole) {
            int value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size()) {
                throw std::invalid_argument(std::format("cannot parse '{}'", whole));
            }
            return value;
        }

    } // namespace calendar_detail

    /**
     * @brief Parse an ISO date "YYYY-MM-DD"
     * @throws std::invalid_argument on malformed text or an impossible date
     */
    inline Date parseDate(std::string_view text) {
        if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
            throw std::invalid_argument(std::format("parseDate: '{}' is not YYYY-MM-DD", text));
        }
        int y = calendar_detail::parseField(text.substr(0, 4), text);
        int m = calendar_detail::parseField(text.substr(5, 2), text);
        int d = calendar_detail::parseField(text.substr(8, 2), text);
        return makeDate(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
    }

    /// @brief Format as "YYYY-MM-DD"
    inline std::string formatDate(Date date) {
        std::chrono::year_month_day ymd{ date };
        return std::format("{:04}-{:02}-{:02}",
            static_cast<int>(ymd.year()),
            static_cast<unsigned>(ymd.month()),
            static_cast<unsigned>(ymd.day()));
    }

    /// @brief ISO weekday index, Monday = 0 .. Sunday = 6
    [[nodiscard]] inline int weekdayIndex(Date date) noexcept {
        return static_cast<int>(std::chrono::weekday{ date }.iso_encoding()) - 1;
    }

    [[nodiscard]] inline bool isWeekend(Date date) noexcept {
        return weekdayIndex(date) >= 5;
    }

    [[nodiscard]] inline DayClass classify(Date date) noexcept {
        return isWeekend(date) ? DayClass::Weekend : DayClass::Weekday;
    }

    /// @brief Monday of the ISO week containing date
    [[nodiscard]] inline Date weekStart(Date date) noexcept {
        return date - std::chrono::days{ weekdayIndex(date) };
    }

    /// @brief Signed number of days from a to b
    [[nodiscard]] inline int daysBetween(Date a, Date b) noexcept {
        return static_cast<int>((b - a).count());
    }

    // ============================================================================
    // DATE RANGE
    // ============================================================================

    /**
     * @struct DateRange
     * @brief Inclusive date interval [first, last]
     */
    struct DateRange {
        Date first;
        Date last;

        [[nodiscard]] bool valid() const noexcept { return first <= last; }

        [[nodiscard]] bool contains(Date d) const noexcept {
            return first <= d && d <= last;
        }

        /// @brief Number of days covered, 0 for an inverted range
        [[nodiscard]] int dayCount() const noexcept {
            return valid() ? daysBetween(first, last) + 1 : 0;
        }

        /// @brief Overlap with another range, clipped to both
        [[nodiscard]] std::optional<DateRange> intersect(const DateRange& other) const noexcept {
            DateRange r{ std::max(first, other.first), std::min(last, other.last) };
            if (!r.valid()) {
                return std::nullopt;
            }
            return r;
        }

        [[nodiscard]] std::vector<Date> days() const {
            std::vector<Date> out;
            out.reserve(static_cast<std::size_t>(dayCount()));
            for (Date d = first; d <= last; d += std::chrono::days{ 1 }) {
                out.push_back(d);
            }
            return out;
        }

        bool operator==(const DateRange&) const = default;
    };

    // ============================================================================
    // CLOCK TIME
    // ============================================================================

    /**
     * @struct ClockTime
     * @brief Time of day in minutes since midnight
     */
    struct ClockTime {
        int minutes = 0;

        [[nodiscard]] double hours() const noexcept { return minutes / 60.0; }

        bool operator==(const ClockTime&) const = default;
        auto operator<=>(const ClockTime&) const = default;
    };

    /**
     * @brief Parse "HH:MM" (00:00 .. 23:59)
     * @throws std::invalid_argument on malformed text
     */
    inline ClockTime parseClock(std::string_view text) {
        if (text.size() != 5 || text[2] != ':') {
            throw std::invalid_argument(std::format("parseClock: '{}' is not HH:MM", text));
        }
        int h = calendar_detail::parseField(text.substr(0, 2), text);
        int m = calendar_detail::parseField(text.substr(3, 2), text);
        if (h < 0 || h > 23 || m < 0 || m > 59) {
            throw std::invalid_argument(std::format("parseClock: '{}' is out of range", text));
        }
        return ClockTime{ h * 60 + m };
    }

    inline std::string formatClock(ClockTime t) {
        return std::format("{:02}:{:02}", t.minutes / 60, t.minutes % 60);
    }

    /**
     * @brief Length of a shift in hours
     *
     * @note An end at or before the start wraps past midnight, so
     *       21:45 -> 05:45 is 8 hours and 00:00 -> 00:00 is 24 hours.
     */
    [[nodiscard]] inline double spanHours(ClockTime start, ClockTime end) noexcept {
        int span = end.minutes - start.minutes;
        if (span <= 0) {
            span += 24 * 60;
        }
        return span / 60.0;
    }

} // namespace roster
