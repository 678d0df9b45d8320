#pragma once
/*
===============================================================================
KEYS — Registry keys for variable, constraint and penalty families
===============================================================================

Every Gurobi object the engine creates belongs to exactly one family below.
Constraint families carry a stable name prefix; the prefix is written into
each constraint name with force_name:: so that an IIS can be translated back
into the families that caused an infeasibility.

===============================================================================
*/

#include <optional>
#include <string_view>

#include "enum_utils.h"

namespace roster {

    /// Decision and auxiliary variable families.
    DECLARE_ENUM_WITH_COUNT(RosterVar,
        Assign,           ///< x[e,d,s]: employee e works shift s on horizon day d
        Works,            ///< w[e,t,s]: timeline indicator incl. history days
        RestViolation,    ///< forbidden transition between adjacent days
        StreakViolation,  ///< consecutive-day window fully worked
        HoursDeviation,   ///< |hours - team average|
        HoursShortfall,   ///< weekly hours under target
        RotationWeek,     ///< u[e,k,s]: shift s worked at least once in week k
        RotationBreak);   ///< week-to-week change against the rotation order

    /// Constraint families, hard rules first.
    DECLARE_ENUM_WITH_COUNT(ConstraintFamily,
        OneShiftPerDay,
        StaffingMin,
        StaffingMax,
        LockedAssignment,
        WeeklyHoursCeiling,
        FloaterReserve,
        WorksLink,
        WorksPin,
        RestLink,
        StreakLink,
        FairnessLink,
        MinimumHoursLink,
        RotationLink);

    /// Soft rule families, highest weight tier first.
    DECLARE_ENUM_WITH_COUNT(PenaltyFamily,
        RestTime,
        ConsecutiveDays,
        MinimumHours,
        Fairness,
        TeamRotation);   ///< shares the lowest tier with Fairness

    // ============================================================================
    // NAMES
    // ============================================================================

    [[nodiscard]] constexpr std::string_view familyName(ConstraintFamily f) noexcept {
        switch (f) {
            case ConstraintFamily::OneShiftPerDay:     return "one_shift";
            case ConstraintFamily::StaffingMin:        return "staff_min";
            case ConstraintFamily::StaffingMax:        return "staff_max";
            case ConstraintFamily::LockedAssignment:   return "locked";
            case ConstraintFamily::WeeklyHoursCeiling: return "week_hours";
            case ConstraintFamily::FloaterReserve:     return "floater_reserve";
            case ConstraintFamily::WorksLink:          return "works_link";
            case ConstraintFamily::WorksPin:           return "works_pin";
            case ConstraintFamily::RestLink:           return "rest";
            case ConstraintFamily::StreakLink:         return "streak";
            case ConstraintFamily::FairnessLink:       return "fair";
            case ConstraintFamily::MinimumHoursLink:   return "min_hours";
            case ConstraintFamily::RotationLink:       return "rotation";
            case ConstraintFamily::COUNT:              break;
        }
        return "unknown";
    }

    [[nodiscard]] constexpr std::string_view familyName(PenaltyFamily f) noexcept {
        switch (f) {
            case PenaltyFamily::RestTime:        return "rest_time";
            case PenaltyFamily::ConsecutiveDays: return "consecutive_days";
            case PenaltyFamily::MinimumHours:    return "minimum_hours";
            case PenaltyFamily::Fairness:        return "fairness";
            case PenaltyFamily::TeamRotation:    return "team_rotation";
            case PenaltyFamily::COUNT:           break;
        }
        return "unknown";
    }

    /// @brief Name prefix of a variable family (used by make_name::)
    [[nodiscard]] constexpr std::string_view familyName(RosterVar v) noexcept {
        switch (v) {
            case RosterVar::Assign:          return "x";
            case RosterVar::Works:           return "w";
            case RosterVar::RestViolation:   return "v_rest";
            case RosterVar::StreakViolation: return "v_streak";
            case RosterVar::HoursDeviation:  return "dev";
            case RosterVar::HoursShortfall:  return "v_hours";
            case RosterVar::RotationWeek:    return "u_rot";
            case RosterVar::RotationBreak:   return "v_rot";
            case RosterVar::COUNT:           break;
        }
        return "unknown";
    }

    /**
     * @brief Map a constraint name prefix back to its family
     * @return std::nullopt for names the engine did not create
     */
    [[nodiscard]] constexpr std::optional<ConstraintFamily> parseConstraintFamily(std::string_view base) noexcept {
        for (std::size_t i = 0; i < ConstraintFamily_COUNT; ++i) {
            auto f = static_cast<ConstraintFamily>(i);
            if (familyName(f) == base) {
                return f;
            }
        }
        return std::nullopt;
    }

    /// @brief True for families that encode a business rule rather than a linearization
    [[nodiscard]] constexpr bool isHardRule(ConstraintFamily f) noexcept {
        switch (f) {
            case ConstraintFamily::OneShiftPerDay:
            case ConstraintFamily::StaffingMin:
            case ConstraintFamily::StaffingMax:
            case ConstraintFamily::LockedAssignment:
            case ConstraintFamily::WeeklyHoursCeiling:
            case ConstraintFamily::FloaterReserve:
                return true;
            default:
                return false;
        }
    }

} // namespace roster
