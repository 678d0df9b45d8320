#pragma once
/*
===============================================================================
ENTITIES — Calendar & entity model of a planning problem
===============================================================================

OVERVIEW
--------
Plain records describe what the caller knows (employees, teams, shift types,
absences, locked assignments, shifts worked before the horizon). They are
collected in an InstanceInput and frozen by ProblemInstance::build(), which

    * validates every record and every cross-record invariant,
    * collects ALL problems before throwing one ModelConstructionError,
    * sorts entities by id so that model construction is deterministic,
    * precomputes index tables (absence per employee-day, prior shift per
      employee-day, active shift types per day).

After build() the instance is immutable and is the only thing the model
layer reads. It never changes during a solve.

KEY COMPONENTS
--------------
• Employee, Team, ShiftType, Absence    — input records
• LockedAssignment                      — caller-fixed (employee, day, shift)
• PriorShift                            — shift worked before the horizon
• CalendarDay                           — date, day class, active shift types
• ProblemInstance                       — validated, index-based snapshot

INDEXING
--------
Employees, shift types and horizon days are addressed by dense indices
(e, s, d). History days use a timeline index t in [-lookback(), dayCount()),
where t < 0 is before the horizon and t == d for horizon days. The look-back
spans at least the six days a horizon can start after its ISO week's Monday,
and longer when a shift type allows longer streaks.

THREAD SAFETY
-------------
• A built ProblemInstance is immutable; concurrent reads are safe

EXCEPTION SAFETY
----------------
• build(): throws ModelConstructionError; no partial instance escapes
• index accessors throw std::out_of_range for unknown ids

===============================================================================
*/

#include <string>
#include <vector>
#include <optional>
#include <array>
#include <map>
#include <utility>
#include <unordered_map>
#include <unordered_set>
#include <algorithm>
#include <format>
#include <stdexcept>

#include "absl/log/log.h"

#include "calendar.h"
#include "errors.h"

namespace roster {

    using EmployeeId = int;
    using TeamId = int;
    using ShiftTypeId = int;

    /// History days needed to see the whole ISO week before the horizon start.
    inline constexpr int kWeekLookback = 6;

    // ============================================================================
    // INPUT RECORDS
    // ============================================================================

    enum class Designation { None, Administrator, Floater };

    struct Employee {
        EmployeeId id = 0;
        std::string name;
        bool active = true;
        std::optional<TeamId> team;
        Designation designation = Designation::None;
    };

    struct Team {
        TeamId id = 0;
        std::string name;
        std::vector<EmployeeId> members;       ///< ordered
        std::vector<ShiftTypeId> shiftTypes;   ///< shift types the team may cover
    };

    struct StaffingBounds {
        int min = 0;
        int max = 0;
    };

    /**
     * @struct ShiftType
     * @brief A named work period with its own hours and staffing rules
     */
    struct ShiftType {
        ShiftTypeId id = 0;
        std::string code;
        std::string name;
        ClockTime start;
        ClockTime end;
        double hours = 8.0;                ///< nominal duration, > 0
        StaffingBounds weekday;
        StaffingBounds weekend;
        double weeklyHours = 40.0;         ///< nominal weekly hours (minimum-hours target)
        double maxWeeklyHours = 48.0;      ///< weekly ceiling
        int maxConsecutiveDays = 6;        ///< days in a row before a mandatory break
        WeekdayMask activeDays = kEveryDay;

        [[nodiscard]] const StaffingBounds& bounds(DayClass c) const noexcept {
            return c == DayClass::Weekend ? weekend : weekday;
        }

        [[nodiscard]] bool activeOn(Date d) const {
            return activeDays.test(static_cast<std::size_t>(weekdayIndex(d)));
        }
    };

    /**
     * @brief Shift type whose duration is derived from its clock times
     */
    inline ShiftType makeShiftType(ShiftTypeId id, std::string code, std::string_view start, std::string_view end) {
        ShiftType st;
        st.id = id;
        st.code = code;
        st.name = std::move(code);
        st.start = parseClock(start);
        st.end = parseClock(end);
        st.hours = spanHours(st.start, st.end);
        return st;
    }

    /**
     * @brief Early / late / night rotation used by most control-room teams
     *
     * @details F 05:45-13:45, S 13:45-21:45, N 21:45-05:45. Night shifts allow
     *          at most three consecutive days.
     */
    inline std::vector<ShiftType> standardShiftTypes() {
        auto f = makeShiftType(1, "F", "05:45", "13:45");
        f.name = "Early";
        f.weekday = { 4, 8 };
        f.weekend = { 2, 3 };

        auto s = makeShiftType(2, "S", "13:45", "21:45");
        s.name = "Late";
        s.weekday = { 3, 6 };
        s.weekend = { 2, 3 };

        auto n = makeShiftType(3, "N", "21:45", "05:45");
        n.name = "Night";
        n.weekday = { 3, 4 };
        n.weekend = { 2, 3 };
        n.maxConsecutiveDays = 3;

        return { f, s, n };
    }

    /**
     * @struct Absence
     * @brief Blocks every assignment of one employee over an inclusive range
     */
    struct Absence {
        EmployeeId employee = 0;
        std::string type;       ///< e.g. "AU" sick, "U" vacation, "L" training
        DateRange range;
    };

    struct LockedAssignment {
        EmployeeId employee = 0;
        Date date;
        ShiftTypeId shiftType = 0;
    };

    struct PriorShift {
        EmployeeId employee = 0;
        Date date;
        ShiftTypeId shiftType = 0;
    };

    /**
     * @struct ShiftAssignment
     * @brief One confirmed (employee, day, shift type) triple of a roster
     */
    struct ShiftAssignment {
        EmployeeId employee = 0;
        Date date;
        ShiftTypeId shiftType = 0;
        std::string shiftCode;
        double hours = 0.0;

        bool operator==(const ShiftAssignment&) const = default;
    };

    /// Everything the caller hands over for one planning request.
    struct InstanceInput {
        DateRange horizon;
        std::vector<Employee> employees;
        std::vector<Team> teams;
        std::vector<ShiftType> shiftTypes;
        std::vector<Absence> absences;
        std::vector<LockedAssignment> locks;
        std::vector<PriorShift> history;
    };

    struct CalendarDay {
        Date date;
        DayClass dayClass = DayClass::Weekday;
        std::vector<int> activeShifts;   ///< shift type indices
    };

    // ============================================================================
    // PROBLEM INSTANCE
    // ============================================================================

    /**
     * @class ProblemInstance
     * @brief Validated, immutable snapshot of one planning request
     */
    class ProblemInstance {
    public:
        /**
         * @brief Validate and freeze an input snapshot
         * @throws ModelConstructionError listing every violated invariant
         */
        static ProblemInstance build(InstanceInput input) {
            ProblemInstance inst;
            std::vector<std::string> issues;

            inst.horizon_ = input.horizon;
            if (!input.horizon.valid()) {
                issues.push_back(std::format("planning horizon {}..{} ends before it starts",
                    formatDate(input.horizon.first), formatDate(input.horizon.last)));
            }

            auto byId = [](const auto& a, const auto& b) { return a.id < b.id; };
            std::sort(input.employees.begin(), input.employees.end(), byId);
            std::sort(input.teams.begin(), input.teams.end(), byId);
            std::sort(input.shiftTypes.begin(), input.shiftTypes.end(), byId);

            inst.employees_ = std::move(input.employees);
            inst.teams_ = std::move(input.teams);
            inst.shiftTypes_ = std::move(input.shiftTypes);

            inst.indexEntities(issues);
            inst.validateShiftTypes(issues);
            inst.validateMemberships(issues);

            if (!issues.empty()) {
                throw ModelConstructionError(std::move(issues));
            }

            inst.buildCalendar();
            inst.indexAbsences(std::move(input.absences), issues);
            inst.indexHistory(input.history, issues);
            inst.indexLocks(input.locks, issues);

            if (!issues.empty()) {
                throw ModelConstructionError(std::move(issues));
            }

            VLOG(1) << "problem instance: " << inst.employees_.size() << " employees, "
                    << inst.teams_.size() << " teams, " << inst.shiftTypes_.size()
                    << " shift types, " << inst.dayCount() << " days";
            return inst;
        }

        // ------------------------------------------------------------------------
        // Entities
        // ------------------------------------------------------------------------

        [[nodiscard]] const DateRange& horizon() const noexcept { return horizon_; }
        [[nodiscard]] const std::vector<Employee>& employees() const noexcept { return employees_; }
        [[nodiscard]] const std::vector<Team>& teams() const noexcept { return teams_; }
        [[nodiscard]] const std::vector<ShiftType>& shiftTypes() const noexcept { return shiftTypes_; }
        [[nodiscard]] const std::vector<Absence>& absences() const noexcept { return absences_; }
        [[nodiscard]] const std::vector<CalendarDay>& days() const noexcept { return days_; }

        [[nodiscard]] int employeeCount() const noexcept { return static_cast<int>(employees_.size()); }
        [[nodiscard]] int shiftCount() const noexcept { return static_cast<int>(shiftTypes_.size()); }
        [[nodiscard]] int dayCount() const noexcept { return static_cast<int>(days_.size()); }

        /// Locks that survived absence resolution, as (e, d, s) indices.
        [[nodiscard]] const std::vector<std::array<int, 3>>& locks() const noexcept { return locks_; }

        /// Locks dropped because an absence covers their day.
        [[nodiscard]] const std::vector<LockedAssignment>& droppedLocks() const noexcept { return droppedLocks_; }

        [[nodiscard]] int employeeIndex(EmployeeId id) const {
            auto it = employeeIdx_.find(id);
            if (it == employeeIdx_.end()) {
                throw std::out_of_range(std::format("ProblemInstance: unknown employee {}", id));
            }
            return it->second;
        }

        [[nodiscard]] int shiftIndex(ShiftTypeId id) const {
            auto it = shiftIdx_.find(id);
            if (it == shiftIdx_.end()) {
                throw std::out_of_range(std::format("ProblemInstance: unknown shift type {}", id));
            }
            return it->second;
        }

        /// @brief Horizon day index of a date, std::nullopt outside the horizon
        [[nodiscard]] std::optional<int> dayIndex(Date date) const noexcept {
            if (!horizon_.contains(date)) {
                return std::nullopt;
            }
            return daysBetween(horizon_.first, date);
        }

        // ------------------------------------------------------------------------
        // Eligibility
        // ------------------------------------------------------------------------

        /// @brief Team of employee e, nullptr when e has none
        [[nodiscard]] const Team* teamOf(int e) const {
            int t = teamOf_.at(static_cast<std::size_t>(e));
            return t < 0 ? nullptr : &teams_[static_cast<std::size_t>(t)];
        }

        [[nodiscard]] int teamIndexOf(int e) const { return teamOf_.at(static_cast<std::size_t>(e)); }

        /// @brief Employee can be rostered at all (active and in a team)
        [[nodiscard]] bool plannable(int e) const {
            return employees_.at(static_cast<std::size_t>(e)).active && teamIndexOf(e) >= 0;
        }

        /// @brief Indices of plannable employees, ascending
        [[nodiscard]] std::vector<int> plannableEmployees() const {
            std::vector<int> out;
            for (int e = 0; e < employeeCount(); ++e) {
                if (plannable(e)) {
                    out.push_back(e);
                }
            }
            return out;
        }

        /// @brief Plannable relief worker
        [[nodiscard]] bool floater(int e) const {
            return plannable(e) && employees_.at(static_cast<std::size_t>(e)).designation == Designation::Floater;
        }

        /// @brief Team of e covers shift type s
        [[nodiscard]] bool covers(int e, int s) const {
            int t = teamIndexOf(e);
            return t >= 0 && teamCovers_[static_cast<std::size_t>(t)][static_cast<std::size_t>(s)];
        }

        [[nodiscard]] bool shiftActive(int d, int s) const {
            const auto& a = days_.at(static_cast<std::size_t>(d)).activeShifts;
            return std::find(a.begin(), a.end(), s) != a.end();
        }

        /// @brief Absence type code blocking (e, d), std::nullopt when free
        [[nodiscard]] std::optional<std::string> absenceOn(int e, int d) const {
            int a = absenceOnDay_.at(static_cast<std::size_t>(e)).at(static_cast<std::size_t>(d));
            if (a < 0) {
                return std::nullopt;
            }
            return absences_[static_cast<std::size_t>(a)].type;
        }

        [[nodiscard]] bool blocked(int e, int d) const {
            return absenceOnDay_.at(static_cast<std::size_t>(e)).at(static_cast<std::size_t>(d)) >= 0;
        }

        /**
         * @brief (e, d, s) deserves a decision variable
         *
         * @details Employee plannable, team covers s, s runs on day d and no
         *          absence blocks the day.
         */
        [[nodiscard]] bool isCandidate(int e, int d, int s) const {
            return plannable(e) && covers(e, s) && shiftActive(d, s) && !blocked(e, d);
        }

        /// @brief True when there is nothing to solve
        [[nodiscard]] bool empty() const {
            for (int e : plannableEmployees()) {
                for (int d = 0; d < dayCount(); ++d) {
                    for (int s = 0; s < shiftCount(); ++s) {
                        if (isCandidate(e, d, s)) {
                            return false;
                        }
                    }
                }
            }
            return true;
        }

        // ------------------------------------------------------------------------
        // History
        // ------------------------------------------------------------------------

        /// @brief Number of days before the horizon that rules look back on (>= 6)
        [[nodiscard]] int lookback() const noexcept { return lookback_; }

        /**
         * @brief Shift type index worked on timeline day t < 0, or -1
         * @throws std::out_of_range if t is not a history day
         */
        [[nodiscard]] int priorShift(int e, int t) const {
            if (t >= 0 || t < -lookback_) {
                throw std::out_of_range(std::format("ProblemInstance::priorShift: {} is not a history day", t));
            }
            return history_.at(static_cast<std::size_t>(e)).at(static_cast<std::size_t>(t + lookback_));
        }

        /// @brief Date of timeline day t (negative t lies before the horizon)
        [[nodiscard]] Date timelineDate(int t) const noexcept {
            return horizon_.first + std::chrono::days{ t };
        }

    private:
        ProblemInstance() = default;

        // ------------------------------------------------------------------------
        // build() stages
        // ------------------------------------------------------------------------

        void indexEntities(std::vector<std::string>& issues) {
            for (std::size_t i = 0; i < employees_.size(); ++i) {
                if (!employeeIdx_.emplace(employees_[i].id, static_cast<int>(i)).second) {
                    issues.push_back(std::format("duplicate employee id {}", employees_[i].id));
                }
            }
            for (std::size_t i = 0; i < teams_.size(); ++i) {
                if (!teamIdx_.emplace(teams_[i].id, static_cast<int>(i)).second) {
                    issues.push_back(std::format("duplicate team id {}", teams_[i].id));
                }
            }
            std::unordered_set<std::string> codes;
            for (std::size_t i = 0; i < shiftTypes_.size(); ++i) {
                if (!shiftIdx_.emplace(shiftTypes_[i].id, static_cast<int>(i)).second) {
                    issues.push_back(std::format("duplicate shift type id {}", shiftTypes_[i].id));
                }
                if (!codes.insert(shiftTypes_[i].code).second) {
                    issues.push_back(std::format("duplicate shift type code '{}'", shiftTypes_[i].code));
                }
            }
        }

        void validateShiftTypes(std::vector<std::string>& issues) const {
            for (const auto& st : shiftTypes_) {
                if (st.code.empty()) {
                    issues.push_back(std::format("shift type {} has no code", st.id));
                }
                if (!(st.hours > 0.0)) {
                    issues.push_back(std::format("shift type '{}' has non-positive duration {}", st.code, st.hours));
                }
                for (auto [label, b] : { std::pair{ "weekday", st.weekday }, std::pair{ "weekend", st.weekend } }) {
                    if (b.min < 0 || b.max < 0) {
                        issues.push_back(std::format("shift type '{}' has negative {} staffing {}..{}",
                            st.code, label, b.min, b.max));
                    }
                    else if (b.min > b.max) {
                        issues.push_back(std::format("shift type '{}' has {} staffing minimum {} above maximum {}",
                            st.code, label, b.min, b.max));
                    }
                }
                if (st.maxConsecutiveDays < 1) {
                    issues.push_back(std::format("shift type '{}' allows {} consecutive days", st.code, st.maxConsecutiveDays));
                }
                if (!(st.maxWeeklyHours > 0.0)) {
                    issues.push_back(std::format("shift type '{}' has non-positive weekly ceiling", st.code));
                }
                if (st.weeklyHours < 0.0) {
                    issues.push_back(std::format("shift type '{}' has negative nominal weekly hours", st.code));
                }
            }
        }

        void validateMemberships(std::vector<std::string>& issues) {
            teamOf_.assign(employees_.size(), -1);
            teamCovers_.assign(teams_.size(), std::vector<bool>(shiftTypes_.size(), false));

            for (std::size_t t = 0; t < teams_.size(); ++t) {
                const auto& team = teams_[t];
                for (ShiftTypeId sid : team.shiftTypes) {
                    auto it = shiftIdx_.find(sid);
                    if (it == shiftIdx_.end()) {
                        issues.push_back(std::format("team {} covers unknown shift type {}", team.id, sid));
                        continue;
                    }
                    teamCovers_[t][static_cast<std::size_t>(it->second)] = true;
                }
                for (EmployeeId eid : team.members) {
                    auto it = employeeIdx_.find(eid);
                    if (it == employeeIdx_.end()) {
                        issues.push_back(std::format("team {} lists unknown employee {}", team.id, eid));
                        continue;
                    }
                    auto e = static_cast<std::size_t>(it->second);
                    if (teamOf_[e] >= 0) {
                        issues.push_back(std::format("employee {} belongs to teams {} and {}",
                            eid, teams_[static_cast<std::size_t>(teamOf_[e])].id, team.id));
                        continue;
                    }
                    if (employees_[e].team && *employees_[e].team != team.id) {
                        issues.push_back(std::format("employee {} is listed by team {} but assigned to team {}",
                            eid, team.id, *employees_[e].team));
                        continue;
                    }
                    teamOf_[e] = static_cast<int>(t);
                }
            }

            for (std::size_t e = 0; e < employees_.size(); ++e) {
                const auto& emp = employees_[e];
                if (!emp.team) {
                    continue;
                }
                if (teamIdx_.find(*emp.team) == teamIdx_.end()) {
                    issues.push_back(std::format("employee {} references unknown team {}", emp.id, *emp.team));
                }
                else if (teamOf_[e] < 0) {
                    issues.push_back(std::format("employee {} claims team {} but is not among its members",
                        emp.id, *emp.team));
                }
            }
        }

        void buildCalendar() {
            days_.clear();
            for (Date date : horizon_.days()) {
                CalendarDay day{ date, classify(date), {} };
                for (int s = 0; s < shiftCount(); ++s) {
                    if (shiftTypes_[static_cast<std::size_t>(s)].activeOn(date)) {
                        day.activeShifts.push_back(s);
                    }
                }
                days_.push_back(std::move(day));
            }

            lookback_ = kWeekLookback;
            for (const auto& st : shiftTypes_) {
                lookback_ = std::max(lookback_, st.maxConsecutiveDays);
            }
        }

        void indexAbsences(std::vector<Absence> absences, std::vector<std::string>& issues) {
            absenceOnDay_.assign(employees_.size(), std::vector<int>(days_.size(), -1));

            for (auto& a : absences) {
                auto it = employeeIdx_.find(a.employee);
                if (it == employeeIdx_.end()) {
                    issues.push_back(std::format("absence '{}' refers to unknown employee {}", a.type, a.employee));
                    continue;
                }
                if (!a.range.valid()) {
                    issues.push_back(std::format("absence '{}' of employee {} ends {} before it starts {}",
                        a.type, a.employee, formatDate(a.range.last), formatDate(a.range.first)));
                    continue;
                }
                if (a.type.empty()) {
                    issues.push_back(std::format("absence of employee {} has no type", a.employee));
                    continue;
                }

                int index = static_cast<int>(absences_.size());
                auto& row = absenceOnDay_[static_cast<std::size_t>(it->second)];
                if (auto clip = a.range.intersect(horizon_)) {
                    for (Date d : clip->days()) {
                        auto& slot = row[static_cast<std::size_t>(daysBetween(horizon_.first, d))];
                        if (slot < 0) {
                            slot = index;
                        }
                    }
                }
                absences_.push_back(std::move(a));
            }
        }

        void indexHistory(const std::vector<PriorShift>& history, std::vector<std::string>& issues) {
            history_.assign(employees_.size(), std::vector<int>(static_cast<std::size_t>(lookback_), -1));

            for (const auto& p : history) {
                auto eit = employeeIdx_.find(p.employee);
                auto sit = shiftIdx_.find(p.shiftType);
                if (eit == employeeIdx_.end() || sit == shiftIdx_.end()) {
                    issues.push_back(std::format("prior shift of employee {} on {} references unknown entities",
                        p.employee, formatDate(p.date)));
                    continue;
                }
                int t = daysBetween(horizon_.first, p.date);
                if (t >= 0) {
                    issues.push_back(std::format("prior shift of employee {} on {} is not before the horizon",
                        p.employee, formatDate(p.date)));
                    continue;
                }
                if (t < -lookback_) {
                    continue;
                }
                auto& slot = history_[static_cast<std::size_t>(eit->second)][static_cast<std::size_t>(t + lookback_)];
                if (slot >= 0 && slot != sit->second) {
                    issues.push_back(std::format("employee {} has two prior shifts on {}",
                        p.employee, formatDate(p.date)));
                    continue;
                }
                slot = sit->second;
            }
        }

        void indexLocks(const std::vector<LockedAssignment>& locks, std::vector<std::string>& issues) {
            std::map<std::pair<int, int>, int> lockedShiftOf;

            for (const auto& l : locks) {
                auto eit = employeeIdx_.find(l.employee);
                auto sit = shiftIdx_.find(l.shiftType);
                auto d = dayIndex(l.date);
                if (eit == employeeIdx_.end() || sit == shiftIdx_.end() || !d) {
                    issues.push_back(std::format("locked assignment of employee {} on {} is outside the instance",
                        l.employee, formatDate(l.date)));
                    continue;
                }
                int e = eit->second;
                int s = sit->second;

                if (blocked(e, *d)) {
                    LOG(WARNING) << "dropping locked assignment of employee " << l.employee << " on "
                                 << formatDate(l.date) << ": absence '" << *absenceOn(e, *d) << "' takes precedence";
                    droppedLocks_.push_back(l);
                    continue;
                }
                if (!isCandidate(e, *d, s)) {
                    issues.push_back(std::format("locked assignment of employee {} to '{}' on {} is not eligible",
                        l.employee, shiftTypes_[static_cast<std::size_t>(s)].code, formatDate(l.date)));
                    continue;
                }

                auto [it, inserted] = lockedShiftOf.emplace(std::pair{ e, *d }, s);
                if (!inserted) {
                    if (it->second != s) {
                        issues.push_back(std::format("employee {} has conflicting locked shifts on {}",
                            l.employee, formatDate(l.date)));
                    }
                    continue;
                }
                locks_.push_back({ e, *d, s });
            }
        }

        DateRange horizon_{};
        std::vector<Employee> employees_;
        std::vector<Team> teams_;
        std::vector<ShiftType> shiftTypes_;
        std::vector<Absence> absences_;
        std::vector<CalendarDay> days_;

        std::unordered_map<EmployeeId, int> employeeIdx_;
        std::unordered_map<TeamId, int> teamIdx_;
        std::unordered_map<ShiftTypeId, int> shiftIdx_;

        std::vector<int> teamOf_;
        std::vector<std::vector<bool>> teamCovers_;
        std::vector<std::vector<int>> absenceOnDay_;
        std::vector<std::vector<int>> history_;
        int lookback_ = kWeekLookback;

        std::vector<std::array<int, 3>> locks_;
        std::vector<LockedAssignment> droppedLocks_;
    };

} // namespace roster
