#pragma once
/*
===============================================================================
SHIFT ROSTER — Unified include header
===============================================================================

OVERVIEW
--------
Single include for the shift-assignment engine: problem model, Gurobi model
construction, solve driver and hour accounting.

QUICK START
-----------
    #include <shift_roster/shift_roster.h>

    roster::InstanceInput in;
    in.horizon = { roster::makeDate(2025, 3, 1), roster::makeDate(2025, 3, 31) };
    in.shiftTypes = roster::standardShiftTypes();
    in.employees = ...;
    in.teams = ...;
    in.absences = ...;

    auto instance = roster::ProblemInstance::build(std::move(in));

    roster::SolverConfig cfg(120.0);
    auto result = roster::SolverDriver(cfg).solve(instance);

    if (result.hasRoster()) {
        for (const auto& a : result.assignments) { ... }
    }
    else {
        for (const auto& r : result.report.reasons) { ... }
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 11+, Clang 14+, MSVC 19.29+)
• Gurobi Optimizer 10.0+ with C++ API
• Abseil (logging)

CONFIGURATION
-------------
• ROSTER_DEBUG (or _DEBUG): human-readable variable names ("x[3,12,1]").
  Constraint names are always written, release builds included.

===============================================================================
*/

// ============================================================================
// PROBLEM MODEL (no solver dependency)
// ============================================================================

#include "enum_utils.h"
#include "errors.h"
#include "calendar.h"
#include "keys.h"
#include "config.h"
#include "entities.h"
#include "hour_accounting.h"

// ============================================================================
// MODEL CONSTRUCTION
// ============================================================================

// Containers over Gurobi objects
#include "naming.h"
#include "variables.h"
#include "constraints.h"
#include "expressions.h"

// Decision variables, hard rules, soft rules, objective
#include "fabric.h"
#include "hard_constraints.h"
#include "penalties.h"
#include "objective.h"

// ============================================================================
// SOLVE
// ============================================================================

#include "model_builder.h"
#include "solve_monitor.h"
#include "diagnostics.h"
#include "roster_builder.h"
#include "solver_driver.h"
