#pragma once
/*
===============================================================================
WAVEPICK — Unified Include Header
===============================================================================

OVERVIEW
--------
Single include for the wave-picking optimizer: the instance model, the MILP
formulation, the Gurobi engine, the post-solve checks and the solver that
ties them together.

WHAT'S INCLUDED
---------------
• instance.h, solution.h      — input data and candidate waves
• wave_model.h                — MILP formulation (ModelBuilder subclass)
• engine.h, gurobi_engine.h   — engine interface and Gurobi implementation
• extractor.h                 — engine values to candidate wave
• feasibility.h, objective.h  — independent re-check and true ratio
• wave_solver.h               — end-to-end solve with status reporting
• instance_io.h, config.h     — file formats, command-line settings
• time_budget.h, logging.h    — time bookkeeping and console logging

QUICK START
-----------
    #include <wavepick/wavepick.h>

    auto instance = wavepick::loadInstance("instance_0001.txt");
    auto budget = wavepick::TimeBudget::startingNow(600, 540, 30);

    wavepick::GurobiEngine engine;
    wavepick::WaveSolver solver(instance, engine);
    auto result = solver.solve(budget);

    if (result.ok()) {
        wavepick::saveSolution("wave.txt", *result.solution);
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) for <format>
• Gurobi Optimizer 10.0+ with the C++ API

CONFIGURATION
-------------
• WAVEPICK_DEBUG or _DEBUG defined: variables and constraints get readable
  names (order[3], cap[17]); otherwise they stay unnamed.

===============================================================================
*/

// ============================================================================
// MODELING LAYER
// ============================================================================

#include "naming.h"
#include "enum_utils.h"
#include "data_store.h"
#include "indexing.h"
#include "variables.h"
#include "constraints.h"
#include "expressions.h"
#include "model_builder.h"
#include "callbacks.h"
#include "diagnostics.h"

// ============================================================================
// WAVE PICKING
// ============================================================================

#include "errors.h"
#include "logging.h"
#include "instance.h"
#include "solution.h"
#include "extractor.h"
#include "feasibility.h"
#include "objective.h"
#include "time_budget.h"
#include "config.h"
#include "instance_io.h"
#include "engine.h"
#include "wave_model.h"
#include "progress_callback.h"
#include "gurobi_engine.h"
#include "wave_solver.h"
