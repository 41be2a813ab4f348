#pragma once

// erlangcore: Contact-center staffing engine
//
// Sizes agent headcount from volume, handle time and service objectives
// using the Erlang B, C and A queueing models, and evaluates what a fixed
// headcount can achieve under an occupancy cap.

// Core
#include "erlangcore/types.hpp"
#include "erlangcore/exceptions.hpp"
#include "erlangcore/config.hpp"

// Queueing models
#include "erlangcore/traffic_model.hpp"
#include "erlangcore/erlang_b.hpp"
#include "erlangcore/erlang_c.hpp"
#include "erlangcore/erlang_a.hpp"
#include "erlangcore/service_level_projector.hpp"

// Solvers
#include "erlangcore/staffing_search.hpp"
#include "erlangcore/shrinkage.hpp"
#include "erlangcore/achievable_metrics.hpp"
#include "erlangcore/staffing_engine.hpp"

// Request facade
#include "erlangcore/input_validation.hpp"
#include "erlangcore/monitor.hpp"
#include "erlangcore/staffing_calculator.hpp"
