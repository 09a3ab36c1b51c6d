#pragma once

// Core types
#include "core/types.hpp"
#include "core/figure.hpp"
#include "core/flags.hpp"
#include "core/parse.hpp"
#include "core/config.hpp"

// Problem definitions
#include "problem/problem.hpp"
#include "problem/loader.hpp"

// Figure generation
#include "engine/engine.hpp"
#include "engine/adjustment_engine.hpp"

// Worker session and hand-off
#include "session/control_channel.hpp"
#include "session/figure_slot.hpp"
#include "session/generation_worker.hpp"
#include "session/session.hpp"

// Rendering
#include "render/projector.hpp"
#include "render/render_loop.hpp"

// UI state
#include "panel/control_panel.hpp"

// Random number generation
#include "random/rng.hpp"
