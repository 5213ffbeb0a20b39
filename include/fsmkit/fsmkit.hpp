#pragma once

// Core utilities
#include "core/error.hpp"
#include "core/event_queue.hpp"
#include "core/log.hpp"

// State machine
#include "state/state.hpp"
