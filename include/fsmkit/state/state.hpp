#pragma once

// Core structures
#include "structure/action_set.hpp"
#include "structure/transition.hpp"

// Machines and builder
#include "active_machine.hpp"
#include "builder.hpp"
#include "machine.hpp"
#include "options.hpp"
