// This is the single entry point for the retrykit library.
// Include this file to get access to the public API.

#pragma once

// Retry sessions
#include "retrykit/core/retry/attempt_budget.hpp"
#include "retrykit/core/retry/call_args.hpp"
#include "retrykit/core/retry/retry_loop.hpp"
#include "retrykit/core/retry/scale_duration.hpp"
#include "retrykit/core/retry/hooks.hpp"

// Errors and logging
#include "retrykit/core/util/error_types.hpp"
#include "retrykit/core/util/logger.hpp"

// Time sources
#include "retrykit/core/interfaces/IClock.hpp"
#include "retrykit/core/clock/wall_clock.hpp"
#include "retrykit/core/clock/recording_clock.hpp"

// JSON configuration
#include "retrykit/config/policy_config.hpp"
