#pragma once

/**
 * Chronicle event sourcing library
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Helper utilities
#include "helpers.hpp"
#include "validation.hpp"

// Ambient services
#include "logging.hpp"
#include "config.hpp"

// Registration macros
#include "macros.hpp"

// Write side
#include "aggregate.hpp"
#include "event_store.hpp"
#include "in_memory_event_store.hpp"
#include "repository.hpp"

// Read side
#include "projector.hpp"
