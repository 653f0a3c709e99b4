#pragma once

/// @file core.hpp
/// @brief Main include header for tableau_core
///
/// tableau_core provides the error and logging foundation shared by the
/// scene graph and compositor modules:
/// - Error / Result: local error propagation without exceptions
/// - Named spdlog loggers per module

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
