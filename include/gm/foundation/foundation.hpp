#pragma once

/// @file foundation.hpp
/// @brief Aggregate header for the foundation layer.
///
/// Provides error codes, MarshalError and MarshalResult, the category
/// logger and YAML configuration management.

#include "gm/foundation/config_manager.hpp"
#include "gm/foundation/error_code.hpp"
#include "gm/foundation/marshal_error.hpp"
#include "gm/foundation/marshal_logger.hpp"
#include "gm/foundation/marshal_result.hpp"
