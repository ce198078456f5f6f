#pragma once

/// @file gm.hpp
/// @brief Main include for graph_marshal.

#include "gm/core/result.hpp"
#include "gm/foundation/foundation.hpp"
#include "gm/marshal/byte_sink.hpp"
#include "gm/marshal/identity_cache.hpp"
#include "gm/marshal/marshal_options.hpp"
#include "gm/marshal/marshal_writer.hpp"
#include "gm/marshal/type_classifier.hpp"
#include "gm/marshal/value.hpp"
#include "gm/marshal/varint.hpp"
#include "gm/version.hpp"
