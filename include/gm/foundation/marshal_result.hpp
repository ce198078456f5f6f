#pragma once

/// @file marshal_result.hpp
/// @brief MarshalResult<T> type alias used across the library.

#include "gm/core/result.hpp"
#include "gm/foundation/marshal_error.hpp"

namespace gm::foundation {

/// Result type specialized with MarshalError.
///
/// Every writer, sink, model and config operation that can fail returns
/// MarshalResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   MarshalResult<void> writeTag(ByteSink& sink, uint8_t tag) {
///       if (sink.closed()) {
///           return MarshalResult<void>::err(
///               MarshalError(ErrorCode::SinkClosed, "sink is closed"));
///       }
///       return sink.writeByte(tag);
///   }
/// @endcode
template <typename T>
using MarshalResult = gm::Result<T, MarshalError>;

}  // namespace gm::foundation
