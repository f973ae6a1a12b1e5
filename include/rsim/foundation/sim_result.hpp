#pragma once

/// @file sim_result.hpp
/// @brief SimResult<T> type alias for simulator error handling.

#include "rsim/core/result.hpp"
#include "rsim/foundation/sim_error.hpp"

namespace rsim::foundation {

/// Result type specialized with SimError.
///
/// Example:
/// @code
///   SimResult<double> parseRating(double raw) {
///       if (!std::isfinite(raw)) {
///           return SimResult<double>::err(
///               SimError(ErrorCode::InvalidArgument, "rating must be finite"));
///       }
///       return SimResult<double>::ok(raw);
///   }
/// @endcode
template <typename T>
using SimResult = rsim::Result<T, SimError>;

}  // namespace rsim::foundation
