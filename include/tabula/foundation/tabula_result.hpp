#pragma once

/// @file tabula_result.hpp
/// @brief TabulaResult<T> type alias for subsystem error handling.

#include "tabula/core/result.hpp"
#include "tabula/foundation/tabula_error.hpp"

namespace tabula::foundation {

/// Result type specialized with TabulaError.
///
/// Example:
/// @code
///   TabulaResult<int> readCounter(const PreferenceStore& prefs) {
///       auto value = prefs.getInt("dex.number", 1);
///       if (value.hasError()) {
///           return TabulaResult<int>::err(value.error());
///       }
///       return TabulaResult<int>::ok(value.value());
///   }
/// @endcode
template <typename T>
using TabulaResult = tabula::Result<T, TabulaError>;

}  // namespace tabula::foundation
