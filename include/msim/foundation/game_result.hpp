#pragma once

/// @file game_result.hpp
/// @brief GameResult<T>: Result specialized with GameError.

#include "msim/core/result.hpp"
#include "msim/foundation/game_error.hpp"

namespace msim::foundation {

/// Return type of every fallible simulation operation.
///
/// Example:
/// @code
///   GameResult<EntityId> spawn(const Vector3& pos) {
///       if (!IsFinite(pos)) {
///           return GameResult<EntityId>::err(
///               GameError(ErrorCode::InvalidPosition, "non-finite position"));
///       }
///       return GameResult<EntityId>::ok(allocate());
///   }
/// @endcode
template <typename T>
using GameResult = msim::Result<T, GameError>;

}  // namespace msim::foundation
