#pragma once

#include <optional>

#include "gambit/chess_types.hpp"
#include "gambit/model/board_snapshot.hpp"

namespace gambit::controller
{

  struct MoveIntent
  {
    core::Square from = core::NO_SQUARE;
    core::Square to = core::NO_SQUARE;
    core::PieceType promotion = core::PieceType::None;
  };

  // Most recent committed or externally supplied move, overwritten on each commit.
  struct MoveRecord
  {
    core::Square from = core::NO_SQUARE;
    core::Square to = core::NO_SQUARE;

    [[nodiscard]] bool valid() const { return core::validSquare(from) && core::validSquare(to); }
    bool operator==(const MoveRecord &) const = default;
  };

  struct MoveOutcome
  {
    bool accepted = false;
    bool isPromotion = false;
    std::optional<model::BoardSnapshot> resulting; // set iff accepted
  };

  enum class InteractionState
  {
    Idle,
    PieceSelected,
    PromotionPending
  };

  // Signal for haptic/audio feedback layers.
  enum class Feedback
  {
    Selected,
    Deselected,
    MoveCommitted,
    PromotionRequested,
    Invalid,
    Restricted
  };

  enum class BoardError
  {
    None,
    InvalidSquareFormat,
    IllegalMove,
    InvalidState,
    EngineFailure,
    InvalidPosition
  };

  enum class RestrictionSource
  {
    Select,
    Drag
  };

  struct SetPositionOptions
  {
    bool preserveLastMove{false};
  };

  [[nodiscard]] const char *toString(BoardError err) noexcept;
  [[nodiscard]] const char *toString(InteractionState st) noexcept;

} // namespace gambit::controller
