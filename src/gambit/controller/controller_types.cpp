#include "gambit/controller/controller_types.hpp"

namespace gambit::controller {

const char* toString(BoardError err) noexcept {
  switch (err) {
    case BoardError::None:
      return "none";
    case BoardError::InvalidSquareFormat:
      return "invalid square format";
    case BoardError::IllegalMove:
      return "illegal move";
    case BoardError::InvalidState:
      return "invalid state";
    case BoardError::EngineFailure:
      return "engine failure";
    case BoardError::InvalidPosition:
      return "invalid position";
  }
  return "unknown";
}

const char* toString(InteractionState st) noexcept {
  switch (st) {
    case InteractionState::Idle:
      return "idle";
    case InteractionState::PieceSelected:
      return "piece selected";
    case InteractionState::PromotionPending:
      return "promotion pending";
  }
  return "unknown";
}

}  // namespace gambit::controller
