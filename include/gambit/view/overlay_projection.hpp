#pragma once

#include <SFML/Graphics/Color.hpp>
#include <chrono>
#include <optional>
#include <vector>

#include "gambit/chess_types.hpp"
#include "gambit/config/board_config.hpp"
#include "gambit/controller/controller_types.hpp"
#include "coordinate_system.hpp"

namespace gambit::controller
{
  class BoardController;
}

namespace gambit::view
{

  struct LegalMarker
  {
    core::Square square{core::NO_SQUARE};
    bool capture{false};
  };

  struct OverlayArrow
  {
    core::Square from{core::NO_SQUARE};
    core::Square to{core::NO_SQUARE};
    ArrowPath path;
    sf::Color color;
    float opacity{0.8f};
    bool bestMove{false};
  };

  // Everything a presentation layer draws on top of squares and pieces.
  struct Overlay
  {
    core::Square selected{core::NO_SQUARE};
    std::vector<LegalMarker> legalMarkers;
    controller::MoveRecord lastMove;
    core::Square hint{core::NO_SQUARE};
    std::chrono::milliseconds hintRemaining{0};
    core::Square hovered{core::NO_SQUARE};
    std::optional<controller::MoveIntent> promotion;
    std::vector<config::ColoredSquare> highlights;
    std::vector<core::Square> circled;
    std::vector<OverlayArrow> arrows;
    std::vector<core::Square> masked;
  };

  class OverlayProjection
  {
  public:
    [[nodiscard]] static Overlay project(const controller::BoardController &ctrl);
  };

} // namespace gambit::view
