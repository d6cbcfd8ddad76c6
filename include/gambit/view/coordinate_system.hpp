#pragma once

#include <SFML/System/Vector2.hpp>
#include <array>
#include <optional>
#include <string_view>
#include <vector>

#include "gambit/chess_types.hpp"

namespace gambit::model
{
  class BoardSnapshot;
}

namespace gambit::view
{

  // Row 0 is the top edge of the drawn board, col 0 the left edge.
  struct GridIndex
  {
    int row{-1};
    int col{-1};

    [[nodiscard]] bool valid() const { return row >= 0 && row < 8 && col >= 0 && col < 8; }
    bool operator==(const GridIndex &) const = default;
  };

  struct ArrowPath
  {
    std::vector<sf::Vector2f> points; // 2 points straight, 3 points bent (knight)
    bool bent{false};
    float headAngleDeg{0.f};          // direction of the final leg, screen space
  };

  using PresentationGrid = std::array<std::array<core::Piece, 8>, 8>;

  // Pure mapping between board squares, presentation cells and pixels. Pixel values are
  // relative to the board's top-left corner; boardPx is the edge length of the whole board.
  class CoordinateSystem
  {
  public:
    [[nodiscard]] static GridIndex toPresentationIndex(core::Square sq, core::Orientation o);
    [[nodiscard]] static core::Square squareAt(int row, int col, core::Orientation o);

    [[nodiscard]] static sf::Vector2f squareCenter(core::Square sq, core::Orientation o,
                                                   float boardPx);
    // Percent of the board edge, 12.5 per square.
    [[nodiscard]] static sf::Vector2f squareCenterPercent(core::Square sq, core::Orientation o);
    [[nodiscard]] static core::Square squareAtPixel(sf::Vector2f pos, core::Orientation o,
                                                    float boardPx);

    // Destination of a drag that started on origin and moved by displacement pixels.
    [[nodiscard]] static core::Square resolveDrop(core::Square origin, sf::Vector2f displacement,
                                                  core::Orientation o, float boardPx);

    [[nodiscard]] static std::optional<ArrowPath> arrowGeometry(core::Square from, core::Square to,
                                                                core::PieceType pieceHint,
                                                                float boardPx, core::Orientation o);
    [[nodiscard]] static std::optional<ArrowPath> arrowGeometry(std::string_view from,
                                                                std::string_view to,
                                                                std::string_view pieceHint,
                                                                float boardPx, core::Orientation o);

    [[nodiscard]] static PresentationGrid presentationGrid(const model::BoardSnapshot &snap,
                                                           core::Orientation o);
  };

} // namespace gambit::view
