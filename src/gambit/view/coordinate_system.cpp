#include "gambit/view/coordinate_system.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "gambit/model/board_snapshot.hpp"

namespace gambit::view
{

  namespace
  {
    constexpr float STRAIGHT_START_INSET = 0.25f;
    constexpr float END_INSET = 0.2f;

    inline float length(sf::Vector2f v)
    {
      return std::sqrt(v.x * v.x + v.y * v.y);
    }

    inline float angleDeg(sf::Vector2f v)
    {
      return std::atan2(v.y, v.x) * 180.f / std::numbers::pi_v<float>;
    }

    // half-up rounding, -0.5 goes to 0 and 0.5 goes to 1
    inline int roundHalfUp(float v)
    {
      return static_cast<int>(std::floor(v + 0.5f));
    }

    // a shortened to stop `inset` before b
    inline sf::Vector2f insetEnd(sf::Vector2f a, sf::Vector2f b, float inset)
    {
      const sf::Vector2f d = b - a;
      const float len = length(d);
      if (len <= 1e-3f)
        return b;
      const float ratio = std::max(0.f, (len - inset) / len);
      return a + d * ratio;
    }
  } // namespace

  GridIndex CoordinateSystem::toPresentationIndex(core::Square sq, core::Orientation o)
  {
    if (!core::validSquare(sq))
      return {};
    const int file = core::fileOf(sq);
    const int rank = core::rankOf(sq);
    if (o == core::Orientation::White)
      return {7 - rank, file};
    return {rank, 7 - file};
  }

  core::Square CoordinateSystem::squareAt(int row, int col, core::Orientation o)
  {
    if (row < 0 || row > 7 || col < 0 || col > 7)
      return core::NO_SQUARE;
    if (o == core::Orientation::White)
      return core::makeSquare(col, 7 - row);
    return core::makeSquare(7 - col, row);
  }

  sf::Vector2f CoordinateSystem::squareCenter(core::Square sq, core::Orientation o, float boardPx)
  {
    const GridIndex idx = toPresentationIndex(sq, o);
    const float sqPx = boardPx / 8.f;
    return {idx.col * sqPx + sqPx / 2.f, idx.row * sqPx + sqPx / 2.f};
  }

  sf::Vector2f CoordinateSystem::squareCenterPercent(core::Square sq, core::Orientation o)
  {
    const GridIndex idx = toPresentationIndex(sq, o);
    return {idx.col * 12.5f + 6.25f, idx.row * 12.5f + 6.25f};
  }

  core::Square CoordinateSystem::squareAtPixel(sf::Vector2f pos, core::Orientation o, float boardPx)
  {
    if (boardPx <= 0.f || pos.x < 0.f || pos.y < 0.f || pos.x >= boardPx || pos.y >= boardPx)
      return core::NO_SQUARE;
    const float sqPx = boardPx / 8.f;
    return squareAt(static_cast<int>(pos.y / sqPx), static_cast<int>(pos.x / sqPx), o);
  }

  core::Square CoordinateSystem::resolveDrop(core::Square origin, sf::Vector2f displacement,
                                             core::Orientation o, float boardPx)
  {
    if (!core::validSquare(origin) || boardPx <= 0.f)
      return core::NO_SQUARE;
    if (!std::isfinite(displacement.x) || !std::isfinite(displacement.y))
      return core::NO_SQUARE;

    const float sqPx = boardPx / 8.f;
    const GridIndex start = toPresentationIndex(origin, o);
    return squareAt(start.row + roundHalfUp(displacement.y / sqPx),
                    start.col + roundHalfUp(displacement.x / sqPx), o);
  }

  std::optional<ArrowPath> CoordinateSystem::arrowGeometry(core::Square from, core::Square to,
                                                           core::PieceType pieceHint,
                                                           float boardPx, core::Orientation o)
  {
    if (!core::validSquare(from) || !core::validSquare(to) || from == to || !(boardPx > 0.f))
      return std::nullopt;

    const float sqPx = boardPx / 8.f;
    const sf::Vector2f a = squareCenter(from, o, boardPx);
    const sf::Vector2f b = squareCenter(to, o, boardPx);
    const sf::Vector2f d = b - a;

    ArrowPath path;
    // a knight hint on a straight line has no corner to bend around
    if (pieceHint == core::PieceType::Knight && d.x != 0.f && d.y != 0.f)
    {
      const bool horizontalFirst = std::abs(d.x) >= std::abs(d.y);
      const sf::Vector2f corner = horizontalFirst ? sf::Vector2f(b.x, a.y) : sf::Vector2f(a.x, b.y);
      const sf::Vector2f end = insetEnd(corner, b, sqPx * END_INSET);
      path.points = {a, corner, end};
      path.bent = true;
      path.headAngleDeg = angleDeg(end - corner);
      return path;
    }

    const sf::Vector2f u = d / length(d);
    path.points = {a + u * (sqPx * STRAIGHT_START_INSET), insetEnd(a, b, sqPx * END_INSET)};
    path.headAngleDeg = angleDeg(d);
    return path;
  }

  std::optional<ArrowPath> CoordinateSystem::arrowGeometry(std::string_view from,
                                                           std::string_view to,
                                                           std::string_view pieceHint,
                                                           float boardPx, core::Orientation o)
  {
    const core::PieceType hint = core::pieceTypeFromString(pieceHint).value_or(core::PieceType::None);
    return arrowGeometry(core::squareFromString(from), core::squareFromString(to), hint, boardPx, o);
  }

  PresentationGrid CoordinateSystem::presentationGrid(const model::BoardSnapshot &snap,
                                                      core::Orientation o)
  {
    PresentationGrid grid{};
    for (int row = 0; row < 8; ++row)
      for (int col = 0; col < 8; ++col)
        grid[row][col] = snap.pieceAt(squareAt(row, col, o));
    return grid;
  }

} // namespace gambit::view
