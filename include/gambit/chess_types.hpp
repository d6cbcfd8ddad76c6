#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gambit::core
{
  // rank * 8 + file, a1 = 0, h8 = 63
  using Square = std::uint8_t;
  constexpr Square NO_SQUARE = 64;

  inline bool validSquare(core::Square sq)
  {
    return sq < core::NO_SQUARE;
  }

  enum class PieceType : std::uint8_t
  {
    Pawn = 0,
    Knight,
    Bishop,
    Rook,
    Queen,
    King,
    None
  };

  constexpr int idx(PieceType p) noexcept
  {
    return static_cast<int>(p);
  }

  enum class Color : std::uint8_t
  {
    White = 0,
    Black = 1
  };
  constexpr inline core::Color operator~(core::Color c)
  {
    return c == core::Color::White ? core::Color::Black : core::Color::White;
  }

  // Side whose starting edge is drawn at the bottom of the board.
  enum class Orientation : std::uint8_t
  {
    White = 0,
    Black = 1
  };

  struct Piece
  {
    PieceType type = PieceType::None;
    Color color = Color::White;
    [[nodiscard]] constexpr bool isNone() const noexcept { return type == PieceType::None; }
    constexpr bool operator==(const Piece &) const = default;
  };

  [[nodiscard]] constexpr int fileOf(Square sq) noexcept
  {
    return sq & 7;
  }
  [[nodiscard]] constexpr int rankOf(Square sq) noexcept
  {
    return sq >> 3;
  }
  [[nodiscard]] constexpr Square makeSquare(int file, int rank) noexcept
  {
    return (static_cast<unsigned>(file) < 8u && static_cast<unsigned>(rank) < 8u)
               ? static_cast<Square>(rank * 8 + file)
               : NO_SQUARE;
  }

  // Exactly "<file><rank>", otherwise NO_SQUARE.
  [[nodiscard]] Square squareFromString(std::string_view sv) noexcept;
  [[nodiscard]] std::string squareToString(Square sq);

  // FEN letters: uppercase white, lowercase black.
  [[nodiscard]] char pieceToChar(Piece p) noexcept;
  [[nodiscard]] Piece pieceFromChar(char c) noexcept;

  // Accepts "q", "queen", "N", "knight", ...
  [[nodiscard]] std::optional<PieceType> pieceTypeFromString(std::string_view sv) noexcept;
  [[nodiscard]] std::string_view pieceTypeName(PieceType t) noexcept;

  [[nodiscard]] constexpr bool isPromotionChoice(PieceType t) noexcept
  {
    return t == PieceType::Queen || t == PieceType::Rook || t == PieceType::Bishop ||
           t == PieceType::Knight;
  }
} // namespace gambit::core
