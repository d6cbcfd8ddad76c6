#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "../chess_types.hpp"

namespace gambit::model {

enum Castling : std::uint8_t { WK = 1 << 0, WQ = 1 << 1, BK = 1 << 2, BQ = 1 << 3 };

// Immutable-by-convention position value. The controller owns one and hands out const
// references; engines and strategies build new snapshots instead of editing a shared one.
class BoardSnapshot {
 public:
  BoardSnapshot() = default;

  // nullopt when the placement field is malformed (rank count, rank width, piece letters)
  // or the side-to-move field is neither 'w' nor 'b'.
  static std::optional<BoardSnapshot> fromFen(std::string_view fen);
  [[nodiscard]] std::string toFen() const;

  [[nodiscard]] core::Piece pieceAt(core::Square sq) const noexcept;
  [[nodiscard]] bool hasPiece(core::Square sq) const noexcept { return !pieceAt(sq).isNone(); }
  [[nodiscard]] core::Square findKing(core::Color c) const noexcept;

  [[nodiscard]] core::Color sideToMove() const noexcept { return m_side_to_move; }
  [[nodiscard]] std::uint8_t castlingRights() const noexcept { return m_castling; }
  [[nodiscard]] core::Square enPassantSquare() const noexcept { return m_en_passant; }
  [[nodiscard]] int halfmoveClock() const noexcept { return m_halfmove; }
  [[nodiscard]] int fullmoveNumber() const noexcept { return m_fullmove; }

  // Relocates a piece without any rule check. Side to move and castling rights are kept,
  // the en-passant square is cleared.
  [[nodiscard]] BoardSnapshot withPieceMoved(core::Square from, core::Square to,
                                             core::PieceType promotion) const;

  void setPiece(core::Square sq, core::Piece p) noexcept;
  void removePiece(core::Square sq) noexcept { setPiece(sq, core::Piece{}); }
  void setSideToMove(core::Color c) noexcept { m_side_to_move = c; }
  void setCastlingRights(std::uint8_t rights) noexcept { m_castling = rights & 0x0F; }
  void setEnPassantSquare(core::Square sq) noexcept { m_en_passant = sq; }
  void setHalfmoveClock(int v) noexcept { m_halfmove = v; }
  void setFullmoveNumber(int v) noexcept { m_fullmove = v; }

  bool operator==(const BoardSnapshot&) const = default;

 private:
  std::array<core::Piece, 64> m_squares{};
  core::Color m_side_to_move = core::Color::White;
  std::uint8_t m_castling = 0;
  core::Square m_en_passant = core::NO_SQUARE;
  int m_halfmove = 0;
  int m_fullmove = 1;
};

}  // namespace gambit::model
