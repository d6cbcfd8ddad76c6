#include "gambit/chess_types.hpp"

#include <cstddef>

namespace gambit::core {

namespace {

inline char tolower_ascii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | 32) : c;
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i)
    if (tolower_ascii(a[i]) != b[i]) return false;
  return true;
}

}  // namespace

Square squareFromString(std::string_view sv) noexcept {
  if (sv.size() != 2) return NO_SQUARE;
  const char f = sv[0];
  const char r = sv[1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8') return NO_SQUARE;
  return makeSquare(f - 'a', r - '1');
}

std::string squareToString(Square sq) {
  if (!validSquare(sq)) return "-";
  std::string s(2, ' ');
  s[0] = static_cast<char>('a' + fileOf(sq));
  s[1] = static_cast<char>('1' + rankOf(sq));
  return s;
}

char pieceToChar(Piece p) noexcept {
  char c = ' ';
  switch (p.type) {
    case PieceType::Pawn:
      c = 'p';
      break;
    case PieceType::Knight:
      c = 'n';
      break;
    case PieceType::Bishop:
      c = 'b';
      break;
    case PieceType::Rook:
      c = 'r';
      break;
    case PieceType::Queen:
      c = 'q';
      break;
    case PieceType::King:
      c = 'k';
      break;
    case PieceType::None:
      return ' ';
  }
  return p.color == Color::White ? static_cast<char>(c - 32) : c;
}

Piece pieceFromChar(char ch) noexcept {
  const char lo = tolower_ascii(ch);
  PieceType type;
  switch (lo) {
    case 'k':
      type = PieceType::King;
      break;
    case 'q':
      type = PieceType::Queen;
      break;
    case 'r':
      type = PieceType::Rook;
      break;
    case 'b':
      type = PieceType::Bishop;
      break;
    case 'n':
      type = PieceType::Knight;
      break;
    case 'p':
      type = PieceType::Pawn;
      break;
    default:
      return Piece{};
  }
  return Piece{type, (ch == lo) ? Color::Black : Color::White};
}

std::optional<PieceType> pieceTypeFromString(std::string_view sv) noexcept {
  if (iequals(sv, "p") || iequals(sv, "pawn")) return PieceType::Pawn;
  if (iequals(sv, "n") || iequals(sv, "knight")) return PieceType::Knight;
  if (iequals(sv, "b") || iequals(sv, "bishop")) return PieceType::Bishop;
  if (iequals(sv, "r") || iequals(sv, "rook")) return PieceType::Rook;
  if (iequals(sv, "q") || iequals(sv, "queen")) return PieceType::Queen;
  if (iequals(sv, "k") || iequals(sv, "king")) return PieceType::King;
  return std::nullopt;
}

std::string_view pieceTypeName(PieceType t) noexcept {
  switch (t) {
    case PieceType::Pawn:
      return "pawn";
    case PieceType::Knight:
      return "knight";
    case PieceType::Bishop:
      return "bishop";
    case PieceType::Rook:
      return "rook";
    case PieceType::Queen:
      return "queen";
    case PieceType::King:
      return "king";
    case PieceType::None:
      break;
  }
  return "none";
}

}  // namespace gambit::core
