#include "gambit/model/board_snapshot.hpp"

namespace gambit::model {

namespace {

// move counters above this are treated like any other malformed field
constexpr int MAX_COUNTER = 1000000;

inline int parseInt(std::string_view sv, int fallback) noexcept {
  if (sv.empty()) return fallback;
  int val = 0;
  for (char c : sv) {
    if (c < '0' || c > '9') return fallback;
    val = val * 10 + (c - '0');
    if (val > MAX_COUNTER) return fallback;
  }
  return val;
}

}  // namespace

std::optional<BoardSnapshot> BoardSnapshot::fromFen(std::string_view fen) {
  // Split into 6 fields, missing trailing fields stay empty
  std::string_view sv{fen};
  while (!sv.empty() && sv.front() == ' ') sv.remove_prefix(1);
  std::string_view fields[6]{};
  for (int i = 0; i < 6 && !sv.empty(); ++i) {
    const size_t sp = sv.find(' ');
    if (sp == std::string_view::npos) {
      fields[i] = sv;
      break;
    }
    fields[i] = sv.substr(0, sp);
    sv.remove_prefix(sp + 1);
    while (!sv.empty() && sv.front() == ' ') sv.remove_prefix(1);
  }

  const std::string_view board = fields[0];
  const std::string_view activeColor = fields[1];
  const std::string_view castling = fields[2];
  const std::string_view enPassant = fields[3];
  if (board.empty()) return std::nullopt;

  BoardSnapshot snap;

  // Board placement, rank 8 first
  int rank = 7, file = 0;
  for (char ch : board) {
    if (ch == '/') {
      if (file != 8 || rank == 0) return std::nullopt;
      file = 0;
      --rank;
      continue;
    }
    if (ch >= '1' && ch <= '8') {
      file += ch - '0';
      if (file > 8) return std::nullopt;
      continue;
    }
    const core::Piece p = core::pieceFromChar(ch);
    if (p.isNone() || file > 7) return std::nullopt;
    snap.setPiece(core::makeSquare(file, rank), p);
    ++file;
  }
  if (rank != 0 || file != 8) return std::nullopt;

  // Active color
  if (activeColor.empty() || activeColor == "w")
    snap.m_side_to_move = core::Color::White;
  else if (activeColor == "b")
    snap.m_side_to_move = core::Color::Black;
  else
    return std::nullopt;

  // Castling rights
  std::uint8_t rights = 0;
  for (char c : castling) {
    switch (c) {
      case 'K':
        rights |= Castling::WK;
        break;
      case 'Q':
        rights |= Castling::WQ;
        break;
      case 'k':
        rights |= Castling::BK;
        break;
      case 'q':
        rights |= Castling::BQ;
        break;
      default:
        break;
    }
  }
  snap.m_castling = rights;

  snap.m_en_passant = core::squareFromString(enPassant);

  snap.m_halfmove = parseInt(fields[4], 0);
  snap.m_fullmove = parseInt(fields[5], 1);
  if (snap.m_fullmove == 0) snap.m_fullmove = 1;

  return snap;
}

std::string BoardSnapshot::toFen() const {
  std::string fen;
  fen.reserve(100);

  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      const core::Piece piece = m_squares[static_cast<std::size_t>(rank * 8 + file)];
      if (piece.isNone()) {
        ++empty;
        continue;
      }
      if (empty) {
        fen.push_back(static_cast<char>('0' + empty));
        empty = 0;
      }
      fen.push_back(core::pieceToChar(piece));
    }
    if (empty) fen.push_back(static_cast<char>('0' + empty));
    if (rank) fen.push_back('/');
  }

  fen.push_back(' ');
  fen.push_back(m_side_to_move == core::Color::White ? 'w' : 'b');
  fen.push_back(' ');

  if (m_castling) {
    if (m_castling & Castling::WK) fen.push_back('K');
    if (m_castling & Castling::WQ) fen.push_back('Q');
    if (m_castling & Castling::BK) fen.push_back('k');
    if (m_castling & Castling::BQ) fen.push_back('q');
  } else {
    fen.push_back('-');
  }
  fen.push_back(' ');

  if (core::validSquare(m_en_passant))
    fen.append(core::squareToString(m_en_passant));
  else
    fen.push_back('-');
  fen.push_back(' ');
  fen.append(std::to_string(m_halfmove));
  fen.push_back(' ');
  fen.append(std::to_string(m_fullmove));

  return fen;
}

core::Piece BoardSnapshot::pieceAt(core::Square sq) const noexcept {
  if (!core::validSquare(sq)) return core::Piece{};
  return m_squares[sq];
}

core::Square BoardSnapshot::findKing(core::Color c) const noexcept {
  for (core::Square sq = 0; sq < core::NO_SQUARE; ++sq) {
    const core::Piece p = m_squares[sq];
    if (p.type == core::PieceType::King && p.color == c) return sq;
  }
  return core::NO_SQUARE;
}

void BoardSnapshot::setPiece(core::Square sq, core::Piece p) noexcept {
  if (!core::validSquare(sq)) return;
  m_squares[sq] = p;
}

BoardSnapshot BoardSnapshot::withPieceMoved(core::Square from, core::Square to,
                                            core::PieceType promotion) const {
  BoardSnapshot next = *this;
  core::Piece moving = pieceAt(from);
  if (moving.isNone() || !core::validSquare(to)) return next;
  if (promotion != core::PieceType::None) moving.type = promotion;
  next.removePiece(from);
  next.setPiece(to, moving);
  next.m_en_passant = core::NO_SQUARE;
  return next;
}

}  // namespace gambit::model
