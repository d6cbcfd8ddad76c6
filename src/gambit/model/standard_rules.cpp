#include "gambit/model/standard_rules.hpp"

#include <algorithm>
#include <cstdlib>

#include "gambit/constants.hpp"

namespace gambit::model {

namespace {

struct Step {
  int df;
  int dr;
};

constexpr Step KNIGHT_STEPS[8] = {{1, 2},   {2, 1},   {2, -1}, {1, -2},
                                  {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
constexpr Step KING_STEPS[8] = {{1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
constexpr Step DIAGONALS[4] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
constexpr Step ORTHOGONALS[4] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

constexpr core::Square A1 = 0, C1 = 2, D1 = 3, E1 = 4, F1 = 5, G1 = 6, H1 = 7;
constexpr core::Square A8 = 56, C8 = 58, D8 = 59, E8 = 60, F8 = 61, G8 = 62, H8 = 63;

inline core::Square offset(core::Square sq, int df, int dr) noexcept {
  return core::makeSquare(core::fileOf(sq) + df, core::rankOf(sq) + dr);
}

inline bool isPiece(const BoardSnapshot& pos, core::Square sq, core::Color c, core::PieceType t) {
  const core::Piece p = pos.pieceAt(sq);
  return p.type == t && p.color == c;
}

void addPawnMove(core::Square from, core::Square to, core::Color side, std::vector<RuleMove>& out) {
  const int promoRank = (side == core::Color::White) ? 7 : 0;
  if (core::rankOf(to) == promoRank) {
    for (core::PieceType t : {core::PieceType::Queen, core::PieceType::Rook, core::PieceType::Bishop,
                              core::PieceType::Knight})
      out.push_back({from, to, t, false, false});
    return;
  }
  out.push_back({from, to});
}

void addSteps(const BoardSnapshot& pos, core::Square from, core::Color side, const Step* steps,
              int count, std::vector<RuleMove>& out) {
  for (int i = 0; i < count; ++i) {
    const core::Square to = offset(from, steps[i].df, steps[i].dr);
    if (!core::validSquare(to)) continue;
    const core::Piece target = pos.pieceAt(to);
    if (target.isNone() || target.color != side) out.push_back({from, to});
  }
}

void addRays(const BoardSnapshot& pos, core::Square from, core::Color side, const Step* dirs,
             int count, std::vector<RuleMove>& out) {
  for (int i = 0; i < count; ++i) {
    core::Square to = offset(from, dirs[i].df, dirs[i].dr);
    while (core::validSquare(to)) {
      const core::Piece target = pos.pieceAt(to);
      if (!target.isNone()) {
        if (target.color != side) out.push_back({from, to});
        break;
      }
      out.push_back({from, to});
      to = offset(to, dirs[i].df, dirs[i].dr);
    }
  }
}

void addCastling(const BoardSnapshot& pos, core::Color side, std::vector<RuleMove>& out) {
  const bool white = side == core::Color::White;
  const core::Square king = white ? E1 : E8;
  if (!isPiece(pos, king, side, core::PieceType::King)) return;
  const core::Color them = ~side;
  if (StandardRules::attackedBy(pos, king, them)) return;

  const std::uint8_t rights = pos.castlingRights();
  const std::uint8_t kingSide = white ? Castling::WK : Castling::BK;
  const std::uint8_t queenSide = white ? Castling::WQ : Castling::BQ;

  if (rights & kingSide) {
    const core::Square f = white ? F1 : F8, g = white ? G1 : G8, h = white ? H1 : H8;
    if (!pos.hasPiece(f) && !pos.hasPiece(g) && isPiece(pos, h, side, core::PieceType::Rook) &&
        !StandardRules::attackedBy(pos, f, them) && !StandardRules::attackedBy(pos, g, them))
      out.push_back({king, g, core::PieceType::None, false, true});
  }
  if (rights & queenSide) {
    const core::Square d = white ? D1 : D8, c = white ? C1 : C8;
    const core::Square b = static_cast<core::Square>(c - 1), a = white ? A1 : A8;
    if (!pos.hasPiece(d) && !pos.hasPiece(c) && !pos.hasPiece(b) &&
        isPiece(pos, a, side, core::PieceType::Rook) && !StandardRules::attackedBy(pos, d, them) &&
        !StandardRules::attackedBy(pos, c, them))
      out.push_back({king, c, core::PieceType::None, false, true});
  }
}

std::uint8_t rightsLostAt(core::Square sq) noexcept {
  switch (sq) {
    case A1:
      return Castling::WQ;
    case H1:
      return Castling::WK;
    case E1:
      return Castling::WK | Castling::WQ;
    case A8:
      return Castling::BQ;
    case H8:
      return Castling::BK;
    case E8:
      return Castling::BK | Castling::BQ;
    default:
      return 0;
  }
}

}  // namespace

StandardRules::StandardRules() {
  m_pseudo_moves.reserve(128);
  m_legal_moves.reserve(128);
  m_position = BoardSnapshot::fromFen(core::START_FEN).value_or(BoardSnapshot{});
}

bool StandardRules::loadFen(const std::string& fen) {
  auto snap = BoardSnapshot::fromFen(fen);
  if (!snap) return false;
  m_position = *snap;
  m_legal_moves.clear();
  return true;
}

std::string StandardRules::fen() const {
  return m_position.toFen();
}

core::Color StandardRules::activeSide() const {
  return m_position.sideToMove();
}

bool StandardRules::attackedBy(const BoardSnapshot& pos, core::Square sq, core::Color by) {
  if (!core::validSquare(sq)) return false;

  // a pawn of `by` attacks diagonally forward, so look one rank behind sq from its side
  const int back = (by == core::Color::White) ? -1 : 1;
  for (int df : {-1, 1}) {
    if (isPiece(pos, offset(sq, df, back), by, core::PieceType::Pawn)) return true;
  }
  for (const Step& s : KNIGHT_STEPS) {
    if (isPiece(pos, offset(sq, s.df, s.dr), by, core::PieceType::Knight)) return true;
  }
  for (const Step& s : KING_STEPS) {
    if (isPiece(pos, offset(sq, s.df, s.dr), by, core::PieceType::King)) return true;
  }

  auto rayHits = [&](const Step* dirs, core::PieceType slider) {
    for (int i = 0; i < 4; ++i) {
      core::Square cur = offset(sq, dirs[i].df, dirs[i].dr);
      while (core::validSquare(cur)) {
        const core::Piece p = pos.pieceAt(cur);
        if (!p.isNone()) {
          if (p.color == by && (p.type == slider || p.type == core::PieceType::Queen)) return true;
          break;
        }
        cur = offset(cur, dirs[i].df, dirs[i].dr);
      }
    }
    return false;
  };
  return rayHits(DIAGONALS, core::PieceType::Bishop) || rayHits(ORTHOGONALS, core::PieceType::Rook);
}

void StandardRules::generatePseudoLegalMoves(const BoardSnapshot& pos, std::vector<RuleMove>& out) {
  out.clear();
  const core::Color side = pos.sideToMove();
  const int dir = (side == core::Color::White) ? 1 : -1;
  const int startRank = (side == core::Color::White) ? 1 : 6;

  for (core::Square from = 0; from < core::NO_SQUARE; ++from) {
    const core::Piece p = pos.pieceAt(from);
    if (p.isNone() || p.color != side) continue;

    switch (p.type) {
      case core::PieceType::Pawn: {
        const core::Square one = offset(from, 0, dir);
        if (core::validSquare(one) && !pos.hasPiece(one)) {
          addPawnMove(from, one, side, out);
          const core::Square two = offset(from, 0, 2 * dir);
          if (core::rankOf(from) == startRank && !pos.hasPiece(two)) out.push_back({from, two});
        }
        for (int df : {-1, 1}) {
          const core::Square to = offset(from, df, dir);
          if (!core::validSquare(to)) continue;
          const core::Piece target = pos.pieceAt(to);
          if (!target.isNone() && target.color != side)
            addPawnMove(from, to, side, out);
          else if (target.isNone() && to == pos.enPassantSquare())
            out.push_back({from, to, core::PieceType::None, true, false});
        }
        break;
      }
      case core::PieceType::Knight:
        addSteps(pos, from, side, KNIGHT_STEPS, 8, out);
        break;
      case core::PieceType::Bishop:
        addRays(pos, from, side, DIAGONALS, 4, out);
        break;
      case core::PieceType::Rook:
        addRays(pos, from, side, ORTHOGONALS, 4, out);
        break;
      case core::PieceType::Queen:
        addRays(pos, from, side, DIAGONALS, 4, out);
        addRays(pos, from, side, ORTHOGONALS, 4, out);
        break;
      case core::PieceType::King:
        addSteps(pos, from, side, KING_STEPS, 8, out);
        break;
      case core::PieceType::None:
        break;
    }
  }
  addCastling(pos, side, out);
}

BoardSnapshot StandardRules::play(const BoardSnapshot& pos, const RuleMove& mv) {
  BoardSnapshot next = pos;
  const core::Piece moving = pos.pieceAt(mv.from);
  const bool capture = pos.hasPiece(mv.to) || mv.enPassant;

  next.removePiece(mv.from);
  if (mv.enPassant) next.removePiece(core::makeSquare(core::fileOf(mv.to), core::rankOf(mv.from)));

  core::Piece placed = moving;
  if (mv.promotion != core::PieceType::None) placed.type = mv.promotion;
  next.setPiece(mv.to, placed);

  if (mv.castle) {
    const bool kingSide = mv.to > mv.from;
    const core::Square rookFrom =
        kingSide ? static_cast<core::Square>(mv.from + 3) : static_cast<core::Square>(mv.from - 4);
    const core::Square rookTo =
        kingSide ? static_cast<core::Square>(mv.from + 1) : static_cast<core::Square>(mv.from - 1);
    next.setPiece(rookTo, pos.pieceAt(rookFrom));
    next.removePiece(rookFrom);
  }

  next.setCastlingRights(pos.castlingRights() &
                         static_cast<std::uint8_t>(~(rightsLostAt(mv.from) | rightsLostAt(mv.to))));

  const bool pawn = moving.type == core::PieceType::Pawn;
  if (pawn && std::abs(core::rankOf(mv.to) - core::rankOf(mv.from)) == 2)
    next.setEnPassantSquare(
        core::makeSquare(core::fileOf(mv.from), (core::rankOf(mv.from) + core::rankOf(mv.to)) / 2));
  else
    next.setEnPassantSquare(core::NO_SQUARE);

  next.setHalfmoveClock((pawn || capture) ? 0 : pos.halfmoveClock() + 1);
  if (pos.sideToMove() == core::Color::Black) next.setFullmoveNumber(pos.fullmoveNumber() + 1);
  next.setSideToMove(~pos.sideToMove());
  return next;
}

const std::vector<RuleMove>& StandardRules::generateLegalMoves() {
  m_legal_moves.clear();
  generatePseudoLegalMoves(m_position, m_pseudo_moves);

  const core::Color side = m_position.sideToMove();
  for (const auto& m : m_pseudo_moves) {
    const BoardSnapshot after = play(m_position, m);
    const core::Square king = after.findKing(side);
    // positions without a king (puzzle fragments) have nothing to protect
    if (!core::validSquare(king) || !attackedBy(after, king, ~side)) m_legal_moves.push_back(m);
  }
  return m_legal_moves;
}

bool StandardRules::isKingInCheck(core::Color side) const {
  return attackedBy(m_position, m_position.findKing(side), ~side);
}

std::vector<core::Square> StandardRules::legalTargets(core::Square from) {
  std::vector<core::Square> out;
  if (!core::validSquare(from)) return out;
  for (const auto& m : generateLegalMoves()) {
    if (m.from == from && std::find(out.begin(), out.end(), m.to) == out.end()) out.push_back(m.to);
  }
  return out;
}

std::optional<std::string> StandardRules::applyMove(core::Square from, core::Square to,
                                                    core::PieceType promotion) {
  for (const auto& m : generateLegalMoves()) {
    if (m.from != from || m.to != to) continue;
    if (m.promotion != core::PieceType::None && m.promotion != promotion) continue;
    m_position = play(m_position, m);
    return m_position.toFen();
  }
  return std::nullopt;
}

}  // namespace gambit::model
