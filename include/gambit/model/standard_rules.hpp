#pragma once

#include <optional>
#include <string>
#include <vector>

#include "board_snapshot.hpp"
#include "rule_engine.hpp"

namespace gambit::model {

struct RuleMove {
  core::Square from = core::NO_SQUARE;
  core::Square to = core::NO_SQUARE;
  core::PieceType promotion = core::PieceType::None;
  bool enPassant = false;
  bool castle = false;
};

// Reference implementation of the rule engine contract on a plain 64-square board.
class StandardRules : public IRuleEngine {
 public:
  StandardRules();

  bool loadFen(const std::string& fen) override;
  [[nodiscard]] std::string fen() const override;
  [[nodiscard]] core::Color activeSide() const override;
  std::vector<core::Square> legalTargets(core::Square from) override;
  std::optional<std::string> applyMove(core::Square from, core::Square to,
                                       core::PieceType promotion) override;

  const std::vector<RuleMove>& generateLegalMoves();
  [[nodiscard]] bool isKingInCheck(core::Color side) const;
  [[nodiscard]] const BoardSnapshot& position() const noexcept { return m_position; }

  static bool attackedBy(const BoardSnapshot& pos, core::Square sq, core::Color by);
  static void generatePseudoLegalMoves(const BoardSnapshot& pos, std::vector<RuleMove>& out);
  static BoardSnapshot play(const BoardSnapshot& pos, const RuleMove& mv);

 private:
  BoardSnapshot m_position;
  std::vector<RuleMove> m_pseudo_moves;
  std::vector<RuleMove> m_legal_moves;
};

}  // namespace gambit::model
