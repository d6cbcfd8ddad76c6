#include "test_util.hpp"

#include <iostream>
#include <string>

#include "gambit/constants.hpp"
#include "gambit/model/standard_rules.hpp"

using namespace gambit;
using test::sameSquares;
using test::sq;

static std::string boardField(const std::string &fen)
{
  return fen.substr(0, fen.find(' '));
}

int main()
{
  // Opening moves
  {
    model::StandardRules rules;
    assert(rules.fen() == core::START_FEN);
    assert(rules.activeSide() == core::Color::White);
    assert(rules.generateLegalMoves().size() == 20);
    assert(sameSquares(rules.legalTargets(sq("e2")), {sq("e3"), sq("e4")}));
    assert(sameSquares(rules.legalTargets(sq("g1")), {sq("f3"), sq("h3")}));
    assert(rules.legalTargets(sq("e7")).empty());
    assert(rules.legalTargets(sq("e4")).empty());
    assert(rules.legalTargets(core::NO_SQUARE).empty());

    auto fen = rules.applyMove(sq("e2"), sq("e4"), core::PieceType::None);
    assert(fen);
    assert(*fen == "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
    assert(rules.activeSide() == core::Color::Black);

    // same pawn move again is refused
    assert(!rules.applyMove(sq("e2"), sq("e4"), core::PieceType::None));

    fen = rules.applyMove(sq("g8"), sq("f6"), core::PieceType::None);
    assert(fen);
    assert(*fen == "rnbqkb1r/pppppppp/5n2/8/4P3/8/PPPP1PPP/RNBQKBNR w KQkq - 1 2");
  }

  // En passant capture removes the passed pawn
  {
    model::StandardRules rules;
    assert(rules.loadFen("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 1"));
    assert(sameSquares(rules.legalTargets(sq("e5")), {sq("e6"), sq("d6")}));
    auto fen = rules.applyMove(sq("e5"), sq("d6"), core::PieceType::None);
    assert(fen);
    assert(boardField(*fen) == "4k3/8/3P4/8/8/8/8/4K3");
  }

  // Castling on both wings, rook follows the king and rights are spent
  {
    model::StandardRules rules;
    assert(rules.loadFen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1"));
    const auto targets = rules.legalTargets(sq("e1"));
    assert(std::find(targets.begin(), targets.end(), sq("g1")) != targets.end());
    assert(std::find(targets.begin(), targets.end(), sq("c1")) != targets.end());

    auto fen = rules.applyMove(sq("e1"), sq("g1"), core::PieceType::None);
    assert(fen);
    assert(*fen == "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");

    fen = rules.applyMove(sq("e8"), sq("c8"), core::PieceType::None);
    assert(fen);
    assert(*fen == "2kr3r/8/8/8/8/8/8/R4RK1 w - - 2 2");
  }

  // No castling through an attacked square or without the right
  {
    model::StandardRules rules;
    assert(rules.loadFen("4k3/8/8/8/8/8/5r2/R3K2R w KQ - 0 1"));
    auto targets = rules.legalTargets(sq("e1"));
    assert(std::find(targets.begin(), targets.end(), sq("g1")) == targets.end());
    assert(std::find(targets.begin(), targets.end(), sq("c1")) != targets.end());

    assert(rules.loadFen("4k3/8/8/8/8/8/8/R3K2R w - - 0 1"));
    targets = rules.legalTargets(sq("e1"));
    assert(std::find(targets.begin(), targets.end(), sq("g1")) == targets.end());
    assert(std::find(targets.begin(), targets.end(), sq("c1")) == targets.end());

    // never out of check
    assert(rules.loadFen("4k3/8/8/8/8/8/4r3/R3K2R w KQ - 0 1"));
    assert(rules.isKingInCheck(core::Color::White));
    targets = rules.legalTargets(sq("e1"));
    assert(std::find(targets.begin(), targets.end(), sq("g1")) == targets.end());
    assert(std::find(targets.begin(), targets.end(), sq("c1")) == targets.end());
  }

  // Pinned pieces and check evasion
  {
    model::StandardRules rules;
    assert(rules.loadFen("4k3/4r3/8/8/8/8/4B3/4K3 w - - 0 1"));
    assert(rules.legalTargets(sq("e2")).empty());

    assert(rules.loadFen("4k3/8/8/8/8/8/3q4/4K3 w - - 0 1"));
    assert(rules.isKingInCheck(core::Color::White));
    assert(sameSquares(rules.legalTargets(sq("e1")), {sq("d2"), sq("f1")}));
  }

  // Promotion needs the piece kind
  {
    model::StandardRules rules;
    assert(rules.loadFen("8/4P3/8/8/8/8/8/4K2k w - - 0 1"));
    assert(sameSquares(rules.legalTargets(sq("e7")), {sq("e8")}));
    assert(!rules.applyMove(sq("e7"), sq("e8"), core::PieceType::None));
    auto fen = rules.applyMove(sq("e7"), sq("e8"), core::PieceType::Knight);
    assert(fen);
    assert(boardField(*fen) == "4N3/8/8/8/8/8/8/4K2k");
  }

  // Refused positions leave the engine untouched
  {
    model::StandardRules rules;
    assert(!rules.loadFen("not a fen"));
    assert(rules.fen() == core::START_FEN);
  }

  std::cout << "standard_rules_test passed\n";
  return 0;
}
