#include "test_util.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "gambit/constants.hpp"
#include "gambit/controller/legality_strategy.hpp"
#include "gambit/model/rule_engine.hpp"
#include "gambit/model/standard_rules.hpp"

using namespace gambit;
using controller::MoveIntent;
using test::sameSquares;
using test::sq;

namespace
{

  model::BoardSnapshot position(const std::string &fen)
  {
    auto snap = model::BoardSnapshot::fromFen(fen);
    assert(snap);
    return *snap;
  }

  // Scriptable engine for adapter failure paths.
  struct ScriptedEngine : model::IRuleEngine
  {
    bool acceptLoad = true;
    int loads = 0;
    std::string current = core::START_FEN;
    std::vector<core::Square> targets;
    std::optional<std::string> applied;

    bool loadFen(const std::string &fen) override
    {
      ++loads;
      if (!acceptLoad)
        return false;
      current = fen;
      return true;
    }
    std::string fen() const override { return current; }
    core::Color activeSide() const override { return core::Color::White; }
    std::vector<core::Square> legalTargets(core::Square) override { return targets; }
    std::optional<std::string> applyMove(core::Square, core::Square, core::PieceType) override
    {
      return applied;
    }
  };

  template <typename Fn>
  bool throwsRuleEngineError(Fn &&fn)
  {
    try
    {
      fn();
    }
    catch (const model::RuleEngineError &)
    {
      return true;
    }
    return false;
  }

} // namespace

int main()
{
  const model::BoardSnapshot start = position(core::START_FEN);

  // Rule engine adapter in the opening
  {
    controller::RuleEngineStrategy strategy(std::make_shared<model::StandardRules>());
    assert(sameSquares(strategy.reachableTargets(sq("e2"), start), {sq("e3"), sq("e4")}));
    assert(strategy.reachableTargets(sq("e7"), start).empty());
    assert(strategy.reachableTargets(sq("e4"), start).empty());

    const auto ok = strategy.proposeMove({sq("e2"), sq("e4")}, start);
    assert(ok.accepted && !ok.isPromotion);
    assert(ok.resulting);
    assert(ok.resulting->pieceAt(sq("e4")).type == core::PieceType::Pawn);
    assert(ok.resulting->sideToMove() == core::Color::Black);

    // the snapshot it was handed stays as it was
    assert(start.hasPiece(sq("e2")));

    const auto bad = strategy.proposeMove({sq("e2"), sq("e5")}, start);
    assert(!bad.accepted && !bad.isPromotion && !bad.resulting);

    const auto same = strategy.proposeMove({sq("e2"), sq("e2")}, start);
    assert(!same.accepted);
  }

  // Promotion gating
  {
    const model::BoardSnapshot promo = position("8/4P3/8/8/8/8/8/4K2k w - - 0 1");
    assert(controller::requiresPromotion(promo, {sq("e7"), sq("e8")}));
    assert(!controller::requiresPromotion(promo, {sq("e1"), sq("e2")}));
    assert(controller::requiresPromotion(position("4k3/8/8/8/8/8/3p4/4K3 b - - 0 1"),
                                         {sq("d2"), sq("d1")}));

    controller::RuleEngineStrategy strategy(std::make_shared<model::StandardRules>());
    const auto ask = strategy.proposeMove({sq("e7"), sq("e8")}, promo);
    assert(!ask.accepted && ask.isPromotion);

    const auto done = strategy.proposeMove({sq("e7"), sq("e8"), core::PieceType::Queen}, promo);
    assert(done.accepted && done.isPromotion);
    assert((done.resulting->pieceAt(sq("e8")) ==
            core::Piece{core::PieceType::Queen, core::Color::White}));

    const auto king = strategy.proposeMove({sq("e7"), sq("e8"), core::PieceType::King}, promo);
    assert(!king.accepted && king.isPromotion);
  }

  // The adapter only reloads the engine when the position changed
  {
    auto engine = std::make_shared<ScriptedEngine>();
    engine->current = "";
    engine->targets = {sq("e3")};
    controller::RuleEngineStrategy strategy(engine);
    (void)strategy.reachableTargets(sq("e2"), start);
    (void)strategy.reachableTargets(sq("d2"), start);
    assert(engine->loads == 1);
  }

  // Misbehaving engines surface as RuleEngineError
  {
    auto refusing = std::make_shared<ScriptedEngine>();
    refusing->current = "";
    refusing->acceptLoad = false;
    controller::RuleEngineStrategy a(refusing);
    assert(throwsRuleEngineError([&] { (void)a.reachableTargets(sq("e2"), start); }));

    auto offBoard = std::make_shared<ScriptedEngine>();
    offBoard->targets = {sq("e3"), core::NO_SQUARE};
    controller::RuleEngineStrategy b(offBoard);
    assert(throwsRuleEngineError([&] { (void)b.reachableTargets(sq("e2"), start); }));

    auto garbled = std::make_shared<ScriptedEngine>();
    garbled->targets = {sq("e4")};
    garbled->applied = std::string("garbage");
    controller::RuleEngineStrategy c(garbled);
    assert(throwsRuleEngineError([&] { (void)c.proposeMove({sq("e2"), sq("e4")}, start); }));

    auto refusesMove = std::make_shared<ScriptedEngine>();
    refusesMove->targets = {sq("e4")};
    controller::RuleEngineStrategy d(refusesMove);
    assert(!d.proposeMove({sq("e2"), sq("e4")}, start).accepted);

    assert(throwsRuleEngineError([] { controller::RuleEngineStrategy e(nullptr); }));
  }

  // Bypass: geometry only, turn order is never checked
  {
    controller::BypassStrategy bypass;
    const auto targets = bypass.reachableTargets(sq("a1"), start);
    assert(targets.size() == 63);
    assert(std::find(targets.begin(), targets.end(), sq("a1")) == targets.end());
    assert(bypass.reachableTargets(sq("e4"), start).empty());

    const auto first = bypass.proposeMove({sq("a1"), sq("h8")}, start);
    assert(first.accepted);
    assert(first.resulting->sideToMove() == core::Color::White);
    assert((first.resulting->pieceAt(sq("h8")) ==
            core::Piece{core::PieceType::Rook, core::Color::White}));

    const auto second = bypass.proposeMove({sq("b1"), sq("c3")}, *first.resulting);
    assert(second.accepted);
    assert(second.resulting->sideToMove() == core::Color::White);

    assert(!bypass.proposeMove({sq("e4"), sq("e5")}, start).accepted);
    assert(!bypass.proposeMove({sq("e2"), core::NO_SQUARE}, start).accepted);

    const model::BoardSnapshot promo = position("8/4P3/8/8/8/8/8/4K2k w - - 0 1");
    const auto ask = bypass.proposeMove({sq("e7"), sq("e8")}, promo);
    assert(!ask.accepted && ask.isPromotion);
    const auto done = bypass.proposeMove({sq("e7"), sq("e8"), core::PieceType::Rook}, promo);
    assert(done.accepted && done.resulting->pieceAt(sq("e8")).type == core::PieceType::Rook);
  }

  // Synchronous strategies hand back a ready future
  {
    controller::BypassStrategy bypass;
    assert(!bypass.isAsynchronous());
    auto fut = bypass.submitMove({sq("e2"), sq("e4")}, start);
    assert(fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    assert(fut.get().accepted);
  }

  // Asynchronous decorator runs the inner proposal on a worker
  {
    controller::AsyncLegalityStrategy async(std::make_shared<controller::RuleEngineStrategy>(
        std::make_shared<model::StandardRules>()));
    assert(async.isAsynchronous());
    assert(sameSquares(async.reachableTargets(sq("g1"), start), {sq("f3"), sq("h3")}));
    auto fut = async.submitMove({sq("g1"), sq("f3")}, start);
    const controller::MoveOutcome out = fut.get();
    assert(out.accepted);
    assert(out.resulting->pieceAt(sq("f3")).type == core::PieceType::Knight);
  }

  // Target queries wait for a proposal running on the same engine
  {
    auto rules = std::make_shared<model::StandardRules>();
    controller::AsyncLegalityStrategy async(std::make_shared<controller::RuleEngineStrategy>(rules));
    const model::BoardSnapshot afterE4 =
        *model::BoardSnapshot::fromFen("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");

    for (int i = 0; i < 50; ++i)
    {
      auto fut = async.submitMove({sq("e2"), sq("e4")}, start);
      assert(sameSquares(async.reachableTargets(sq("d7"), afterE4), {sq("d6"), sq("d5")}));
      const controller::MoveOutcome out = fut.get();
      assert(out.accepted);
      assert(out.resulting->pieceAt(sq("e4")).type == core::PieceType::Pawn);
      assert(out.resulting->sideToMove() == core::Color::Black);
    }
  }

  std::cout << "legality_strategy_test passed\n";
  return 0;
}
