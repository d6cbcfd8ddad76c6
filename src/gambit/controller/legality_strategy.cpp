#include "gambit/controller/legality_strategy.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include "gambit/model/rule_engine.hpp"

namespace gambit::controller {

namespace {

inline bool contains(const std::vector<core::Square>& v, core::Square sq) {
  return std::find(v.begin(), v.end(), sq) != v.end();
}

inline bool geometricallySane(const MoveIntent& intent) {
  return core::validSquare(intent.from) && core::validSquare(intent.to) &&
         intent.from != intent.to;
}

}  // namespace

std::future<MoveOutcome> ILegalityStrategy::submitMove(const MoveIntent& intent,
                                                       const model::BoardSnapshot& snap) {
  std::promise<MoveOutcome> result;
  try {
    result.set_value(proposeMove(intent, snap));
  } catch (const std::exception&) {
    // handed to whoever calls get()
    result.set_exception(std::current_exception());
  }
  return result.get_future();
}

bool requiresPromotion(const model::BoardSnapshot& snap, const MoveIntent& intent) {
  const core::Piece p = snap.pieceAt(intent.from);
  if (p.type != core::PieceType::Pawn || !core::validSquare(intent.to)) return false;
  const int lastRank = (p.color == core::Color::White) ? 7 : 0;
  return core::rankOf(intent.to) == lastRank;
}

// ---------------- RuleEngineStrategy ----------------

RuleEngineStrategy::RuleEngineStrategy(std::shared_ptr<model::IRuleEngine> engine)
    : m_engine(std::move(engine)) {
  if (!m_engine) throw model::RuleEngineError("RuleEngineStrategy needs an engine");
}

void RuleEngineStrategy::syncEngine(const model::BoardSnapshot& snap) {
  const std::string fen = snap.toFen();
  if (m_engine->fen() == fen) return;
  if (!m_engine->loadFen(fen)) throw model::RuleEngineError("engine refused position: " + fen);
}

std::vector<core::Square> RuleEngineStrategy::reachableTargets(core::Square from,
                                                               const model::BoardSnapshot& snap) {
  const core::Piece p = snap.pieceAt(from);
  if (p.isNone()) return {};

  syncEngine(snap);
  if (p.color != m_engine->activeSide()) return {};

  std::vector<core::Square> targets = m_engine->legalTargets(from);
  for (core::Square sq : targets) {
    if (!core::validSquare(sq))
      throw model::RuleEngineError("engine returned off-board target from " +
                                   core::squareToString(from));
  }
  return targets;
}

MoveOutcome RuleEngineStrategy::proposeMove(const MoveIntent& intent,
                                            const model::BoardSnapshot& snap) {
  MoveOutcome out;
  if (!geometricallySane(intent)) return out;
  if (!contains(reachableTargets(intent.from, snap), intent.to)) return out;

  out.isPromotion = requiresPromotion(snap, intent);
  if (out.isPromotion && !core::isPromotionChoice(intent.promotion)) return out;

  const core::PieceType promo = out.isPromotion ? intent.promotion : core::PieceType::None;
  const auto fen = m_engine->applyMove(intent.from, intent.to, promo);
  if (!fen) return out;

  auto next = model::BoardSnapshot::fromFen(*fen);
  if (!next) throw model::RuleEngineError("engine returned unparsable FEN: " + *fen);

  out.accepted = true;
  out.resulting = std::move(next);
  return out;
}

// ---------------- BypassStrategy ----------------

std::vector<core::Square> BypassStrategy::reachableTargets(core::Square from,
                                                           const model::BoardSnapshot& snap) {
  std::vector<core::Square> targets;
  if (!snap.hasPiece(from)) return targets;
  targets.reserve(63);
  for (core::Square sq = 0; sq < core::NO_SQUARE; ++sq)
    if (sq != from) targets.push_back(sq);
  return targets;
}

MoveOutcome BypassStrategy::proposeMove(const MoveIntent& intent,
                                        const model::BoardSnapshot& snap) {
  MoveOutcome out;
  if (!geometricallySane(intent) || !snap.hasPiece(intent.from)) return out;

  out.isPromotion = requiresPromotion(snap, intent);
  if (out.isPromotion && !core::isPromotionChoice(intent.promotion)) return out;

  const core::PieceType promo = out.isPromotion ? intent.promotion : core::PieceType::None;
  out.accepted = true;
  out.resulting = snap.withPieceMoved(intent.from, intent.to, promo);
  return out;
}

// ---------------- AsyncLegalityStrategy ----------------

AsyncLegalityStrategy::AsyncLegalityStrategy(std::shared_ptr<ILegalityStrategy> inner)
    : m_inner(std::move(inner)), m_mutex(std::make_shared<std::mutex>()) {}

std::vector<core::Square> AsyncLegalityStrategy::reachableTargets(
    core::Square from, const model::BoardSnapshot& snap) {
  std::lock_guard lk(*m_mutex);
  return m_inner->reachableTargets(from, snap);
}

MoveOutcome AsyncLegalityStrategy::proposeMove(const MoveIntent& intent,
                                               const model::BoardSnapshot& snap) {
  std::lock_guard lk(*m_mutex);
  return m_inner->proposeMove(intent, snap);
}

std::future<MoveOutcome> AsyncLegalityStrategy::submitMove(const MoveIntent& intent,
                                                           const model::BoardSnapshot& snap) {
  // the worker gets its own copy of the snapshot, the controller may replace its own meanwhile
  return std::async(std::launch::async,
                    [inner = m_inner, mutex = m_mutex, intent, snap]() -> MoveOutcome {
                      std::lock_guard lk(*mutex);
                      return inner->proposeMove(intent, snap);
                    });
}

}  // namespace gambit::controller
