#include "gambit/controller/board_controller.hpp"

#include <algorithm>
#include <iostream>

#include "gambit/constants.hpp"
#include "gambit/model/rule_engine.hpp"
#include "gambit/model/standard_rules.hpp"
#include "gambit/view/coordinate_system.hpp"

namespace gambit::controller {

namespace {

inline void warnSquare(std::string_view what, std::string_view text) {
  std::cerr << "[BoardController] warning: " << what << ": malformed square '" << text << "'\n";
}

}  // namespace

BoardController::BoardController(config::BoardConfig cfg,
                                 std::shared_ptr<model::IRuleEngine> engine, Clock clock)
    : m_engine(engine ? std::move(engine) : std::make_shared<model::StandardRules>()),
      m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
  config::ValidatedConfig validated = config::validate(cfg);

  auto snap = model::BoardSnapshot::fromFen(validated.startFen);
  if (!snap) {
    std::cerr << "[BoardController] warning: invalid start position '" << validated.startFen
              << "', using the standard start\n";
    snap = model::BoardSnapshot::fromFen(core::START_FEN);
  }
  m_snapshot = snap.value_or(model::BoardSnapshot{});

  m_strategy = makeStrategy(validated.legalityMode);
  applyConfig(std::move(validated));
}

BoardController::~BoardController() = default;

void BoardController::applyConfig(config::ValidatedConfig cfg) {
  m_visibility.configure(cfg.blindfoldEnabled, cfg.hiddenSquares);
  m_cfg = std::move(cfg);
}

std::shared_ptr<ILegalityStrategy> BoardController::makeStrategy(config::LegalityMode mode) {
  if (mode == config::LegalityMode::Bypass) return std::make_shared<BypassStrategy>();
  return std::make_shared<RuleEngineStrategy>(m_engine);
}

// ---------------- input ----------------

BoardError BoardController::activateSquare(core::Square sq) {
  if (m_cfg.readonly) return BoardError::None;
  if (!core::validSquare(sq)) {
    warnSquare("activateSquare", core::squareToString(sq));
    return BoardError::InvalidSquareFormat;
  }
  if (m_visibility.redirectsActivation()) {
    if (m_on_reveal) m_on_reveal(sq);
    return BoardError::None;
  }

  if (deferWhileAwaiting(EventKind::Activate, sq, {})) return BoardError::None;
  if (m_state == InteractionState::PromotionPending) return BoardError::InvalidState;

  if (m_state == InteractionState::Idle) return selectPiece(sq, RestrictionSource::Select);

  if (sq == m_selected) {
    deselect(Feedback::Deselected);
    return BoardError::None;
  }

  const core::Piece selected = m_snapshot.pieceAt(m_selected);
  const core::Piece clicked = m_snapshot.pieceAt(sq);
  if (!clicked.isNone() && clicked.color == selected.color)
    return selectPiece(sq, RestrictionSource::Select);
  if (isTarget(sq)) return attemptMove(m_selected, sq);
  if (!clicked.isNone()) return selectPiece(sq, RestrictionSource::Select);

  deselect(Feedback::Deselected);
  return BoardError::None;
}

BoardError BoardController::activateSquare(std::string_view sq) {
  const core::Square parsed = core::squareFromString(sq);
  if (!core::validSquare(parsed)) {
    warnSquare("activateSquare", sq);
    return BoardError::InvalidSquareFormat;
  }
  return activateSquare(parsed);
}

BoardError BoardController::beginDrag(core::Square sq) {
  if (m_cfg.readonly) return BoardError::None;
  if (!core::validSquare(sq)) {
    warnSquare("beginDrag", core::squareToString(sq));
    return BoardError::InvalidSquareFormat;
  }
  if (m_visibility.redirectsActivation()) {
    if (m_on_reveal) m_on_reveal(sq);
    return BoardError::None;
  }

  if (deferWhileAwaiting(EventKind::BeginDrag, sq, {})) return BoardError::None;
  if (m_state == InteractionState::PromotionPending) return BoardError::InvalidState;

  BoardError err = BoardError::None;
  if (m_state != InteractionState::PieceSelected || sq != m_selected) {
    if (!m_snapshot.hasPiece(sq)) return BoardError::None;
    err = selectPiece(sq, RestrictionSource::Drag);
  }

  if (m_state == InteractionState::PieceSelected && m_selected == sq) {
    m_dragging = true;
    m_drag_origin = sq;
    m_hovered = sq;
  }
  return err;
}

void BoardController::updateDrag(core::Square origin, sf::Vector2f displacement) {
  if (!m_dragging || origin != m_drag_origin) return;
  m_hovered = view::CoordinateSystem::resolveDrop(origin, displacement, m_cfg.orientation,
                                                  m_board_px);
}

BoardError BoardController::endDrag(core::Square origin, sf::Vector2f displacement) {
  if (m_cfg.readonly) return BoardError::None;
  if (!core::validSquare(origin)) {
    warnSquare("endDrag", core::squareToString(origin));
    return BoardError::InvalidSquareFormat;
  }
  if (deferWhileAwaiting(EventKind::EndDrag, origin, displacement)) return BoardError::None;
  if (m_state == InteractionState::PromotionPending) return BoardError::InvalidState;
  if (!m_dragging || origin != m_drag_origin) return BoardError::None;

  m_dragging = false;
  m_drag_origin = core::NO_SQUARE;
  m_hovered = core::NO_SQUARE;

  if (displacement.x == 0.f && displacement.y == 0.f) {
    deselect(Feedback::Deselected);
    return BoardError::None;
  }

  const core::Square dest = view::CoordinateSystem::resolveDrop(origin, displacement,
                                                                m_cfg.orientation, m_board_px);
  if (dest == origin) {
    deselect(Feedback::Deselected);
    return BoardError::None;
  }
  if (!core::validSquare(dest)) return rejectMove();
  // the expected move skips the cached targets, the strategy still rules on it
  const bool expected = m_cfg.expectedMove && m_cfg.expectedMove->from == origin &&
                        m_cfg.expectedMove->to == dest;
  if (!expected && !isTarget(dest)) return rejectMove();
  return attemptMove(origin, dest);
}

void BoardController::cancelDrag() {
  if (!m_dragging) return;
  rejectMove();
}

// ---------------- imperative ----------------

BoardError BoardController::setPosition(std::string_view fen, SetPositionOptions opts) {
  auto snap = model::BoardSnapshot::fromFen(fen);
  if (!snap) {
    std::cerr << "[BoardController] warning: rejected position '" << fen << "'\n";
    return BoardError::InvalidPosition;
  }

  discardPending();
  m_snapshot = std::move(*snap);
  resetInteraction();
  m_hint = core::NO_SQUARE;
  m_last_commit.reset();
  if (!opts.preserveLastMove) m_last_move = {};
  return BoardError::None;
}

BoardError BoardController::highlightSquare(core::Square sq) {
  if (!core::validSquare(sq)) {
    warnSquare("highlightSquare", core::squareToString(sq));
    return BoardError::InvalidSquareFormat;
  }
  m_hint = sq;
  m_hint_deadline = m_clock() + m_cfg.hintDuration;
  return BoardError::None;
}

BoardError BoardController::highlightSquare(std::string_view sq) {
  const core::Square parsed = core::squareFromString(sq);
  if (!core::validSquare(parsed)) {
    warnSquare("highlightSquare", sq);
    return BoardError::InvalidSquareFormat;
  }
  return highlightSquare(parsed);
}

void BoardController::clearHighlight() {
  m_hint = core::NO_SQUARE;
}

BoardError BoardController::choosePromotion(core::PieceType kind) {
  if (m_state != InteractionState::PromotionPending || m_pending.valid())
    return BoardError::InvalidState;
  if (!core::isPromotionChoice(kind)) {
    std::cerr << "[BoardController] warning: cannot promote to " << core::pieceTypeName(kind)
              << "\n";
    return BoardError::InvalidState;
  }
  return submit(MoveIntent{m_promo_from, m_promo_to, kind});
}

BoardError BoardController::choosePromotion(std::string_view kind) {
  const auto parsed = core::pieceTypeFromString(kind);
  if (!parsed) {
    std::cerr << "[BoardController] warning: unknown promotion piece '" << kind << "'\n";
    return BoardError::InvalidState;
  }
  return choosePromotion(*parsed);
}

BoardError BoardController::cancelPromotion() {
  if (m_state != InteractionState::PromotionPending || m_pending.valid())
    return BoardError::InvalidState;
  deselect(Feedback::Deselected);
  return BoardError::None;
}

BoardError BoardController::setLastMove(core::Square from, core::Square to) {
  if (!core::validSquare(from) || !core::validSquare(to)) {
    warnSquare("setLastMove", core::squareToString(from) + core::squareToString(to));
    return BoardError::InvalidSquareFormat;
  }
  m_last_move = {from, to};
  return BoardError::None;
}

void BoardController::reconfigure(config::BoardConfig cfg) {
  config::ValidatedConfig next = config::validate(cfg);
  const bool modeChanged = next.legalityMode != m_cfg.legalityMode;
  applyConfig(std::move(next));

  if (modeChanged) {
    discardPending();
    m_strategy = makeStrategy(m_cfg.legalityMode);
    resetInteraction();
  }
}

void BoardController::setStrategy(std::shared_ptr<ILegalityStrategy> strategy) {
  if (!strategy) {
    std::cerr << "[BoardController] warning: ignoring empty legality strategy\n";
    return;
  }
  discardPending();
  m_strategy = std::move(strategy);
  resetInteraction();
}

void BoardController::update() {
  const TimePoint now = m_clock();
  if (core::validSquare(m_hint) && now >= m_hint_deadline) m_hint = core::NO_SQUARE;

  m_abandoned.erase(std::remove_if(m_abandoned.begin(), m_abandoned.end(),
                                   [](const std::future<MoveOutcome>& f) {
                                     return f.wait_for(std::chrono::seconds(0)) ==
                                            std::future_status::ready;
                                   }),
                    m_abandoned.end());

  if (m_pending.valid()) {
    if (m_pending.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return;

    const MoveIntent intent = m_pending_intent;
    try {
      const MoveOutcome outcome = m_pending.get();
      resolveOutcome(intent, outcome);
    } catch (const std::exception& e) {
      std::cerr << "[BoardController] warning: legality strategy failed: " << e.what() << "\n";
      rejectMove();
    }
  }

  if (m_queued && !isEngineBusy()) {
    const QueuedEvent ev = *m_queued;
    m_queued.reset();
    replay(ev);
  }
}

std::optional<MoveIntent> BoardController::pendingPromotion() const {
  if (m_state != InteractionState::PromotionPending) return std::nullopt;
  return MoveIntent{m_promo_from, m_promo_to, core::PieceType::None};
}

std::chrono::milliseconds BoardController::hintRemaining() const {
  if (!core::validSquare(m_hint)) return std::chrono::milliseconds{0};
  const auto left = m_hint_deadline - m_clock();
  if (left <= TimePoint::duration::zero()) return std::chrono::milliseconds{0};
  return std::chrono::duration_cast<std::chrono::milliseconds>(left);
}

// ---------------- internals ----------------

bool BoardController::isEngineBusy() const {
  if (m_pending.valid()) return true;
  // a discarded proposal may still be running inside the shared engine
  return std::any_of(m_abandoned.begin(), m_abandoned.end(), [](const std::future<MoveOutcome>& f) {
    return f.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
  });
}

bool BoardController::deferWhileAwaiting(EventKind kind, core::Square sq, sf::Vector2f disp) {
  if (!isEngineBusy()) return false;
  if (!m_queued && core::validSquare(sq)) m_queued = QueuedEvent{kind, sq, disp};
  return true;
}

void BoardController::replay(const QueuedEvent& ev) {
  BoardError err = BoardError::None;
  switch (ev.kind) {
    case EventKind::Activate:
      err = activateSquare(ev.square);
      break;
    case EventKind::BeginDrag:
      err = beginDrag(ev.square);
      break;
    case EventKind::EndDrag:
      err = endDrag(ev.square, ev.displacement);
      break;
  }
  if (err == BoardError::EngineFailure)
    std::cerr << "[BoardController] warning: queued input failed: " << toString(err) << "\n";
}

BoardError BoardController::selectPiece(core::Square sq, RestrictionSource source) {
  if (!m_snapshot.hasPiece(sq)) {
    if (m_state == InteractionState::PieceSelected) deselect(Feedback::Deselected);
    return BoardError::None;
  }

  if (!m_cfg.allowsSelection(sq)) {
    if (m_on_restricted) m_on_restricted(sq, source);
    emit(Feedback::Restricted);
    return BoardError::None;
  }

  std::vector<core::Square> targets = queryTargets(sq);
  if (targets.empty()) {
    if (m_state == InteractionState::PieceSelected) deselect(Feedback::Deselected);
    return BoardError::None;
  }

  m_state = InteractionState::PieceSelected;
  m_selected = sq;
  m_targets = std::move(targets);
  m_dragging = false;
  m_drag_origin = core::NO_SQUARE;
  emit(Feedback::Selected);
  return BoardError::None;
}

BoardError BoardController::attemptMove(core::Square from, core::Square to) {
  // repeated gestures inside the window are dropped without touching state
  if (insideDebounceWindow()) return BoardError::None;
  return submit(MoveIntent{from, to, core::PieceType::None});
}

BoardError BoardController::submit(const MoveIntent& intent) {
  if (m_strategy->isAsynchronous()) {
    try {
      m_pending = m_strategy->submitMove(intent, m_snapshot);
      m_pending_intent = intent;
    } catch (const std::exception& e) {
      std::cerr << "[BoardController] warning: legality strategy failed: " << e.what() << "\n";
      rejectMove();
      return BoardError::EngineFailure;
    }
    return BoardError::None;
  }

  MoveOutcome outcome;
  try {
    outcome = m_strategy->proposeMove(intent, m_snapshot);
  } catch (const std::exception& e) {
    std::cerr << "[BoardController] warning: legality strategy failed: " << e.what() << "\n";
    rejectMove();
    return BoardError::EngineFailure;
  }
  return resolveOutcome(intent, outcome);
}

BoardError BoardController::resolveOutcome(const MoveIntent& intent, const MoveOutcome& outcome) {
  if (outcome.accepted && outcome.resulting) {
    commit(intent, *outcome.resulting);
    return BoardError::None;
  }

  if (outcome.isPromotion && intent.promotion == core::PieceType::None) {
    resetInteraction();
    m_state = InteractionState::PromotionPending;
    m_promo_from = intent.from;
    m_promo_to = intent.to;
    emit(Feedback::PromotionRequested);
    if (m_on_promotion) m_on_promotion(intent.from, intent.to);
    return BoardError::None;
  }

  return rejectMove();
}

void BoardController::commit(const MoveIntent& intent, model::BoardSnapshot next) {
  m_snapshot = std::move(next);
  const MoveRecord record{intent.from, intent.to};
  m_last_move = record;
  m_hint = core::NO_SQUARE;
  m_last_commit = m_clock();
  resetInteraction();

  emit(Feedback::MoveCommitted);
  if (m_on_move) m_on_move(record, intent.promotion);
}

BoardError BoardController::rejectMove() {
  resetInteraction();
  emit(Feedback::Invalid);
  return BoardError::IllegalMove;
}

void BoardController::deselect(Feedback signal) {
  resetInteraction();
  emit(signal);
}

void BoardController::resetInteraction() {
  m_state = InteractionState::Idle;
  m_selected = core::NO_SQUARE;
  m_targets.clear();
  m_promo_from = core::NO_SQUARE;
  m_promo_to = core::NO_SQUARE;
  m_dragging = false;
  m_drag_origin = core::NO_SQUARE;
  m_hovered = core::NO_SQUARE;
}

void BoardController::discardPending() {
  // a std::async future blocks in its destructor, so unfinished ones are parked until ready
  if (m_pending.valid()) m_abandoned.push_back(std::move(m_pending));
  m_queued.reset();
}

std::vector<core::Square> BoardController::queryTargets(core::Square sq) {
  try {
    return m_strategy->reachableTargets(sq, m_snapshot);
  } catch (const std::exception& e) {
    std::cerr << "[BoardController] warning: target query for " << core::squareToString(sq)
              << " failed: " << e.what() << "\n";
    return {};
  }
}

bool BoardController::isTarget(core::Square sq) const {
  return std::find(m_targets.begin(), m_targets.end(), sq) != m_targets.end();
}

bool BoardController::insideDebounceWindow() const {
  if (!m_last_commit) return false;
  return m_clock() - *m_last_commit < m_cfg.moveDebounce;
}

void BoardController::emit(Feedback f) const {
  if (m_on_feedback) m_on_feedback(f);
}

}  // namespace gambit::controller
