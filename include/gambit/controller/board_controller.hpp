#pragma once

#include <SFML/System/Vector2.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "gambit/chess_types.hpp"
#include "gambit/config/board_config.hpp"
#include "gambit/model/board_snapshot.hpp"
#include "controller_types.hpp"
#include "legality_strategy.hpp"
#include "visibility_policy.hpp"

namespace gambit::model
{
  struct IRuleEngine;
}

namespace gambit::controller
{

  // Owns selection state for one board. Taps and drags are reconciled into move intents,
  // checked by the installed legality strategy and committed into a new snapshot.
  // All transitions run synchronously inside the command that caused them.
  class BoardController
  {
  public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    using MoveCallback = std::function<void(const MoveRecord &mv, core::PieceType promotion)>;
    using PromotionCallback = std::function<void(core::Square from, core::Square to)>;
    using RevealCallback = std::function<void(core::Square sq)>;
    using FeedbackCallback = std::function<void(Feedback)>;
    using RestrictedCallback = std::function<void(core::Square sq, RestrictionSource source)>;

    // engine == nullptr installs the bundled StandardRules engine.
    explicit BoardController(config::BoardConfig cfg,
                             std::shared_ptr<model::IRuleEngine> engine = nullptr,
                             Clock clock = {});
    ~BoardController();

    BoardController(const BoardController &) = delete;
    BoardController &operator=(const BoardController &) = delete;

    void setOnMoveCommitted(MoveCallback cb) { m_on_move = std::move(cb); }
    void setOnPromotionRequested(PromotionCallback cb) { m_on_promotion = std::move(cb); }
    void setOnReveal(RevealCallback cb) { m_on_reveal = std::move(cb); }
    void setOnFeedback(FeedbackCallback cb) { m_on_feedback = std::move(cb); }
    void setOnRestrictedAttempt(RestrictedCallback cb) { m_on_restricted = std::move(cb); }

    // ---------- input ----------
    BoardError activateSquare(core::Square sq);
    BoardError activateSquare(std::string_view sq);
    BoardError beginDrag(core::Square sq);
    // displacement is measured from the point where the drag started
    void updateDrag(core::Square origin, sf::Vector2f displacement);
    BoardError endDrag(core::Square origin, sf::Vector2f displacement);
    // Drag that never reached the board (focus lost, window closed): aborts like an
    // off-board drop.
    void cancelDrag();

    // ---------- imperative ----------
    [[nodiscard]] BoardError setPosition(std::string_view fen, SetPositionOptions opts = {});
    BoardError highlightSquare(core::Square sq);
    BoardError highlightSquare(std::string_view sq);
    void clearHighlight();
    [[nodiscard]] BoardError choosePromotion(core::PieceType kind);
    [[nodiscard]] BoardError choosePromotion(std::string_view kind);
    BoardError cancelPromotion();
    BoardError setLastMove(core::Square from, core::Square to);
    void clearLastMove() { m_last_move = {}; }
    void reconfigure(config::BoardConfig cfg);
    void setStrategy(std::shared_ptr<ILegalityStrategy> strategy);
    void setBoardPixelSize(float px) { m_board_px = px; }

    // Called once per frame: expires the hint, resolves a finished asynchronous proposal.
    void update();

    // ---------- queries ----------
    [[nodiscard]] InteractionState state() const { return m_state; }
    [[nodiscard]] core::Square selectedSquare() const { return m_selected; }
    [[nodiscard]] const std::vector<core::Square> &targets() const { return m_targets; }
    [[nodiscard]] std::optional<MoveIntent> pendingPromotion() const;
    [[nodiscard]] const MoveRecord &lastMove() const { return m_last_move; }
    [[nodiscard]] core::Square hintSquare() const { return m_hint; }
    [[nodiscard]] std::chrono::milliseconds hintRemaining() const;
    [[nodiscard]] const model::BoardSnapshot &snapshot() const { return m_snapshot; }
    [[nodiscard]] core::Square hoveredSquare() const { return m_hovered; }
    [[nodiscard]] bool isDragging() const { return m_dragging; }
    [[nodiscard]] bool isAwaitingEngine() const { return m_pending.valid(); }
    // Also true while a discarded proposal is still running; input is held back meanwhile.
    [[nodiscard]] bool isEngineBusy() const;
    [[nodiscard]] const config::ValidatedConfig &config() const { return m_cfg; }
    [[nodiscard]] const VisibilityPolicy &visibility() const { return m_visibility; }
    [[nodiscard]] const std::shared_ptr<ILegalityStrategy> &strategy() const { return m_strategy; }
    [[nodiscard]] float boardPixelSize() const { return m_board_px; }
    [[nodiscard]] core::Orientation orientation() const { return m_cfg.orientation; }

  private:
    enum class EventKind
    {
      Activate,
      BeginDrag,
      EndDrag
    };

    struct QueuedEvent
    {
      EventKind kind;
      core::Square square;
      sf::Vector2f displacement;
    };

    void applyConfig(config::ValidatedConfig cfg);
    std::shared_ptr<ILegalityStrategy> makeStrategy(config::LegalityMode mode);

    // true when the event was parked behind a busy engine (or dropped there)
    bool deferWhileAwaiting(EventKind kind, core::Square sq, sf::Vector2f disp);
    void replay(const QueuedEvent &ev);

    BoardError selectPiece(core::Square sq, RestrictionSource source);
    BoardError attemptMove(core::Square from, core::Square to);
    BoardError submit(const MoveIntent &intent);
    BoardError resolveOutcome(const MoveIntent &intent, const MoveOutcome &outcome);
    void commit(const MoveIntent &intent, model::BoardSnapshot next);
    BoardError rejectMove();
    void deselect(Feedback signal);
    void resetInteraction();
    void discardPending();

    std::vector<core::Square> queryTargets(core::Square sq);
    [[nodiscard]] bool isTarget(core::Square sq) const;
    [[nodiscard]] bool insideDebounceWindow() const;
    void emit(Feedback f) const;

    config::ValidatedConfig m_cfg;
    std::shared_ptr<model::IRuleEngine> m_engine;
    std::shared_ptr<ILegalityStrategy> m_strategy;
    VisibilityPolicy m_visibility;
    Clock m_clock;

    model::BoardSnapshot m_snapshot;

    InteractionState m_state = InteractionState::Idle;
    core::Square m_selected = core::NO_SQUARE;
    std::vector<core::Square> m_targets;
    core::Square m_promo_from = core::NO_SQUARE;
    core::Square m_promo_to = core::NO_SQUARE;

    MoveRecord m_last_move;
    std::optional<TimePoint> m_last_commit;

    core::Square m_hint = core::NO_SQUARE;
    TimePoint m_hint_deadline{};

    bool m_dragging = false;
    core::Square m_drag_origin = core::NO_SQUARE;
    core::Square m_hovered = core::NO_SQUARE;
    float m_board_px = 0.f;

    // asynchronous proposal in flight, plus at most one event received meanwhile
    std::future<MoveOutcome> m_pending;
    MoveIntent m_pending_intent;
    std::optional<QueuedEvent> m_queued;
    std::vector<std::future<MoveOutcome>> m_abandoned;

    MoveCallback m_on_move = nullptr;
    PromotionCallback m_on_promotion = nullptr;
    RevealCallback m_on_reveal = nullptr;
    FeedbackCallback m_on_feedback = nullptr;
    RestrictedCallback m_on_restricted = nullptr;
  };

} // namespace gambit::controller
