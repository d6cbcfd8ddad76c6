#include "gambit/view/overlay_projection.hpp"

#include "gambit/controller/board_controller.hpp"

namespace gambit::view
{

  namespace
  {
    void projectArrows(const controller::BoardController &ctrl, Overlay &out)
    {
      const auto &cfg = ctrl.config();
      const float boardPx = ctrl.boardPixelSize();
      if (!cfg.showArrows || boardPx <= 0.f)
        return;

      for (const auto &a : cfg.arrows)
      {
        auto path = CoordinateSystem::arrowGeometry(a.from, a.to, a.piece, boardPx, cfg.orientation);
        if (!path)
          continue;
        out.arrows.push_back({a.from, a.to, std::move(*path), a.color, a.opacity, false});
      }

      if (cfg.bestMove)
      {
        // bends like a knight when a knight stands on the origin
        const core::PieceType mover = ctrl.snapshot().pieceAt(cfg.bestMove->from).type;
        auto path = CoordinateSystem::arrowGeometry(cfg.bestMove->from, cfg.bestMove->to, mover,
                                                    boardPx, cfg.orientation);
        if (path)
          out.arrows.push_back({cfg.bestMove->from, cfg.bestMove->to, std::move(*path),
                                config::DEFAULT_ARROW_COLOR, 0.8f, true});
      }
    }
  } // namespace

  Overlay OverlayProjection::project(const controller::BoardController &ctrl)
  {
    Overlay out;
    const model::BoardSnapshot &snap = ctrl.snapshot();

    if (ctrl.state() == controller::InteractionState::PieceSelected)
    {
      out.selected = ctrl.selectedSquare();
      const core::Piece mover = snap.pieceAt(out.selected);
      out.legalMarkers.reserve(ctrl.targets().size());
      for (core::Square sq : ctrl.targets())
      {
        const core::Piece target = snap.pieceAt(sq);
        out.legalMarkers.push_back({sq, !target.isNone() && target.color != mover.color});
      }
    }

    out.lastMove = ctrl.lastMove();
    out.hint = ctrl.hintSquare();
    out.hintRemaining = ctrl.hintRemaining();
    out.hovered = ctrl.hoveredSquare();
    out.promotion = ctrl.pendingPromotion();
    out.highlights = ctrl.config().highlights;

    for (core::Square sq = 0; sq < core::NO_SQUARE; ++sq)
      if (ctrl.config().isCircled(sq) && snap.hasPiece(sq))
        out.circled.push_back(sq);

    projectArrows(ctrl, out);
    out.masked = ctrl.visibility().maskedSquares(snap);
    return out;
  }

} // namespace gambit::view
