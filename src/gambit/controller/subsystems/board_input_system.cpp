#include "gambit/controller/subsystems/board_input_system.hpp"

#include "gambit/controller/board_controller.hpp"
#include "gambit/view/coordinate_system.hpp"

namespace gambit::controller {

BoardInputSystem::BoardInputSystem(BoardController& ctrl, InputManager& input)
    : m_ctrl(ctrl), m_input(input) {}

void BoardInputSystem::bindInputCallbacks() {
  m_input.setOnClick([this](MousePos pos) { onClick(pos); });
  m_input.setOnDragBegin([this](MousePos s) { onDragBegin(s); });
  m_input.setOnDrag([this](MousePos s, MousePos c) { onDrag(s, c); });
  m_input.setOnDrop([this](MousePos s, MousePos e) { onDrop(s, e); });
}

void BoardInputSystem::setBoardRect(sf::Vector2f origin, float sizePx) {
  m_origin = origin;
  m_size_px = sizePx;
  m_ctrl.setBoardPixelSize(sizePx);
}

void BoardInputSystem::onLostFocus() {
  if (!core::validSquare(m_drag_from)) return;
  m_input.cancelDrag();
  m_ctrl.cancelDrag();
  m_drag_from = core::NO_SQUARE;
}

core::Square BoardInputSystem::squareAt(MousePos pos) const {
  const sf::Vector2f local(static_cast<float>(pos.x) - m_origin.x,
                           static_cast<float>(pos.y) - m_origin.y);
  return view::CoordinateSystem::squareAtPixel(local, m_ctrl.orientation(), m_size_px);
}

void BoardInputSystem::onClick(MousePos pos) {
  const core::Square sq = squareAt(pos);
  if (!core::validSquare(sq)) return;
  m_ctrl.activateSquare(sq);
}

void BoardInputSystem::onDragBegin(MousePos start) {
  const core::Square sq = squareAt(start);
  if (!core::validSquare(sq)) return;
  m_drag_from = sq;
  m_ctrl.beginDrag(sq);
}

void BoardInputSystem::onDrag(MousePos start, MousePos current) {
  if (!core::validSquare(m_drag_from)) return;
  m_ctrl.updateDrag(m_drag_from, displacement(start, current));
}

void BoardInputSystem::onDrop(MousePos start, MousePos end) {
  if (!core::validSquare(m_drag_from)) return;
  const core::Square from = m_drag_from;
  m_drag_from = core::NO_SQUARE;
  m_ctrl.endDrag(from, displacement(start, end));
}

sf::Vector2f BoardInputSystem::displacement(MousePos start, MousePos end) {
  return {static_cast<float>(end.x - start.x), static_cast<float>(end.y - start.y)};
}

}  // namespace gambit::controller
