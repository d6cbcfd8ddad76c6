#include "gambit/controller/input_manager.hpp"

#include <SFML/Window/Event.hpp>

namespace gambit::controller {

void InputManager::setOnClick(ClickCallback cb) {
  m_on_click = std::move(cb);
}

void InputManager::setOnDragBegin(DragBeginCallback cb) {
  m_on_drag_begin = std::move(cb);
}

void InputManager::setOnDrag(DragCallback cb) {
  m_on_drag = std::move(cb);
}

void InputManager::setOnDrop(DropCallback cb) {
  m_on_drop = std::move(cb);
}

void InputManager::processEvent(const sf::Event& event) {
  switch (event.type) {
    case sf::Event::MouseButtonPressed:
      if (event.mouseButton.button == sf::Mouse::Left) {
        m_press_start = MousePos(event.mouseButton.x, event.mouseButton.y);
        m_dragging = false;
      }
      break;

    case sf::Event::MouseMoved:
      if (m_press_start) {
        const MousePos currentPos(event.mouseMove.x, event.mouseMove.y);
        beginDragIfNeeded(currentPos);
        if (m_dragging && m_on_drag) m_on_drag(m_press_start.value(), currentPos);
      }
      break;

    case sf::Event::MouseButtonReleased:
      if (event.mouseButton.button == sf::Mouse::Left && m_press_start) {
        const MousePos dropPos(event.mouseButton.x, event.mouseButton.y);
        beginDragIfNeeded(dropPos);
        if (!m_dragging) {
          if (m_on_click) m_on_click(dropPos);
        } else {
          if (m_on_drop) m_on_drop(m_press_start.value(), dropPos);
        }
        m_press_start.reset();
        m_dragging = false;
      }
      break;

    default:
      break;
  }
}

void InputManager::cancelDrag() {
  m_dragging = false;
  m_press_start.reset();
}

void InputManager::beginDragIfNeeded(MousePos current) {
  if (m_dragging || !m_press_start || isClick(m_press_start.value(), current)) return;
  m_dragging = true;
  if (m_on_drag_begin) m_on_drag_begin(m_press_start.value());
}

bool InputManager::isClick(const MousePos& start, const MousePos& end, int threshold) const {
  const int dx = end.x - start.x;
  const int dy = end.y - start.y;
  return (dx * dx + dy * dy) <= (threshold * threshold);
}

}  // namespace gambit::controller
