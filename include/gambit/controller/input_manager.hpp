#pragma once

namespace sf
{
  class Event;
}

#include <SFML/System/Vector2.hpp>
#include <functional>
#include <optional>

namespace gambit::controller
{

  using MousePos = sf::Vector2i;

  // Turns raw left-button mouse events into click and drag gestures. A press that travels
  // no further than the click threshold before release is a click; anything else is a
  // drag that begins once the threshold is crossed.
  class InputManager
  {
  public:
    static constexpr int CLICK_THRESHOLD_PX = 4;

    using ClickCallback = std::function<void(MousePos)>;
    using DragBeginCallback = std::function<void(MousePos start)>;
    using DragCallback = std::function<void(MousePos start, MousePos current)>;
    using DropCallback = std::function<void(MousePos start, MousePos end)>;

    void setOnClick(ClickCallback cb);
    void setOnDragBegin(DragBeginCallback cb);
    void setOnDrag(DragCallback cb);
    void setOnDrop(DropCallback cb);

    void processEvent(const sf::Event &event);
    void cancelDrag();

    [[nodiscard]] bool isDragging() const { return m_dragging; }

  private:
    bool m_dragging = false;               // threshold crossed, gesture is a drag
    std::optional<MousePos> m_press_start; // left button is down since this position

    ClickCallback m_on_click = nullptr;
    DragBeginCallback m_on_drag_begin = nullptr;
    DragCallback m_on_drag = nullptr;
    DropCallback m_on_drop = nullptr;

    void beginDragIfNeeded(MousePos current);
    [[nodiscard]] bool isClick(const MousePos &start, const MousePos &end,
                               int threshold = CLICK_THRESHOLD_PX) const;
  };

} // namespace gambit::controller
