#pragma once

#include <SFML/System/Vector2.hpp>

#include "gambit/chess_types.hpp"
#include "../input_manager.hpp"

namespace gambit::controller
{

  class BoardController;

  // Binds an InputManager to a BoardController for a board drawn at a given screen rect.
  class BoardInputSystem
  {
  public:
    BoardInputSystem(BoardController &ctrl, InputManager &input);

    void bindInputCallbacks();

    // Top-left corner and edge length of the board in window pixels.
    void setBoardRect(sf::Vector2f origin, float sizePx);

    void onLostFocus();

    [[nodiscard]] core::Square squareAt(MousePos pos) const;
    [[nodiscard]] core::Square dragOrigin() const { return m_drag_from; }

  private:
    void onClick(MousePos pos);
    void onDragBegin(MousePos start);
    void onDrag(MousePos start, MousePos current);
    void onDrop(MousePos start, MousePos end);

    [[nodiscard]] static sf::Vector2f displacement(MousePos start, MousePos end);

    BoardController &m_ctrl;
    InputManager &m_input;

    sf::Vector2f m_origin{0.f, 0.f};
    float m_size_px{0.f};
    core::Square m_drag_from{core::NO_SQUARE};
  };

} // namespace gambit::controller
