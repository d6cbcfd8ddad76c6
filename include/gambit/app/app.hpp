#pragma once

#include <SFML/Window/Keyboard.hpp>

#include "gambit/config/board_config.hpp"
#include "gambit/controller/board_controller.hpp"
#include "gambit/controller/input_manager.hpp"
#include "gambit/controller/subsystems/board_input_system.hpp"

namespace sf
{
  class RenderWindow;
}

namespace gambit::app
{

  class App
  {
  public:
    explicit App(config::BoardConfig cfg = {});
    int run();

  private:
    void bindControllerCallbacks();
    void handleKey(sf::Keyboard::Key key);
    void render(sf::RenderWindow &window) const;

    config::BoardConfig m_cfg;
    controller::BoardController m_ctrl;
    controller::InputManager m_input;
    controller::BoardInputSystem m_board_input;
  };

} // namespace gambit::app
