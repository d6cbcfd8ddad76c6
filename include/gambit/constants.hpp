#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace gambit::core
{
  const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

  // ------------------ Interaction timing ------------------
  inline constexpr std::chrono::milliseconds MOVE_DEBOUNCE{150};
  inline constexpr std::chrono::milliseconds HINT_DURATION{3000};

  // ------------------ Version ------------------
  inline constexpr std::string_view GAMBIT_VERSION{"gambit 1.0v"};
}
