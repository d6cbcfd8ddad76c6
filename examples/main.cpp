#include "gambit/app/app.hpp"

int main()
{
  gambit::config::BoardConfig cfg;
  cfg.bestMove = "g1f3";
  cfg.circledSquares = {"e2", "d2"};
  cfg.arrows.push_back({"c2", "c4", "#3b82f6", 0.7f, ""});

  gambit::app::App app(cfg);
  return app.run();
}
