#include "test_util.hpp"

#include <iostream>

#include "gambit/config/board_config.hpp"

using namespace gambit;
using test::sq;

int main()
{
  // Colour notations
  {
    auto red = config::parseColor("#ff0000");
    assert(red && *red == sf::Color(255, 0, 0, 255));
    auto half = config::parseColor("#00FF0080");
    assert(half && *half == sf::Color(0, 255, 0, 128));
    auto rgb = config::parseColor("rgb(1, 2, 3)");
    assert(rgb && *rgb == sf::Color(1, 2, 3, 255));
    auto rgba = config::parseColor(" rgba(131, 169, 120, 0.8) ");
    assert(rgba && *rgba == config::DEFAULT_ARROW_COLOR);

    assert(!config::parseColor(""));
    assert(!config::parseColor("blue"));
    assert(!config::parseColor("#ggg000"));
    assert(!config::parseColor("#fff"));
    assert(!config::parseColor("rgb(256, 0, 0)"));
    assert(!config::parseColor("rgb(1, 2)"));
    assert(!config::parseColor("rgba(1, 2, 3, 1.5)"));
    assert(!config::parseColor("rgba(1, 2, 3)"));
  }

  // Best move hints
  {
    auto hint = config::parseMoveHint("e2e4");
    assert(hint && hint->from == sq("e2") && hint->to == sq("e4"));
    assert(config::parseMoveHint("e7e8q"));
    assert(!config::parseMoveHint("e7e8x"));
    assert(!config::parseMoveHint("e2"));
    assert(!config::parseMoveHint("e2e2"));
    assert(!config::parseMoveHint("e2z9"));
  }

  // Defaults
  {
    const config::ValidatedConfig v = config::validate(config::BoardConfig{});
    assert(v.orientation == core::Orientation::White);
    assert(v.legalityMode == config::LegalityMode::Full);
    assert(!v.isRestricted());
    assert(v.allowsSelection(sq("a1")));
    assert(!v.blindfoldEnabled && v.hiddenSquares.empty());
    assert(v.showArrows && !v.readonly);
    assert(v.arrows.empty() && !v.bestMove && !v.expectedMove);
    assert(v.moveDebounce == std::chrono::milliseconds(150));
    assert(v.hintDuration == std::chrono::milliseconds(3000));
  }

  // Malformed entries are dropped or replaced, never fatal
  {
    config::BoardConfig cfg;
    cfg.restrictToSquares = {"e2", "zz", "d2"};
    cfg.circledSquares = {"c3", "c33"};
    cfg.blindfold = {true, {"e2", "all"}};
    cfg.arrows = {
        {"e2", "e4", "", 0.5f, ""},
        {"g1", "f3", "not-a-colour", 1.7f, "knight"},
        {"x1", "e4", "#ffffff", 0.8f, ""},
    };
    cfg.bestMove = "e2e9";
    cfg.expectedMove = "e2e2";
    cfg.squareHighlights = {{"d4", "#ff000080"}, {"d44", "#ff0000"}};
    cfg.moveDebounce = std::chrono::milliseconds(-5);

    const config::ValidatedConfig v = config::validate(cfg);
    assert(v.isRestricted());
    assert(v.allowsSelection(sq("e2")) && v.allowsSelection(sq("d2")));
    assert(!v.allowsSelection(sq("a1")));
    assert(v.isCircled(sq("c3")) && !v.isCircled(sq("c4")));
    assert(v.blindfoldEnabled && v.hiddenSquares.all);

    assert(v.arrows.size() == 2);
    assert(v.arrows[0].color == config::DEFAULT_ARROW_COLOR);
    assert(test::near(v.arrows[0].opacity, 0.5f));
    assert(v.arrows[0].piece == core::PieceType::None);
    assert(v.arrows[1].color == config::DEFAULT_ARROW_COLOR);
    assert(test::near(v.arrows[1].opacity, 1.f));
    assert(v.arrows[1].piece == core::PieceType::Knight);

    assert(!v.bestMove);
    assert(!v.expectedMove);
    assert(v.highlights.size() == 1);
    assert(v.highlights[0].square == sq("d4"));
    assert(v.highlights[0].color == sf::Color(255, 0, 0, 128));
    assert(v.moveDebounce == std::chrono::milliseconds(0));
  }

  // Hidden squares without the sentinel become a mask
  {
    config::BoardConfig cfg;
    cfg.blindfold = {true, {"e2", "d7"}};
    cfg.bestMove = "g1f3";
    cfg.expectedMove = "e7e8q";
    const config::ValidatedConfig v = config::validate(cfg);
    assert(!v.hiddenSquares.all);
    assert(v.hiddenSquares.contains(sq("e2")) && v.hiddenSquares.contains(sq("d7")));
    assert(!v.hiddenSquares.contains(sq("e7")));
    assert(v.bestMove && v.bestMove->from == sq("g1") && v.bestMove->to == sq("f3"));
    assert(v.expectedMove && v.expectedMove->from == sq("e7") && v.expectedMove->to == sq("e8"));
  }

  std::cout << "board_config_test passed\n";
  return 0;
}
