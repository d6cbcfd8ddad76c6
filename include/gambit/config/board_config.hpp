#pragma once

#include <SFML/Graphics/Color.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gambit/chess_types.hpp"
#include "gambit/constants.hpp"
#include "gambit/controller/visibility_policy.hpp"

namespace gambit::config
{

  enum class LegalityMode
  {
    Full,  // every move goes through the rule engine
    Bypass // geometry only, turn order is not enforced
  };

  struct ArrowConfig
  {
    std::string from;
    std::string to;
    std::string color;   // empty => default arrow colour
    float opacity{0.8f}; // clamped to [0, 1]
    std::string piece;   // "n"/"knight" bends the arrow, anything else draws it straight
  };

  struct BlindfoldConfig
  {
    bool enabled{false};
    std::vector<std::string> hiddenSquares; // {"all"} hides every piece
  };

  struct SquareHighlight
  {
    std::string square;
    std::string color;
  };

  // Options as handed in by the embedding application. Strings are not trusted until
  // validate() has run.
  struct BoardConfig
  {
    core::Orientation orientation{core::Orientation::White};
    LegalityMode legalityMode{LegalityMode::Full};
    std::vector<std::string> restrictToSquares; // empty => unrestricted
    BlindfoldConfig blindfold;
    bool readonly{false};
    bool showArrows{true};
    std::vector<ArrowConfig> arrows;
    std::string bestMove; // "e2e4", empty => none
    // Dropping a piece along this move skips the cached target list (puzzle lines where
    // the expected answer must always reach the strategy). Empty => none.
    std::string expectedMove;
    std::vector<std::string> circledSquares;
    std::vector<SquareHighlight> squareHighlights;
    std::chrono::milliseconds moveDebounce{core::MOVE_DEBOUNCE};
    std::chrono::milliseconds hintDuration{core::HINT_DURATION};
    std::string startFen{core::START_FEN};
  };

  struct ArrowSpec
  {
    core::Square from{core::NO_SQUARE};
    core::Square to{core::NO_SQUARE};
    sf::Color color;
    float opacity{0.8f};
    core::PieceType piece{core::PieceType::None};
  };

  struct ColoredSquare
  {
    core::Square square{core::NO_SQUARE};
    sf::Color color;
  };

  struct MoveHint
  {
    core::Square from{core::NO_SQUARE};
    core::Square to{core::NO_SQUARE};
  };

  struct ValidatedConfig
  {
    core::Orientation orientation{core::Orientation::White};
    LegalityMode legalityMode{LegalityMode::Full};
    std::uint64_t restrictMask{0};
    bool blindfoldEnabled{false};
    controller::HiddenSquareSet hiddenSquares;
    bool readonly{false};
    bool showArrows{true};
    std::vector<ArrowSpec> arrows;
    std::optional<MoveHint> bestMove;
    std::optional<MoveHint> expectedMove;
    std::uint64_t circledMask{0};
    std::vector<ColoredSquare> highlights;
    std::chrono::milliseconds moveDebounce{core::MOVE_DEBOUNCE};
    std::chrono::milliseconds hintDuration{core::HINT_DURATION};
    std::string startFen{core::START_FEN};

    [[nodiscard]] bool isRestricted() const { return restrictMask != 0; }
    // True when sq may be selected under the restriction list.
    [[nodiscard]] bool allowsSelection(core::Square sq) const
    {
      return !isRestricted() || (core::validSquare(sq) && ((restrictMask >> sq) & 1ULL));
    }
    [[nodiscard]] bool isCircled(core::Square sq) const
    {
      return core::validSquare(sq) && ((circledMask >> sq) & 1ULL);
    }
  };

  // rgba(131, 169, 120, 0.8)
  inline const sf::Color DEFAULT_ARROW_COLOR{131, 169, 120, 204};

  // Malformed entries are dropped (squares, arrows, best move) or replaced by defaults
  // (colours, opacity). Each drop is logged once.
  [[nodiscard]] ValidatedConfig validate(const BoardConfig &cfg);

  // "#rrggbb", "#rrggbbaa", "rgb(r, g, b)", "rgba(r, g, b, a)" with a in [0, 1].
  [[nodiscard]] std::optional<sf::Color> parseColor(std::string_view text);

  // "e2e4" (a trailing promotion letter is tolerated).
  [[nodiscard]] std::optional<MoveHint> parseMoveHint(std::string_view text);

} // namespace gambit::config
