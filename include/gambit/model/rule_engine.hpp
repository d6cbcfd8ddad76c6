#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../chess_types.hpp"

namespace gambit::model
{

  // Raised by adapters when an engine misbehaves (refuses a position, returns off-board
  // squares or an unparsable FEN).
  class RuleEngineError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Minimal rule engine contract. The engine keeps its own current position; callers load
  // a FEN, query it, and apply moves against it.
  struct IRuleEngine
  {
    virtual ~IRuleEngine() = default;

    virtual bool loadFen(const std::string &fen) = 0;
    [[nodiscard]] virtual std::string fen() const = 0;
    [[nodiscard]] virtual core::Color activeSide() const = 0;

    virtual std::vector<core::Square> legalTargets(core::Square from) = 0;

    // New FEN after the move, nullopt when rejected. A promotion move needs its piece kind.
    virtual std::optional<std::string> applyMove(core::Square from, core::Square to,
                                                 core::PieceType promotion) = 0;
  };

} // namespace gambit::model
