#pragma once

#include <cstdint>
#include <vector>

#include "gambit/chess_types.hpp"

namespace gambit::model
{
  class BoardSnapshot;
}

namespace gambit::controller
{

  // Either every square or an explicit 64-bit square mask (bit n = square n).
  struct HiddenSquareSet
  {
    bool all{false};
    std::uint64_t mask{0};

    [[nodiscard]] bool contains(core::Square sq) const
    {
      if (!core::validSquare(sq)) return false;
      return all || ((mask >> sq) & 1ULL);
    }
    [[nodiscard]] bool empty() const { return !all && mask == 0; }
  };

  // Blindfold mode. A masked square renders as an anonymous token; while blindfold is on,
  // activations and drag starts go to the reveal callback instead of selection logic.
  class VisibilityPolicy
  {
  public:
    VisibilityPolicy() = default;
    VisibilityPolicy(bool enabled, HiddenSquareSet hidden);

    // Empty squares are never masked.
    [[nodiscard]] static bool isMasked(core::Square sq, bool hasPiece, bool enabled,
                                       const HiddenSquareSet &hidden);

    void configure(bool enabled, HiddenSquareSet hidden);

    [[nodiscard]] bool active() const { return m_enabled; }
    [[nodiscard]] bool redirectsActivation() const { return m_enabled; }
    [[nodiscard]] const HiddenSquareSet &hiddenSquares() const { return m_hidden; }

    [[nodiscard]] bool isMasked(core::Square sq, const model::BoardSnapshot &snap) const;
    [[nodiscard]] std::vector<core::Square> maskedSquares(const model::BoardSnapshot &snap) const;

  private:
    bool m_enabled{false};
    HiddenSquareSet m_hidden;
  };

} // namespace gambit::controller
