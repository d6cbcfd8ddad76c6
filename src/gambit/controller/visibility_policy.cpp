#include "gambit/controller/visibility_policy.hpp"

#include "gambit/model/board_snapshot.hpp"

namespace gambit::controller {

VisibilityPolicy::VisibilityPolicy(bool enabled, HiddenSquareSet hidden)
    : m_enabled(enabled), m_hidden(hidden) {}

bool VisibilityPolicy::isMasked(core::Square sq, bool hasPiece, bool enabled,
                                const HiddenSquareSet& hidden) {
  return enabled && hasPiece && hidden.contains(sq);
}

void VisibilityPolicy::configure(bool enabled, HiddenSquareSet hidden) {
  m_enabled = enabled;
  m_hidden = hidden;
}

bool VisibilityPolicy::isMasked(core::Square sq, const model::BoardSnapshot& snap) const {
  return isMasked(sq, snap.hasPiece(sq), m_enabled, m_hidden);
}

std::vector<core::Square> VisibilityPolicy::maskedSquares(const model::BoardSnapshot& snap) const {
  std::vector<core::Square> out;
  if (!m_enabled) return out;
  for (core::Square sq = 0; sq < core::NO_SQUARE; ++sq)
    if (isMasked(sq, snap)) out.push_back(sq);
  return out;
}

}  // namespace gambit::controller
