#include "gambit/config/board_config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace gambit::config {

namespace {

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) sv.remove_suffix(1);
  return sv;
}

int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<std::uint8_t> hexByte(std::string_view sv) {
  const int hi = hexDigit(sv[0]);
  const int lo = hexDigit(sv[1]);
  if (hi < 0 || lo < 0) return std::nullopt;
  return static_cast<std::uint8_t>(hi * 16 + lo);
}

std::optional<int> parseChannel(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty() || sv.size() > 3) return std::nullopt;
  int v = 0;
  for (char c : sv) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + (c - '0');
  }
  if (v > 255) return std::nullopt;
  return v;
}

std::optional<float> parseUnit(std::string_view sv) {
  const std::string text(trim(sv));
  if (text.empty()) return std::nullopt;
  char* end = nullptr;
  const float v = std::strtof(text.c_str(), &end);
  if (end != text.c_str() + text.size() || !std::isfinite(v)) return std::nullopt;
  if (v < 0.f || v > 1.f) return std::nullopt;
  return v;
}

std::vector<std::string_view> splitArgs(std::string_view sv) {
  std::vector<std::string_view> out;
  while (true) {
    const size_t comma = sv.find(',');
    out.push_back(sv.substr(0, comma));
    if (comma == std::string_view::npos) break;
    sv.remove_prefix(comma + 1);
  }
  return out;
}

void warn(std::string_view what, std::string_view value) {
  std::cerr << "[BoardConfig] warning: dropping " << what << " '" << value << "'\n";
}

std::uint64_t squareMask(const std::vector<std::string>& squares, std::string_view what) {
  std::uint64_t mask = 0;
  for (const auto& s : squares) {
    const core::Square sq = core::squareFromString(s);
    if (!core::validSquare(sq)) {
      warn(what, s);
      continue;
    }
    mask |= 1ULL << sq;
  }
  return mask;
}

sf::Color colorOrDefault(std::string_view text, sf::Color fallback) {
  if (text.empty()) return fallback;
  if (auto c = parseColor(text)) return *c;
  warn("colour", text);
  return fallback;
}

}  // namespace

std::optional<sf::Color> parseColor(std::string_view text) {
  text = trim(text);
  if (text.empty()) return std::nullopt;

  if (text.front() == '#') {
    text.remove_prefix(1);
    if (text.size() != 6 && text.size() != 8) return std::nullopt;
    sf::Color c;
    std::uint8_t* channels[4] = {&c.r, &c.g, &c.b, &c.a};
    for (size_t i = 0; i * 2 < text.size(); ++i) {
      const auto byte = hexByte(text.substr(i * 2, 2));
      if (!byte) return std::nullopt;
      *channels[i] = *byte;
    }
    if (text.size() == 6) c.a = 255;
    return c;
  }

  const bool hasAlpha = text.rfind("rgba(", 0) == 0;
  if (!hasAlpha && text.rfind("rgb(", 0) != 0) return std::nullopt;
  if (text.back() != ')') return std::nullopt;
  text.remove_prefix(hasAlpha ? 5 : 4);
  text.remove_suffix(1);

  const auto args = splitArgs(text);
  if (args.size() != (hasAlpha ? 4u : 3u)) return std::nullopt;

  const auto r = parseChannel(args[0]);
  const auto g = parseChannel(args[1]);
  const auto b = parseChannel(args[2]);
  if (!r || !g || !b) return std::nullopt;

  std::uint8_t a = 255;
  if (hasAlpha) {
    const auto unit = parseUnit(args[3]);
    if (!unit) return std::nullopt;
    a = static_cast<std::uint8_t>(std::lround(*unit * 255.f));
  }
  return sf::Color(static_cast<std::uint8_t>(*r), static_cast<std::uint8_t>(*g),
                   static_cast<std::uint8_t>(*b), a);
}

std::optional<MoveHint> parseMoveHint(std::string_view text) {
  text = trim(text);
  if (text.size() != 4 && text.size() != 5) return std::nullopt;
  if (text.size() == 5 && !core::pieceTypeFromString(text.substr(4, 1))) return std::nullopt;

  MoveHint hint{core::squareFromString(text.substr(0, 2)),
                core::squareFromString(text.substr(2, 2))};
  if (!core::validSquare(hint.from) || !core::validSquare(hint.to) || hint.from == hint.to)
    return std::nullopt;
  return hint;
}

ValidatedConfig validate(const BoardConfig& cfg) {
  ValidatedConfig out;
  out.orientation = cfg.orientation;
  out.legalityMode = cfg.legalityMode;
  out.readonly = cfg.readonly;
  out.showArrows = cfg.showArrows;
  out.startFen = cfg.startFen;
  out.moveDebounce = std::max(cfg.moveDebounce, std::chrono::milliseconds{0});
  out.hintDuration = std::max(cfg.hintDuration, std::chrono::milliseconds{0});

  out.restrictMask = squareMask(cfg.restrictToSquares, "restricted square");
  out.circledMask = squareMask(cfg.circledSquares, "circled square");

  out.blindfoldEnabled = cfg.blindfold.enabled;
  const auto& hidden = cfg.blindfold.hiddenSquares;
  if (std::find(hidden.begin(), hidden.end(), "all") != hidden.end())
    out.hiddenSquares.all = true;
  else
    out.hiddenSquares.mask = squareMask(hidden, "hidden square");

  for (const auto& a : cfg.arrows) {
    ArrowSpec spec;
    spec.from = core::squareFromString(a.from);
    spec.to = core::squareFromString(a.to);
    if (!core::validSquare(spec.from) || !core::validSquare(spec.to)) {
      warn("arrow", a.from + a.to);
      continue;
    }
    spec.color = colorOrDefault(a.color, DEFAULT_ARROW_COLOR);
    spec.opacity = std::isfinite(a.opacity) ? std::clamp(a.opacity, 0.f, 1.f) : 0.8f;
    spec.piece = core::pieceTypeFromString(a.piece).value_or(core::PieceType::None);
    out.arrows.push_back(spec);
  }

  if (!cfg.bestMove.empty()) {
    out.bestMove = parseMoveHint(cfg.bestMove);
    if (!out.bestMove) warn("best move", cfg.bestMove);
  }

  if (!cfg.expectedMove.empty()) {
    out.expectedMove = parseMoveHint(cfg.expectedMove);
    if (!out.expectedMove) warn("expected move", cfg.expectedMove);
  }

  for (const auto& h : cfg.squareHighlights) {
    const core::Square sq = core::squareFromString(h.square);
    if (!core::validSquare(sq)) {
      warn("highlight", h.square);
      continue;
    }
    out.highlights.push_back({sq, colorOrDefault(h.color, DEFAULT_ARROW_COLOR)});
  }

  return out;
}

}  // namespace gambit::config
