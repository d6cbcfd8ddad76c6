#include "gambit/app/app.hpp"

#include <SFML/Graphics/CircleShape.hpp>
#include <SFML/Graphics/ConvexShape.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Window/Event.hpp>
#include <SFML/Window/Mouse.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numbers>

#include "gambit/constants.hpp"
#include "gambit/view/coordinate_system.hpp"
#include "gambit/view/overlay_projection.hpp"

namespace gambit::app {

namespace {

constexpr float BOARD_PX = 640.f;
constexpr float MARGIN_PX = 40.f;
constexpr float SQUARE_PX = BOARD_PX / 8.f;
const sf::Vector2f BOARD_ORIGIN{MARGIN_PX, MARGIN_PX};

const sf::Color COL_LIGHT{240, 217, 181};
const sf::Color COL_DARK{181, 136, 99};
const sf::Color COL_SELECT{246, 246, 105, 170};
const sf::Color COL_LAST_MOVE{205, 210, 106, 120};
const sf::Color COL_HINT{90, 160, 255, 140};
const sf::Color COL_HOVER{255, 255, 255, 90};
const sf::Color COL_MARKER{20, 85, 30, 110};
const sf::Color COL_CIRCLE{220, 60, 60};
const sf::Color COL_TOKEN{128, 128, 128};
const sf::Color COL_PROMOTION{70, 20, 120, 140};

sf::Vector2f squareTopLeft(core::Square sq, core::Orientation o) {
  const view::GridIndex idx = view::CoordinateSystem::toPresentationIndex(sq, o);
  return {BOARD_ORIGIN.x + idx.col * SQUARE_PX, BOARD_ORIGIN.y + idx.row * SQUARE_PX};
}

void fillSquare(sf::RenderWindow& window, core::Square sq, core::Orientation o, sf::Color col) {
  if (!core::validSquare(sq)) return;
  sf::RectangleShape rect({SQUARE_PX, SQUARE_PX});
  rect.setPosition(squareTopLeft(sq, o));
  rect.setFillColor(col);
  window.draw(rect);
}

// Pieces are plain shapes: the point count tells the kind apart.
void drawPiece(sf::RenderWindow& window, core::Piece p, sf::Vector2f center) {
  if (p.isNone()) return;
  static constexpr std::size_t POINTS[6] = {30, 3, 4, 4, 8, 6};
  static constexpr float RADII[6] = {0.22f, 0.32f, 0.32f, 0.30f, 0.36f, 0.38f};

  const float r = SQUARE_PX * RADII[core::idx(p.type)];
  sf::CircleShape shape(r, POINTS[core::idx(p.type)]);
  shape.setOrigin(r, r);
  shape.setPosition(center);
  if (p.type == core::PieceType::Rook) shape.setRotation(45.f);
  const bool white = p.color == core::Color::White;
  shape.setFillColor(white ? sf::Color(250, 250, 250) : sf::Color(30, 30, 30));
  shape.setOutlineColor(white ? sf::Color(30, 30, 30) : sf::Color(250, 250, 250));
  shape.setOutlineThickness(2.f);
  window.draw(shape);
}

void drawArrow(sf::RenderWindow& window, const view::OverlayArrow& arrow) {
  const float thickness = SQUARE_PX * 0.2f;
  const float headLength = SQUARE_PX * 0.38f;
  const float headWidth = SQUARE_PX * 0.48f;

  sf::Color col = arrow.color;
  col.a = static_cast<sf::Uint8>(std::lround(col.a * arrow.opacity));

  const auto& pts = arrow.path.points;
  for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
    const sf::Vector2f s = pts[i] + BOARD_ORIGIN;
    const sf::Vector2f e = pts[i + 1] + BOARD_ORIGIN;
    const sf::Vector2f diff = e - s;
    const float len = std::sqrt(diff.x * diff.x + diff.y * diff.y);
    if (len <= 0.1f) continue;

    const bool last = i + 2 == pts.size();
    const float angle = std::atan2(diff.y, diff.x) * 180.f / std::numbers::pi_v<float>;
    sf::RectangleShape body({last ? std::max(0.f, len - headLength) : len, thickness});
    body.setFillColor(col);
    body.setOrigin(0.f, thickness / 2.f);
    body.setPosition(s);
    body.setRotation(angle);
    window.draw(body);
  }

  sf::ConvexShape head(3);
  head.setPoint(0, {0.f, 0.f});
  head.setPoint(1, {-headLength, headWidth / 2.f});
  head.setPoint(2, {-headLength, -headWidth / 2.f});
  head.setFillColor(col);
  head.setPosition(pts.back() + BOARD_ORIGIN);
  head.setRotation(arrow.path.headAngleDeg);
  window.draw(head);
}

}  // namespace

App::App(config::BoardConfig cfg)
    : m_cfg(std::move(cfg)), m_ctrl(m_cfg), m_board_input(m_ctrl, m_input) {
  m_board_input.bindInputCallbacks();
  m_board_input.setBoardRect(BOARD_ORIGIN, BOARD_PX);
  bindControllerCallbacks();
}

void App::bindControllerCallbacks() {
  m_ctrl.setOnMoveCommitted([](const controller::MoveRecord& mv, core::PieceType promotion) {
    std::cout << "[App] move " << core::squareToString(mv.from) << core::squareToString(mv.to);
    if (promotion != core::PieceType::None) std::cout << " =" << core::pieceTypeName(promotion);
    std::cout << "\n";
  });
  m_ctrl.setOnPromotionRequested([](core::Square, core::Square to) {
    std::cout << "[App] promotion on " << core::squareToString(to)
              << ": press Q, R, N or S (Esc cancels)\n";
  });
  m_ctrl.setOnReveal([this](core::Square sq) {
    // blindfold: tapping a square flashes it instead of selecting
    m_ctrl.highlightSquare(sq);
  });
  m_ctrl.setOnRestrictedAttempt([](core::Square sq, controller::RestrictionSource src) {
    std::cout << "[App] " << core::squareToString(sq) << " is not playable ("
              << (src == controller::RestrictionSource::Drag ? "drag" : "select") << ")\n";
  });
}

void App::handleKey(sf::Keyboard::Key key) {
  controller::BoardError err = controller::BoardError::None;
  switch (key) {
    case sf::Keyboard::F:
      m_cfg.orientation = m_cfg.orientation == core::Orientation::White ? core::Orientation::Black
                                                                        : core::Orientation::White;
      m_ctrl.reconfigure(m_cfg);
      break;
    case sf::Keyboard::B:
      m_cfg.legalityMode = m_cfg.legalityMode == config::LegalityMode::Full
                               ? config::LegalityMode::Bypass
                               : config::LegalityMode::Full;
      m_ctrl.reconfigure(m_cfg);
      break;
    case sf::Keyboard::H:
      m_cfg.blindfold.enabled = !m_cfg.blindfold.enabled;
      if (m_cfg.blindfold.hiddenSquares.empty()) m_cfg.blindfold.hiddenSquares = {"all"};
      m_ctrl.reconfigure(m_cfg);
      break;
    case sf::Keyboard::Q:
      err = m_ctrl.choosePromotion(core::PieceType::Queen);
      break;
    case sf::Keyboard::R:
      err = m_ctrl.choosePromotion(core::PieceType::Rook);
      break;
    case sf::Keyboard::N:
      err = m_ctrl.choosePromotion(core::PieceType::Knight);
      break;
    case sf::Keyboard::S:
      err = m_ctrl.choosePromotion(core::PieceType::Bishop);
      break;
    case sf::Keyboard::Escape:
      err = m_ctrl.cancelPromotion();
      break;
    default:
      break;
  }
  if (err != controller::BoardError::None)
    std::cout << "[App] key ignored: " << controller::toString(err) << "\n";
}

void App::render(sf::RenderWindow& window) const {
  const core::Orientation o = m_ctrl.orientation();
  const view::Overlay overlay = view::OverlayProjection::project(m_ctrl);
  const model::BoardSnapshot& snap = m_ctrl.snapshot();

  for (core::Square sq = 0; sq < core::NO_SQUARE; ++sq)
    fillSquare(window, sq, o, ((core::fileOf(sq) + core::rankOf(sq)) % 2) ? COL_LIGHT : COL_DARK);

  if (overlay.lastMove.valid()) {
    fillSquare(window, overlay.lastMove.from, o, COL_LAST_MOVE);
    fillSquare(window, overlay.lastMove.to, o, COL_LAST_MOVE);
  }
  for (const auto& h : overlay.highlights) fillSquare(window, h.square, o, h.color);
  fillSquare(window, overlay.selected, o, COL_SELECT);
  fillSquare(window, overlay.hint, o, COL_HINT);
  fillSquare(window, overlay.hovered, o, COL_HOVER);
  if (overlay.promotion) fillSquare(window, overlay.promotion->to, o, COL_PROMOTION);

  const bool dragging = m_ctrl.isDragging();
  for (core::Square sq = 0; sq < core::NO_SQUARE; ++sq) {
    if (dragging && sq == m_board_input.dragOrigin()) continue;
    const sf::Vector2f center = view::CoordinateSystem::squareCenter(sq, o, BOARD_PX) + BOARD_ORIGIN;
    if (std::find(overlay.masked.begin(), overlay.masked.end(), sq) != overlay.masked.end()) {
      sf::CircleShape token(SQUARE_PX * 0.3f);
      token.setOrigin(SQUARE_PX * 0.3f, SQUARE_PX * 0.3f);
      token.setPosition(center);
      token.setFillColor(COL_TOKEN);
      window.draw(token);
      continue;
    }
    drawPiece(window, snap.pieceAt(sq), center);
  }

  for (core::Square sq : overlay.circled) {
    const float r = SQUARE_PX * 0.45f;
    sf::CircleShape ring(r);
    ring.setOrigin(r, r);
    ring.setPosition(view::CoordinateSystem::squareCenter(sq, o, BOARD_PX) + BOARD_ORIGIN);
    ring.setFillColor(sf::Color::Transparent);
    ring.setOutlineColor(COL_CIRCLE);
    ring.setOutlineThickness(3.f);
    window.draw(ring);
  }

  for (const auto& m : overlay.legalMarkers) {
    const float r = SQUARE_PX * (m.capture ? 0.46f : 0.14f);
    sf::CircleShape dot(r);
    dot.setOrigin(r, r);
    dot.setPosition(view::CoordinateSystem::squareCenter(m.square, o, BOARD_PX) + BOARD_ORIGIN);
    if (m.capture) {
      dot.setFillColor(sf::Color::Transparent);
      dot.setOutlineColor(COL_MARKER);
      dot.setOutlineThickness(5.f);
    } else {
      dot.setFillColor(COL_MARKER);
    }
    window.draw(dot);
  }

  for (const auto& a : overlay.arrows) drawArrow(window, a);

  if (dragging) {
    const sf::Vector2i mouse = sf::Mouse::getPosition(window);
    drawPiece(window, snap.pieceAt(m_board_input.dragOrigin()),
              {static_cast<float>(mouse.x), static_cast<float>(mouse.y)});
  }
}

int App::run() {
  const auto side = static_cast<unsigned int>(BOARD_PX + MARGIN_PX * 2.f);
  sf::RenderWindow window(sf::VideoMode(side, side), std::string(core::GAMBIT_VERSION),
                          sf::Style::Titlebar | sf::Style::Close);
  window.setFramerateLimit(60);

  std::cout << "[App] F flip, B bypass, H blindfold, Q/R/N/S promote, Esc cancel\n";

  while (window.isOpen()) {
    sf::Event event;
    while (window.pollEvent(event)) {
      switch (event.type) {
        case sf::Event::Closed:
          window.close();
          break;
        case sf::Event::LostFocus:
          m_board_input.onLostFocus();
          break;
        case sf::Event::KeyPressed:
          handleKey(event.key.code);
          break;
        default:
          m_input.processEvent(event);
          break;
      }
    }
    m_ctrl.update();

    window.clear(sf::Color(48, 46, 43));
    render(window);
    window.display();
  }
  return 0;
}

}  // namespace gambit::app
