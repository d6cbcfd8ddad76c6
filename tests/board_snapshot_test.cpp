#include "test_util.hpp"

#include <iostream>
#include <string>

#include "gambit/constants.hpp"
#include "gambit/model/board_snapshot.hpp"

using namespace gambit;
using test::sq;

int main()
{
  // Square and piece notation
  {
    assert(core::squareFromString("a1") == 0);
    assert(core::squareFromString("h8") == 63);
    assert(core::squareFromString("e4") == 28);
    assert(core::squareFromString("e44") == core::NO_SQUARE);
    assert(core::squareFromString("i1") == core::NO_SQUARE);
    assert(core::squareFromString("a0") == core::NO_SQUARE);
    assert(core::squareFromString("") == core::NO_SQUARE);
    assert(core::squareToString(28) == "e4");
    assert(core::squareToString(core::NO_SQUARE) == "-");

    assert(core::pieceTypeFromString("Queen") == core::PieceType::Queen);
    assert(core::pieceTypeFromString("n") == core::PieceType::Knight);
    assert(!core::pieceTypeFromString("x"));
    assert(!core::pieceTypeFromString(""));
    assert(core::pieceToChar({core::PieceType::Knight, core::Color::White}) == 'N');
    assert((core::pieceFromChar('q') == core::Piece{core::PieceType::Queen, core::Color::Black}));
    assert(core::pieceFromChar('x').isNone());
  }

  // Start position round-trips through FEN
  {
    auto snap = model::BoardSnapshot::fromFen(core::START_FEN);
    assert(snap);
    assert(snap->toFen() == core::START_FEN);
    assert(snap->sideToMove() == core::Color::White);
    assert(snap->castlingRights() == (model::Castling::WK | model::Castling::WQ |
                                      model::Castling::BK | model::Castling::BQ));
    assert(snap->enPassantSquare() == core::NO_SQUARE);
    assert(snap->findKing(core::Color::White) == sq("e1"));
    assert(snap->findKing(core::Color::Black) == sq("e8"));
    assert(snap->pieceAt(sq("d8")).type == core::PieceType::Queen);
    assert(!snap->hasPiece(sq("e4")));
    assert(snap->pieceAt(core::NO_SQUARE).isNone());
  }

  // Optional fields
  {
    auto snap = model::BoardSnapshot::fromFen("4k3/8/8/3pP3/8/8/8/4K3 w - d6 3 17");
    assert(snap);
    assert(snap->enPassantSquare() == sq("d6"));
    assert(snap->halfmoveClock() == 3);
    assert(snap->fullmoveNumber() == 17);
    assert(snap->castlingRights() == 0);

    auto bare = model::BoardSnapshot::fromFen("4k3/8/8/8/8/8/8/4K3");
    assert(bare);
    assert(bare->sideToMove() == core::Color::White);
    assert(bare->toFen() == "4k3/8/8/8/8/8/8/4K3 w - - 0 1");
  }

  // Malformed positions are refused
  {
    assert(!model::BoardSnapshot::fromFen(""));
    assert(!model::BoardSnapshot::fromFen("8/8/8/8/8/8/8 w - - 0 1"));
    assert(!model::BoardSnapshot::fromFen("9/8/8/8/8/8/8/8 w - - 0 1"));
    assert(!model::BoardSnapshot::fromFen("7/8/8/8/8/8/8/8 w - - 0 1"));
    assert(!model::BoardSnapshot::fromFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNX w - - 0 1"));
    assert(!model::BoardSnapshot::fromFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1"));
    assert(!model::BoardSnapshot::fromFen("8/8/8/8/8/8/8/8/8 w - - 0 1"));
  }

  // Oversized move counters fall back to their defaults
  {
    auto snap = model::BoardSnapshot::fromFen("4k3/8/8/8/8/8/8/4K3 w - - 99999999999 1");
    assert(snap);
    assert(snap->halfmoveClock() == 0);
    assert(snap->fullmoveNumber() == 1);

    snap = model::BoardSnapshot::fromFen("4k3/8/8/8/8/8/8/4K3 b - - 12 999999999999999999999");
    assert(snap);
    assert(snap->halfmoveClock() == 12);
    assert(snap->fullmoveNumber() == 1);

    snap = model::BoardSnapshot::fromFen("4k3/8/8/8/8/8/8/4K3 w - - 1000000 1000000");
    assert(snap && snap->halfmoveClock() == 1000000 && snap->fullmoveNumber() == 1000000);
  }

  // Unchecked relocation keeps the side to move
  {
    auto snap = model::BoardSnapshot::fromFen("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 1");
    assert(snap);
    const model::BoardSnapshot next = snap->withPieceMoved(sq("e5"), sq("e8"), core::PieceType::Queen);
    assert(next.sideToMove() == core::Color::White);
    assert(!next.hasPiece(sq("e5")));
    assert((next.pieceAt(sq("e8")) == core::Piece{core::PieceType::Queen, core::Color::White}));
    assert(next.enPassantSquare() == core::NO_SQUARE);
    assert(next.findKing(core::Color::Black) == core::NO_SQUARE);
    assert(!(next == *snap));

    // moving from an empty square changes nothing
    assert(snap->withPieceMoved(sq("a1"), sq("a2"), core::PieceType::None) == *snap);
  }

  std::cout << "board_snapshot_test passed\n";
  return 0;
}
