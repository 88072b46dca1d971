#include "sweeper/play.h"

#include "gtest/gtest.h"
#include "sweeper/testing/layout.h"

namespace sweeper {
namespace {

using testutil::BoardFromLayout;

TEST(PlayTest, FirstMoveCanWinOutright) {
  auto board = BoardFromLayout({"..*"});
  auto solver = solver::New(solver::Algorithm::CSP, solver::Options(), 1);
  const GameOutcome outcome = PlayGame(*board, *solver, PlayOptions());
  EXPECT_TRUE(outcome.won);
  EXPECT_EQ(1u, outcome.moves);
  EXPECT_EQ(0u, outcome.logic_moves);
  EXPECT_EQ(0u, outcome.guess_moves);
  EXPECT_EQ(0u, outcome.flags_set);
}

TEST(PlayTest, FirstMoveCanLose) {
  auto board = BoardFromLayout({
      "*.",
      "..",
  });
  auto solver = solver::New(solver::Algorithm::CSP, solver::Options(), 1);
  const GameOutcome outcome = PlayGame(*board, *solver, PlayOptions());
  EXPECT_FALSE(outcome.won);
  EXPECT_EQ(1u, outcome.moves);
  EXPECT_EQ(Board::State::LOSS, board->GetState());
}

TEST(PlayTest, CountsLogicalMoves) {
  auto board = BoardFromLayout({
      "*.*",
      "...",
      "...",
  });
  board->Reveal(2, 0);
  auto solver = solver::New(solver::Algorithm::CSP, solver::Options(), 1);

  // Cells are already revealed, so no first move is made.
  const GameOutcome outcome = PlayGame(*board, *solver, PlayOptions());
  EXPECT_TRUE(outcome.won);
  EXPECT_EQ(2u, outcome.moves);
  EXPECT_EQ(2u, outcome.logic_moves);
  EXPECT_EQ(0u, outcome.guess_moves);
  EXPECT_EQ(1u, outcome.flags_set);
}

TEST(PlayTest, LetsTheSolverOpenWhenAsked) {
  auto board = BoardFromLayout({".*"});
  auto solver = solver::New(solver::Algorithm::LOCAL, solver::Options(), 1);
  PlayOptions options;
  options.first_move = false;
  const GameOutcome outcome = PlayGame(*board, *solver, options);
  EXPECT_EQ(1u, outcome.moves);
  EXPECT_EQ(1u, outcome.guess_moves);
  EXPECT_EQ(outcome.won, board->HasWon());
  EXPECT_TRUE(board->IsGameOver());
}

TEST(PlayTest, MovesAddUp) {
  for (unsigned seed = 0; seed < 20; ++seed) {
    auto board = NewBoard(8, 8, 10, seed);
    auto solver = solver::New(solver::Algorithm::CSP, solver::Options(), seed);
    const GameOutcome outcome = PlayGame(*board, *solver, PlayOptions());
    EXPECT_TRUE(board->IsGameOver());
    EXPECT_EQ(board->HasWon(), outcome.won);
    EXPECT_EQ(outcome.moves, outcome.logic_moves + outcome.guess_moves + 1);
    EXPECT_LE(outcome.flags_set, outcome.logic_moves);
    EXPECT_LE(outcome.flags_set, board->GetMines());
  }
}

}  // namespace
}  // namespace sweeper
