#include "sweeper/solver/knowledge.h"

#include <vector>

#include "gtest/gtest.h"
#include "sweeper/testing/layout.h"

namespace sweeper {
namespace solver {
namespace {

using testutil::BoardFromLayout;
using testutil::KnowledgeFromView;

TEST(KnowledgeTest, PartitionsEveryCell) {
  auto board = BoardFromLayout({
      "*..",
      "...",
      "..*",
  });
  board->Reveal(0, 2);
  board->Flag(0, 0);

  const Knowledge knowledge = ExtractKnowledge(*board);
  EXPECT_EQ(3u, knowledge.rows);
  EXPECT_EQ(3u, knowledge.cols);
  EXPECT_EQ(9u, knowledge.numbers.size() + knowledge.covered.size() +
                    knowledge.flagged.size());

  const std::vector<CellLocation> flagged = {{0, 0}};
  EXPECT_EQ(flagged, knowledge.flagged);
  EXPECT_EQ(board->GetCoveredCells(), knowledge.covered);

  // (0, 2) is a zero, so its neighbors were revealed with it.
  ASSERT_EQ(4u, knowledge.numbers.size());
  EXPECT_EQ((CellLocation{0, 1}), knowledge.numbers[0].location);
  EXPECT_EQ(1u, knowledge.numbers[0].adjacent_mines);
  EXPECT_EQ((CellLocation{0, 2}), knowledge.numbers[1].location);
  EXPECT_EQ(0u, knowledge.numbers[1].adjacent_mines);
  EXPECT_EQ((CellLocation{1, 1}), knowledge.numbers[2].location);
  EXPECT_EQ(2u, knowledge.numbers[2].adjacent_mines);
  EXPECT_EQ((CellLocation{1, 2}), knowledge.numbers[3].location);
  EXPECT_EQ(1u, knowledge.numbers[3].adjacent_mines);

  EXPECT_EQ(CellState::FLAGGED, knowledge.states(0, 0));
  EXPECT_EQ(CellState::REVEALED, knowledge.states(1, 1));
  EXPECT_EQ(CellState::COVERED, knowledge.states(2, 2));
}

TEST(KnowledgeTest, ReflectsLaterMutations) {
  auto board = BoardFromLayout({".*."});
  const Knowledge before = ExtractKnowledge(*board);
  EXPECT_EQ(3u, before.covered.size());

  board->Reveal(0, 0);
  const Knowledge after = ExtractKnowledge(*board);
  EXPECT_EQ(2u, after.covered.size());
  EXPECT_EQ(1u, after.numbers.size());
  EXPECT_EQ(3u, before.covered.size());
}

TEST(KnowledgeTest, RevealedMineIsNotANumber) {
  auto board = BoardFromLayout({
      "*.",
      "..",
  });
  board->Reveal(1, 1);
  board->Reveal(0, 0);
  ASSERT_EQ(Board::State::LOSS, board->GetState());

  const Knowledge knowledge = ExtractKnowledge(*board);
  EXPECT_EQ(CellState::REVEALED, knowledge.states(0, 0));
  ASSERT_EQ(1u, knowledge.numbers.size());
  EXPECT_EQ((CellLocation{1, 1}), knowledge.numbers[0].location);
  EXPECT_EQ(1u, knowledge.numbers[0].adjacent_mines);
  EXPECT_EQ(2u, knowledge.covered.size());
}

TEST(KnowledgeTest, NeighborhoodSplitsCoveredAndFlagged) {
  const Knowledge knowledge = KnowledgeFromView({
      "F-1",
      "-3F",
      "12-",
  });
  const Neighborhood neighborhood = GetNeighborhood(knowledge, {1, 1});
  const std::vector<CellLocation> covered = {{0, 1}, {1, 0}, {2, 2}};
  EXPECT_EQ(covered, neighborhood.covered);
  EXPECT_EQ(2u, neighborhood.flagged);

  std::size_t remaining = 0;
  EXPECT_TRUE(GetRemainingMines(knowledge.numbers[1], neighborhood,
                                &remaining));
  EXPECT_EQ(1u, remaining);
}

TEST(KnowledgeTest, RemainingMinesRejectsTooManyFlags) {
  const Knowledge knowledge = KnowledgeFromView({
      "F1",
      "F-",
  });
  const Neighborhood neighborhood = GetNeighborhood(knowledge, {0, 1});
  std::size_t remaining = 0;
  EXPECT_FALSE(
      GetRemainingMines(knowledge.numbers[0], neighborhood, &remaining));
}

}  // namespace
}  // namespace solver
}  // namespace sweeper
