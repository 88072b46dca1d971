#include "sweeper/solver/local.h"

#include <random>

#include "gtest/gtest.h"
#include "sweeper/testing/layout.h"

namespace sweeper {
namespace solver {
namespace local {
namespace {

using testutil::BoardFromLayout;
using testutil::KnowledgeFromView;

TEST(LocalTest, FlagsTheOnlyCoveredNeighborOfAOne) {
  auto board = BoardFromLayout({"..*"});
  board->Reveal(0, 0);

  const Decision decision = Deduce(ExtractKnowledge(*board));
  EXPECT_EQ(Decision::Type::CERTAIN, decision.type);
  EXPECT_EQ(Decision::Source::SINGLE_POINT, decision.source);
  EXPECT_EQ((Action{Action::Type::FLAG, 0, 2}), decision.action);
}

TEST(LocalTest, RevealsAroundASatisfiedNumber) {
  auto board = BoardFromLayout({
      "*..",
      "...",
  });
  board->Reveal(1, 2);
  board->Flag(0, 0);
  ASSERT_FALSE(board->IsRevealed(1, 0));

  const Decision decision = Deduce(ExtractKnowledge(*board));
  EXPECT_EQ(Decision::Type::CERTAIN, decision.type);
  EXPECT_EQ((Action{Action::Type::REVEAL, 1, 0}), decision.action);
  EXPECT_EQ(0.0, decision.mine_probability);
}

TEST(LocalTest, ChecksEveryNumberForMinesBeforeSafeCells) {
  // (0, 0) proves (1, 0) safe, but (0, 3) proves (0, 2) is a mine.
  const Decision decision = Deduce(KnowledgeFromView({
      "1F-1",
      "--21",
  }));
  EXPECT_EQ(Decision::Type::CERTAIN, decision.type);
  EXPECT_EQ((Action{Action::Type::FLAG, 0, 2}), decision.action);
}

TEST(LocalTest, ProducesNothingWhenNoRuleApplies) {
  const Decision decision = Deduce(KnowledgeFromView({
      "---",
      "121",
  }));
  EXPECT_FALSE(decision.HasAction());
}

TEST(LocalTest, IgnoresOverFlaggedNumbers) {
  const Decision decision = Deduce(KnowledgeFromView({
      "F1-",
      "F--",
  }));
  EXPECT_FALSE(decision.HasAction());
}

TEST(LocalTest, GuessesOnlyCoveredCells) {
  std::default_random_engine rng(7);
  const std::vector<CellLocation> covered = {{0, 1}, {2, 3}, {4, 4}};
  for (int i = 0; i < 50; ++i) {
    const Decision decision = GuessUniformly(covered, rng);
    ASSERT_EQ(Decision::Type::GUESS, decision.type);
    EXPECT_EQ(Decision::Source::RANDOM, decision.source);
    EXPECT_EQ(Action::Type::REVEAL, decision.action.type);
    const CellLocation target{decision.action.row, decision.action.col};
    EXPECT_TRUE(target == covered[0] || target == covered[1] ||
                target == covered[2]);
  }

  EXPECT_FALSE(GuessUniformly({}, rng).HasAction());
}

TEST(LocalTest, SolverGuessesWhenStuck) {
  auto board = BoardFromLayout({
      "*.",
      "..",
  });
  auto solver = New(3);
  const Decision decision = solver->Decide(*board);
  EXPECT_EQ(Decision::Type::GUESS, decision.type);
  EXPECT_EQ(Decision::Source::RANDOM, decision.source);
  EXPECT_EQ(kUnknownProbability, decision.mine_probability);
}

TEST(LocalTest, SolverHasNoActionWithoutCoveredCells) {
  auto board = BoardFromLayout({
      "*.",
      "..",
  });
  board->Flag(0, 0);
  board->Reveal(0, 1);
  board->Reveal(1, 0);
  board->Reveal(1, 1);
  ASSERT_TRUE(board->HasWon());
  EXPECT_FALSE(New(3)->Decide(*board).HasAction());

  const Decision decision = Deduce(KnowledgeFromView({
      "F1",
      "11",
  }));
  EXPECT_FALSE(decision.HasAction());
}

// Every certain action must agree with the hidden layout.
TEST(LocalTest, CertainActionsAreSound) {
  for (unsigned seed = 0; seed < 60; ++seed) {
    auto board = NewBoard(9, 9, 12, seed);
    auto solver = New(seed);
    board->Reveal(4, 4);
    while (!board->IsGameOver()) {
      const Decision decision = solver->Decide(*board);
      ASSERT_TRUE(decision.HasAction());
      const Action& action = decision.action;
      if (decision.type == Decision::Type::CERTAIN) {
        EXPECT_EQ(action.type == Action::Type::FLAG,
                  board->IsMine(action.row, action.col))
            << "seed " << seed << " at (" << action.row << ", " << action.col
            << ")";
      }
      board->Execute(action);
    }
  }
}

}  // namespace
}  // namespace local
}  // namespace solver
}  // namespace sweeper
