// Main program that plays a single game with a solver and reports how the
// solver got on.
//
// Debug logging from the solver is enabled with G_MESSAGES_DEBUG=sweeper.

#include <cstddef>
#include <iostream>
#include <memory>

#include <glibmm/error.h>
#include <glibmm/init.h>
#include <glibmm/optioncontext.h>
#include <glibmm/optionentry.h>
#include <glibmm/optiongroup.h>
#include <glibmm/ustring.h>

#include "sweeper/game/board.h"
#include "sweeper/play.h"
#include "sweeper/solver/solver.h"

namespace {

// Command line settings, initialized to their defaults.
struct Settings {
  int rows = 8;
  int cols = 8;
  int mines = 10;
  int seed = -1;
  int max_component_size = 14;
  Glib::ustring solver = "csp";
  bool no_first_move = false;
};

Glib::OptionEntry MakeEntry(const char* long_name, char short_name,
                            const char* description) {
  Glib::OptionEntry entry;
  entry.set_long_name(long_name);
  entry.set_short_name(short_name);
  entry.set_description(description);
  return entry;
}

// Parses the command line into settings.
//
// Throws Glib::OptionError if the command line is malformed.
void ParseCommandLine(int& argc, char**& argv, Settings& settings) {
  Glib::OptionGroup group("game", "Game options", "Show game options");
  Glib::OptionEntry rows = MakeEntry("rows", 'r', "Number of rows (8)");
  Glib::OptionEntry cols = MakeEntry("cols", 'c', "Number of columns (8)");
  Glib::OptionEntry mines = MakeEntry("mines", 'm', "Number of mines (10)");
  Glib::OptionEntry seed =
      MakeEntry("seed", 's', "Seed for the board and the solver (random)");
  Glib::OptionEntry solver =
      MakeEntry("solver", 'a', "Solving algorithm: local or csp (csp)");
  Glib::OptionEntry max_component_size = MakeEntry(
      "max-component-size", 'k', "Largest region to enumerate exactly (14)");
  Glib::OptionEntry no_first_move = MakeEntry(
      "no-first-move", 'n', "Let the solver choose the opening move");
  group.add_entry(rows, settings.rows);
  group.add_entry(cols, settings.cols);
  group.add_entry(mines, settings.mines);
  group.add_entry(seed, settings.seed);
  group.add_entry(solver, settings.solver);
  group.add_entry(max_component_size, settings.max_component_size);
  group.add_entry(no_first_move, settings.no_first_move);

  Glib::OptionContext context("- play one game of Minesweeper automatically");
  context.set_main_group(group);
  context.parse(argc, argv);
}

bool ToAlgorithm(const Glib::ustring& name, sweeper::solver::Algorithm* alg) {
  if (name == "local") {
    *alg = sweeper::solver::Algorithm::LOCAL;
    return true;
  }
  if (name == "csp") {
    *alg = sweeper::solver::Algorithm::CSP;
    return true;
  }
  return false;
}

}  // namespace

int main(int argc, char* argv[]) {
  Glib::init();

  Settings settings;
  try {
    ParseCommandLine(argc, argv, settings);
  } catch (const Glib::Error& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  sweeper::solver::Algorithm alg;
  if (!ToAlgorithm(settings.solver, &alg)) {
    std::cerr << "Unknown solver: " << settings.solver << '\n';
    return 1;
  }
  if (settings.rows <= 0 || settings.cols <= 0 || settings.mines <= 0 ||
      settings.max_component_size <= 0) {
    std::cerr << "Sizes must be positive.\n";
    return 1;
  }

  // The printed seed must be accepted by --seed to replay the game.
  if (settings.seed < 0) {
    settings.seed = sweeper::NewRandomSeed();
  }
  const unsigned seed = static_cast<unsigned>(settings.seed);

  auto board = sweeper::NewBoard(settings.rows, settings.cols, settings.mines,
                                 seed);
  if (!board) {
    std::cerr << "Invalid board: " << settings.mines << " mines on a "
              << settings.rows << "x" << settings.cols << " board.\n";
    return 1;
  }

  sweeper::solver::Options options;
  options.max_component_size =
      static_cast<std::size_t>(settings.max_component_size);
  auto solver = sweeper::solver::New(alg, options, seed);

  sweeper::PlayOptions play_options;
  play_options.first_move = !settings.no_first_move;
  const sweeper::GameOutcome outcome =
      sweeper::PlayGame(*board, *solver, play_options);

  std::cout << "Solver: " << settings.solver << '\n'
            << "Board: " << settings.rows << "x" << settings.cols
            << ", mines=" << settings.mines << ", seed=" << seed << '\n'
            << (outcome.won ? "Won"
                            : board->IsGameOver() ? "Lost" : "Stopped")
            << " after " << outcome.moves
            << " moves\n"
            << "Logic moves: " << outcome.logic_moves << '\n'
            << "Guess moves: " << outcome.guess_moves << '\n'
            << "Flags set:   " << outcome.flags_set << '\n';
  return 0;
}
