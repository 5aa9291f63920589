#include "games/othello/BasicTypes.hpp"
#include "games/othello/IO.hpp"
#include "games/othello/MatchRunner.hpp"
#include "games/othello/SizeMaskRegistry.hpp"
#include "games/othello/players/AbstractPlayer.hpp"
#include "games/othello/players/RandomPlayer.hpp"
#include "games/othello/players/SearchPlayer.hpp"
#include "search/SearchParams.hpp"
#include "util/BoostUtil.hpp"
#include "util/Config.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using Color = othello::Color;
using MatchParams = othello::MatchParams;
using MatchRunner = othello::MatchRunner;
using Player = othello::AbstractPlayer;
using SearchParams = search::SearchParams;

struct Args {
  std::string config_filename;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Othello options");

    return desc.template add_option<"config">(
      po::value<std::string>(&config_filename)->default_value(config_filename),
      "key = value file whose entries override the default values of the options below");
  }
};

// Values from the config file become the defaults of the corresponding cmdline options.
void load_defaults(const util::Config& config, SearchParams& search_params,
                   MatchParams& match_params, util::Random::Params& random_params) {
  search_params.depth = config.get_as("depth", search_params.depth);
  search_params.algorithm = config.get("algorithm", search_params.algorithm);
  search_params.heuristic = config.get("heuristic", search_params.heuristic);
  search_params.benchmark = config.get_as("benchmark", search_params.benchmark);

  match_params.size = config.get_as("size", match_params.size);
  match_params.black_player = config.get("black-player", match_params.black_player);
  match_params.white_player = config.get("white-player", match_params.white_player);
  match_params.num_games = config.get_as("num-games", match_params.num_games);
  match_params.save_file = config.get("save-file", match_params.save_file);
  match_params.print_board = config.get_as("print-board", match_params.print_board);
  match_params.white_depth = config.get_as("white-depth", match_params.white_depth);
  match_params.white_algorithm = config.get("white-algorithm", match_params.white_algorithm);
  match_params.white_heuristic = config.get("white-heuristic", match_params.white_heuristic);

  random_params.seed = config.get_as("seed", random_params.seed);
}

SearchParams white_search_params(const SearchParams& search_params,
                                 const MatchParams& match_params) {
  SearchParams params = search_params;
  if (match_params.white_depth > 0) params.depth = match_params.white_depth;
  if (!match_params.white_algorithm.empty()) params.algorithm = match_params.white_algorithm;
  if (!match_params.white_heuristic.empty()) params.heuristic = match_params.white_heuristic;
  return params;
}

std::unique_ptr<Player> make_player(const std::string& type, Color color,
                                    const SearchParams& search_params) {
  std::unique_ptr<Player> player;
  if (type == "random") {
    player = std::make_unique<othello::RandomPlayer>();
  } else if (type == "ai") {
    player = std::make_unique<othello::SearchPlayer>(search_params);
  } else {
    throw util::CleanException("Unknown player type \"{}\" (expected ai or random)", type);
  }
  player->set_name(fmt::format("{}-{}", type, othello::color_name(color)));
  return player;
}

int main(int ac, char* av[]) {
  try {
    namespace po2 = boost_util::program_options;

    std::vector<std::string> raw_args(av + 1, av + ac);
    std::string config_filename = boost_util::get_option_value(raw_args, "config");
    if (!config_filename.empty() && !boost::filesystem::is_regular_file(config_filename)) {
      throw util::CleanException("Config file not found: {}", config_filename);
    }
    util::Config config = config_filename.empty() ? util::Config() : util::Config(config_filename);

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    SearchParams search_params;
    MatchParams match_params;
    load_defaults(config, search_params, match_params, random_params);

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(match_params.make_options_description())
                  .add(search_params.make_options_description())
                  .add(random_params.make_options_description())
                  .add(log_params.make_options_description());

    auto vm = po2::parse_args(desc, ac, av);
    if (vm.count("help") || vm.count("help-full")) {
      po2::Settings::help_full = vm.count("help-full");
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);
    search_params.validate();
    match_params.validate();
    if (config.size()) {
      LOG_INFO("Loaded {} default(s) from {}", config.size(), config.config_path().string());
    }

    othello::SizeMaskRegistry registry;
    othello::BoardSize size = othello::to_board_size(match_params.size);
    SearchParams white_params = white_search_params(search_params, match_params);

    auto black = make_player(match_params.black_player, othello::kBlack, search_params);
    auto white = make_player(match_params.white_player, othello::kWhite, white_params);

    MatchRunner runner(size, registry);
    int wins[othello::kNumPlayers] = {};
    int draws = 0;
    for (int g = 0; g < match_params.num_games; ++g) {
      LOG_INFO("Starting game {}/{}: {} vs {} on {}x{}", g + 1, match_params.num_games,
               black->get_name(), white->get_name(), int(size), int(size));

      std::ostream* out = match_params.print_board ? &std::cout : nullptr;
      othello::GameResult result = runner.play_game(*black, *white, out);
      if (!out) othello::IO::print_state(std::cout, runner.state());

      if (result.winner == othello::kEmpty) {
        draws++;
      } else {
        wins[result.winner]++;
      }

      if (!match_params.save_file.empty()) {
        runner.save_game(MatchRunner::save_path(match_params.save_file, g, match_params.num_games));
      }
    }

    LOG_INFO("Results over {} game(s): {} wins {}, {} wins {}, draws {}", match_params.num_games,
             black->get_name(), wins[othello::kBlack], white->get_name(), wins[othello::kWhite],
             draws);
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
