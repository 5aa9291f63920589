#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <algorithm>
#include <iostream>
#include <string>

int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;

  util::Logging::Params log_params;
  util::Random::Params random_params;

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                .template add_option<"help-full">("help (all options)")
                .add(log_params.make_options_description())
                .add(random_params.make_options_description());

  // gtest must see --help to print its own usage, so ours is printed first.
  auto has_arg = [&](const std::string& flag) {
    return std::any_of(argv + 1, argv + argc, [&](const char* arg) { return arg == flag; });
  };
  bool help_full = has_arg("--help-full");
  bool help = help_full || has_arg("--help");
  if (help) {
    po2::Settings::help_full = help_full;
    std::cout << desc << std::endl;
    if (help_full) {
      argc = 2;
      argv[1] = const_cast<char*>("--help");
    }
  }

  // InitGoogleTest() consumes the gtest flags; what remains in argv is ours.
  testing::InitGoogleTest(&argc, argv);

  po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);
  util::Random::init(random_params);
  return RUN_ALL_TESTS();
}
