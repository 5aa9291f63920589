#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Config.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/MultiWordMask.hpp"
#include "util/Random.hpp"
#include "util/StringUtil.hpp"

#include <boost/filesystem.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

using mask3_t = util::MultiWordMask<3>;

namespace {

uint64_t random_word() {
  auto& prng = util::Random::default_prng();
  return (uint64_t(prng()) << 32) | uint64_t(prng());
}

mask3_t random_mask() {
  mask3_t m;
  for (int i = 0; i < mask3_t::kNumWords; ++i) {
    m.set_word(i, random_word());
  }
  return m;
}

int reference_popcount(const mask3_t& m) {
  int count = 0;
  for (int k = 0; k < mask3_t::kNumBits; ++k) {
    if (m.test(k)) ++count;
  }
  return count;
}

boost::filesystem::path write_temp_file(const std::string& contents) {
  boost::filesystem::path path =
    boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("cfg-%%%%-%%%%.txt");
  boost_util::write_str_to_file(contents, path);
  return path;
}

}  // namespace

TEST(MultiWordMask, popcount) {
  util::Random::set_seed(1);

  EXPECT_EQ(mask3_t().popcount(), 0);
  EXPECT_EQ((~mask3_t()).popcount(), 192);
  EXPECT_EQ(mask3_t(0xffull).popcount(), 8);

  for (int i = 0; i < 1000; ++i) {
    mask3_t m = random_mask();
    EXPECT_EQ(m.popcount(), reference_popcount(m));
  }

  // sparse masks exercise the small-count paths of the SWAR reduction
  for (int i = 0; i < 1000; ++i) {
    mask3_t m = random_mask() & random_mask() & random_mask();
    EXPECT_EQ(m.popcount(), reference_popcount(m));
  }
}

TEST(MultiWordMask, swar_popcount) {
  EXPECT_EQ(mask3_t::swar_popcount(0), 0);
  EXPECT_EQ(mask3_t::swar_popcount(~uint64_t(0)), 64);
  EXPECT_EQ(mask3_t::swar_popcount(0x8000000000000001ull), 2);
  EXPECT_EQ(mask3_t::swar_popcount(0x0102040810204080ull), 8);
}

TEST(MultiWordMask, set_and_test) {
  mask3_t m;
  for (int k : {0, 63, 64, 127, 128, 191}) {
    EXPECT_FALSE(m.test(k));
    m.set(k);
    EXPECT_TRUE(m.test(k));
  }
  EXPECT_EQ(m.popcount(), 6);
  m.set(64, false);
  EXPECT_FALSE(m.test(64));
  EXPECT_EQ(m.popcount(), 5);

  EXPECT_EQ(mask3_t::bit(130).word(2), uint64_t(1) << 2);
  EXPECT_TRUE(mask3_t::bit(-1).empty());
  EXPECT_TRUE(mask3_t::bit(192).empty());
}

TEST(MultiWordMask, shifts_cross_word_boundaries) {
  mask3_t m = mask3_t::bit(63);
  EXPECT_EQ(m << 1, mask3_t::bit(64));
  EXPECT_EQ((m << 1) >> 1, m);
  EXPECT_EQ(m << 65, mask3_t::bit(128));
  EXPECT_EQ(mask3_t::bit(128) >> 127, mask3_t::bit(1));
  EXPECT_TRUE((mask3_t::bit(191) << 1).empty());
  EXPECT_TRUE((mask3_t::bit(0) >> 1).empty());
  EXPECT_TRUE((m << 192).empty());
  EXPECT_EQ(m << 0, m);

  util::Random::set_seed(2);
  for (int i = 0; i < 200; ++i) {
    mask3_t r = random_mask();
    int n = util::Random::uniform_sample(0, 192);
    mask3_t left = r << n;
    mask3_t right = r >> n;
    for (int k = 0; k < mask3_t::kNumBits; ++k) {
      EXPECT_EQ(left.test(k), k >= n && r.test(k - n));
      EXPECT_EQ(right.test(k), k + n < mask3_t::kNumBits && r.test(k + n));
    }
  }
}

TEST(MultiWordMask, lowest_bit) {
  EXPECT_TRUE(mask3_t().lowest_bit().empty());
  EXPECT_EQ(mask3_t().countr_zero(), 192);

  mask3_t m = mask3_t::bit(70) | mask3_t::bit(150);
  EXPECT_EQ(m.lowest_bit(), mask3_t::bit(70));
  EXPECT_EQ(m.countr_zero(), 70);

  std::vector<int> indices;
  while (m.any()) {
    mask3_t low = m.lowest_bit();
    indices.push_back(low.countr_zero());
    m ^= low;
  }
  EXPECT_EQ(indices, (std::vector<int>{70, 150}));
}

TEST(MultiWordMask, low_bits) {
  EXPECT_TRUE(mask3_t::low_bits(0).empty());
  EXPECT_EQ(mask3_t::low_bits(36).popcount(), 36);
  EXPECT_EQ(mask3_t::low_bits(144).popcount(), 144);
  EXPECT_EQ(mask3_t::low_bits(144).countr_zero(), 0);
  EXPECT_EQ(mask3_t::low_bits(64).word(0), ~uint64_t(0));
  EXPECT_EQ(mask3_t::low_bits(64).word(1), 0u);
  EXPECT_EQ(mask3_t::low_bits(192), ~mask3_t());
}

TEST(MultiWordMask, to_string_and_hash) {
  mask3_t m(0b1011);
  EXPECT_EQ(m.to_string(6), "001011");
  EXPECT_EQ(m.to_string().size(), 192u);

  util::Random::set_seed(3);
  mask3_t r = random_mask();
  mask3_t copy = r;
  EXPECT_EQ(r.hash(), copy.hash());
  EXPECT_NE(r.hash(), (r ^ mask3_t(1)).hash());
}

TEST(Random, uniform_sample) {
  util::Random::set_seed(4);
  std::vector<int> counts(5, 0);
  for (int i = 0; i < 5000; ++i) {
    int k = util::Random::uniform_sample(0, 5);
    ASSERT_GE(k, 0);
    ASSERT_LT(k, 5);
    counts[k]++;
  }
  for (int c : counts) {
    EXPECT_GT(c, 800);
  }
  EXPECT_THROW(util::Random::uniform_sample(3, 3), util::Exception);
}

TEST(StringUtil, split) {
  std::vector<std::string> result1 = util::split("a,b,c", ",");
  std::vector<std::string> result2 = util::split(" a \tb   c ");
  std::vector<std::string> result3 = util::split("a,,b", ",");

  EXPECT_EQ(result1, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(result2, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(result3, (std::vector<std::string>{"a", "", "b"}));
  EXPECT_TRUE(util::split("   ").empty());
  EXPECT_EQ(util::split("x--y", "--"), (std::vector<std::string>{"x", "y"}));
}

TEST(StringUtil, strip_comment) {
  EXPECT_EQ(util::strip_comment("  depth = 3  # search depth"), "depth = 3");
  EXPECT_EQ(util::strip_comment("# only a comment"), "");
  EXPECT_EQ(util::strip_comment("\tsize=8"), "size=8");
  EXPECT_EQ(util::strip_comment("a;b", ';'), "a");
}

TEST(StringUtil, grammatically_join) {
  EXPECT_EQ(util::grammatically_join({}, "and"), "");
  EXPECT_EQ(util::grammatically_join({"a"}, "and"), "a");
  EXPECT_EQ(util::grammatically_join({"a", "b"}, "and"), "a and b");
  EXPECT_EQ(util::grammatically_join({"6", "8", "10", "12"}, "or"), "6, 8, 10, or 12");
}

TEST(BoostUtil, get_option_value) {
  std::vector<std::string> args = util::split("--foo=bar --baz 3 --flag");
  EXPECT_EQ(boost_util::get_option_value(args, "foo"), "bar");
  EXPECT_EQ(boost_util::get_option_value(args, "baz"), "3");
  EXPECT_EQ(boost_util::get_option_value(args, "flag"), "");
  EXPECT_EQ(boost_util::get_option_value(args, "missing"), "");
}

TEST(Asserts, release_and_clean) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3, "bad sum {}", 1 + 1), util::ReleaseAssertionError);
  EXPECT_THROW(CLEAN_ASSERT(false), util::CleanException);

  try {
    CLEAN_ASSERT(2 < 1, "depth {} too small", 0);
    FAIL();
  } catch (const util::CleanException& e) {
    EXPECT_NE(std::string(e.what()).find("depth 0 too small"), std::string::npos);
  }
}

TEST(Random, choose) {
  util::Random::set_seed(11);
  std::vector<int> items = {3, 5, 7};
  for (int i = 0; i < 50; ++i) {
    int x = util::Random::choose(items);
    EXPECT_TRUE(x == 3 || x == 5 || x == 7);
  }
  EXPECT_THROW(util::Random::choose(std::vector<int>{}), util::Exception);
}

TEST(Config, parse) {
  auto path = write_temp_file(
    "# comment line\n"
    "size = 10\n"
    "\n"
    "algorithm=minimax   # trailing comment\n"
    "  heuristic  =  mobility  \n");

  util::Config config(path);
  EXPECT_EQ(config.size(), 3u);
  EXPECT_TRUE(config.contains("size"));
  EXPECT_EQ(config.get("algorithm"), "minimax");
  EXPECT_EQ(config.get("heuristic"), "mobility");
  EXPECT_EQ(config.get_as<int>("size", 8), 10);
  EXPECT_EQ(config.get_as<int>("depth", 3), 3);
  EXPECT_EQ(config.get("depth", "5"), "5");
  EXPECT_THROW(config.get("depth"), util::CleanException);
  EXPECT_THROW(config.get_as<int>("algorithm", 0), util::CleanException);

  boost::filesystem::remove(path);
}

TEST(Config, errors) {
  auto dup_path = write_temp_file("a = 1\na = 2\n");
  EXPECT_THROW(util::Config{dup_path}, util::CleanException);
  boost::filesystem::remove(dup_path);

  auto bad_path = write_temp_file("no equals sign here\n");
  EXPECT_THROW(util::Config{bad_path}, util::CleanException);
  boost::filesystem::remove(bad_path);

  util::Config missing(boost::filesystem::temp_directory_path() / "does-not-exist-cfg.txt");
  EXPECT_EQ(missing.size(), 0u);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
