#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

#include <boost/algorithm/string.hpp>

#include <fstream>

namespace boost_util {

std::string get_option_value(const std::vector<std::string>& args, const std::string& name) {
  std::string flag = "--" + name;
  std::string prefix = flag + "=";
  for (auto it = args.begin(); it != args.end(); ++it) {
    if (boost::algorithm::starts_with(*it, prefix)) {
      return it->substr(prefix.size());
    }
    if (*it == flag) {
      auto next = it + 1;
      if (next == args.end() || boost::algorithm::starts_with(*next, "-")) return "";
      return *next;
    }
  }
  return "";
}

void write_str_to_file(const std::string& str, const boost::filesystem::path& path) {
  std::ofstream file(path.string());
  if (!file) {
    throw util::CleanException("Could not open {} for writing", path.string());
  }
  file << str;
  if (!file) {
    throw util::CleanException("Failed writing {}", path.string());
  }
}

}  // namespace boost_util
