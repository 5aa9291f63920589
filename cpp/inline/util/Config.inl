#include "util/Config.hpp"

#include "util/Exception.hpp"
#include "util/StringUtil.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <fstream>

namespace util {

inline bool Config::contains(const std::string& key) const { return map_.contains(key); }

inline std::string Config::get(const std::string& key) const {
  auto it = map_.find(key);
  if (it == map_.end()) {
    throw CleanException("Mapping for key \"{}\" required in config file {}", key,
                         config_path_.string());
  }
  return it->second;
}

inline std::string Config::get(const std::string& key, const std::string& default_value) const {
  auto it = map_.find(key);
  if (it == map_.end()) return default_value;
  return it->second;
}

template <typename T>
T Config::get_as(const std::string& key, const T& default_value) const {
  auto it = map_.find(key);
  if (it == map_.end()) return default_value;
  try {
    return boost::lexical_cast<T>(it->second);
  } catch (const boost::bad_lexical_cast&) {
    throw CleanException("Bad value \"{}\" for key \"{}\" in config file {}", it->second, key,
                         config_path_.string());
  }
}

inline Config::Config(const boost::filesystem::path& path) : config_path_(path) {
  if (!boost::filesystem::is_regular_file(config_path_)) return;

  std::ifstream file(config_path_.string());
  std::string raw_line;
  while (std::getline(file, raw_line)) {
    std::string line = strip_comment(raw_line);
    if (line.empty()) continue;

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      throw CleanException("Bad line in config file {}: {}", config_path_.string(), raw_line);
    }
    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);

    boost::algorithm::trim(key);
    boost::algorithm::trim(value);

    if (contains(key)) {
      throw CleanException("Duplicate key \"{}\" in config file {}", key, config_path_.string());
    }
    map_[key] = value;
  }
}

}  // namespace util
