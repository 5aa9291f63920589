#pragma once

#include <boost/filesystem.hpp>

#include <map>
#include <string>

namespace util {

/*
 * Key-value pairs read from a plain-text config file. Each non-empty line has the form
 *
 * key = value  # optional comment
 *
 * Whitespace around keys and values is trimmed. A line without '=' or a repeated key raises
 * util::CleanException at construction. A missing file yields an empty Config.
 */
class Config {
 public:
  Config() = default;
  explicit Config(const boost::filesystem::path& path);

  bool contains(const std::string& key) const;
  std::string get(const std::string& key) const;  // throws exception if key not found
  std::string get(const std::string& key, const std::string& default_value) const;

  /*
   * Converts the mapped value via boost::lexical_cast. Throws util::CleanException if the value
   * cannot be converted.
   */
  template <typename T>
  T get_as(const std::string& key, const T& default_value) const;

  const boost::filesystem::path& config_path() const { return config_path_; }
  size_t size() const { return map_.size(); }

 private:
  using map_t = std::map<std::string, std::string>;
  boost::filesystem::path config_path_;
  map_t map_;
};

}  // namespace util

#include "inline/util/Config.inl"
