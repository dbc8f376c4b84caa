#pragma once

#include <optional>
#include <string>
#include <vector>

namespace wx_agent::query {

// Static list of recognized city names, built once before serving.
class Gazetteer {
 public:
  Gazetteer();
  explicit Gazetteer(const std::vector<std::string>& names);

  // One name per line; '#' starts a comment. Throws std::runtime_error when
  // the file cannot be read or lists no names.
  static Gazetteer load(const std::string& path);

  // Finds the known name whose occurrence in `words` ends last; ties go to the
  // longer name. `words` must be normalized (lowercase, punctuation stripped).
  [[nodiscard]] std::optional<std::string> find_last(const std::vector<std::string>& words) const;

  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] std::size_t size() const { return entries_.size(); }

 private:
  struct Entry {
    std::string canonical;
    std::vector<std::string> words;
  };

  void add(const std::string& name);

  std::vector<Entry> entries_;
};

}  // namespace wx_agent::query
