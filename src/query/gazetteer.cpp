#include "query/gazetteer.hpp"

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <stdexcept>

#include "core/text.hpp"

namespace wx_agent::query {
namespace {

const std::vector<std::string>& builtin_city_names() {
  static const std::vector<std::string> kNames = {
      "Hyderabad", "Bangalore", "Bengaluru", "Delhi",  "Mumbai",   "Chennai", "Kolkata",
      "Pune",      "London",    "Paris",     "Tokyo",  "New York", "Berlin",
  };
  return kNames;
}

}  // namespace

Gazetteer::Gazetteer() : Gazetteer(builtin_city_names()) {}

Gazetteer::Gazetteer(const std::vector<std::string>& names) {
  entries_.reserve(names.size());
  for (const auto& name : names) {
    add(name);
  }
}

Gazetteer Gazetteer::load(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open gazetteer file: " + path);
  }

  std::vector<std::string> names;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }
    if (!core::split_whitespace(line).empty()) {
      names.push_back(line);
    }
  }

  if (names.empty()) {
    throw std::runtime_error("gazetteer file lists no cities: " + path);
  }
  return Gazetteer(names);
}

void Gazetteer::add(const std::string& name) {
  Entry entry{.canonical = core::canonical_city_name(name), .words = core::split_whitespace(core::to_lower(name))};
  if (entry.words.empty()) {
    return;
  }
  for (const auto& existing : entries_) {
    if (existing.words == entry.words) {
      return;
    }
  }
  entries_.push_back(std::move(entry));
}

std::optional<std::string> Gazetteer::find_last(const std::vector<std::string>& words) const {
  const Entry* best = nullptr;
  std::size_t best_end = 0;

  for (const auto& entry : entries_) {
    const auto span = entry.words.size();
    if (span > words.size()) {
      continue;
    }
    for (std::size_t start = words.size() - span + 1; start-- > 0;) {
      if (!std::equal(entry.words.begin(), entry.words.end(), words.begin() + static_cast<std::ptrdiff_t>(start))) {
        continue;
      }
      const auto end = start + span;
      if (best == nullptr || end > best_end || (end == best_end && span > best->words.size())) {
        best = &entry;
        best_end = end;
      }
      break;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }
  return best->canonical;
}

std::vector<std::string> Gazetteer::names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& entry : entries_) {
    out.push_back(entry.canonical);
  }
  return out;
}

}  // namespace wx_agent::query
