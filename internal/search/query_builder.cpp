#include "query_builder.hpp"

#include <regex>
#include <sstream>
#include <unordered_set>

#include "internal/util/text.hpp"

namespace trackmatch::search {

using namespace trackmatch::core::v1;

namespace {

constexpr const char* kVersionAlternatives =
    "Mono|Stereo|Remaster(?:ed)?(?:\\s+\\d{4})?"
    "|Deluxe(?:\\s+Edition)?"
    "|Ultimate\\s+Mix|Single\\s+Version|Album\\s+Version"
    "|Radio\\s+Edit|Bonus\\s+Track|Anniversary(?:\\s+Edition)?"
    "|Super\\s+Deluxe|Special\\s+Edition|\\d{4}\\s+Mix";

const std::regex& VersionSuffix() {
  // " - Remastered 2009" and everything after it; en dash is accepted too.
  static const std::regex re(std::string("\\s*(?:-|\xE2\x80\x93)\\s*(?:") + kVersionAlternatives + ").*$",
                             std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::regex& VersionParen() {
  static const std::regex re(std::string("\\s*\\((?:") + kVersionAlternatives + ")\\)", std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::unordered_set<std::string>& NoiseWords() {
  static const std::unordered_set<std::string> words = {
      "single", "version", "long", "short",    "full",  "edit",   "mix",  "remastered", "remaster", "deluxe", "edition",
      "bonus",  "track",   "album", "mono",    "stereo", "original", "extended", "feat", "featuring", "ft",     "the",
      "an",     "and",     "or",    "of",      "in",    "on",     "at",   "to",         "for",      "with",   "from",
      "by"};
  return words;
}

bool IsAsciiLetter(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

std::vector<std::string> SplitWhitespace(const std::string& value) {
  std::istringstream       in(value);
  std::vector<std::string> words;
  std::string              word;
  while (in >> word) words.push_back(word);
  return words;
}

} // namespace

QueryBuilder::QueryBuilder(bool include_artist_catalog) : include_artist_catalog_(include_artist_catalog) {
}

std::string QueryBuilder::CleanTitle(const std::string& title) {
  auto cleaned = std::regex_replace(title, VersionSuffix(), "");
  cleaned      = std::regex_replace(cleaned, VersionParen(), "");
  return util::Trim(cleaned);
}

std::vector<std::string> QueryBuilder::ReducedQueries(const std::string& title, const std::string& year) {
  if (year.empty()) return {};

  const auto words = SplitWhitespace(title);
  if (words.size() < 2) return {};

  std::vector<std::string> queries;
  queries.reserve(words.size());
  for (size_t skip = 0; skip < words.size(); ++skip) {
    std::vector<std::string> kept;
    for (size_t i = 0; i < words.size(); ++i) {
      if (i != skip) kept.push_back(words[i]);
    }
    queries.push_back(util::Join(kept, " ") + " " + year);
  }
  return queries;
}

std::vector<std::string> QueryBuilder::LatinKeywords(const std::string& title) {
  std::vector<std::string> keywords;
  std::string              current;

  auto flush = [&] {
    if (current.size() >= 2 && !NoiseWords().count(util::ToLower(current))) {
      keywords.push_back(current);
    }
    current.clear();
  };

  for (char c : title) {
    if (IsAsciiLetter(c)) {
      current.push_back(c);
    } else {
      flush();
    }
  }
  flush();
  return keywords;
}

std::vector<QueryPlan> QueryBuilder::Build(const TrackReference& reference) const {
  const auto artist = util::Trim(reference.artist());
  const auto title  = CleanTitle(reference.title());

  std::vector<QueryPlan> plans;

  if (!artist.empty() && !title.empty()) {
    plans.push_back({SEARCH_TIER_FULL, artist + " " + title, {}});
  }
  if (!title.empty()) {
    plans.push_back({SEARCH_TIER_TITLE_ONLY, title, {}});
  }
  for (auto& query : ReducedQueries(title, util::Trim(reference.year()))) {
    plans.push_back({SEARCH_TIER_KEYWORD_REDUCED, std::move(query), {}});
  }
  if (include_artist_catalog_ && !artist.empty()) {
    QueryPlan plan{SEARCH_TIER_ARTIST_CATALOG, artist, {}};
    for (const auto& keyword : LatinKeywords(title)) {
      plan.required_keywords.push_back(util::ToLower(keyword));
    }
    plans.push_back(std::move(plan));
  }

  return plans;
}

} // namespace trackmatch::search
