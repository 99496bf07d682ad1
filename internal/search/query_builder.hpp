#pragma once

#include <string>
#include <vector>

#include "trackmatch/core/v1/types.pb.h"

namespace trackmatch::search {

/*
  One planned provider query.

  KEYWORD_REDUCED expands to several plans, one per dropped word.
*/
struct QueryPlan {
  trackmatch::core::v1::SearchTier tier{trackmatch::core::v1::SEARCH_TIER_UNSPECIFIED};
  std::string                      query;
  // ARTIST_CATALOG only: results are narrowed to filenames containing one
  // of these (lowercase) before filtering.
  std::vector<std::string> required_keywords;
};

/*
  Derives tier queries from a TrackReference.

  Catalog titles carry edition noise ("- Remastered 2009", "(Mono)") that
  peers rarely have in their paths; it is stripped before any query is
  built.
*/
class QueryBuilder {
 public:
  explicit QueryBuilder(bool include_artist_catalog = true);

  std::vector<QueryPlan> Build(const trackmatch::core::v1::TrackReference& reference) const;

  static std::string CleanTitle(const std::string& title);

  // Drops one word at a time and appends the year. Empty when the title
  // has fewer than two words or no year is known.
  static std::vector<std::string> ReducedQueries(const std::string& title, const std::string& year);

  // Distinctive ASCII words of two or more letters, minus filler words.
  static std::vector<std::string> LatinKeywords(const std::string& title);

 private:
  bool include_artist_catalog_;
};

} // namespace trackmatch::search
