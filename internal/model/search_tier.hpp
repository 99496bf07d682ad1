#pragma once

#include <string_view>

#include "trackmatch/core/v1/types.pb.h"

namespace trackmatch::model {

using trackmatch::core::v1::SearchTier;

constexpr std::string_view ToString(SearchTier tier) {
  switch (tier) {
    case trackmatch::core::v1::SEARCH_TIER_FULL:
      return "full";
    case trackmatch::core::v1::SEARCH_TIER_TITLE_ONLY:
      return "title_only";
    case trackmatch::core::v1::SEARCH_TIER_KEYWORD_REDUCED:
      return "keyword_reduced";
    case trackmatch::core::v1::SEARCH_TIER_ARTIST_CATALOG:
      return "artist_catalog";
    default:
      return "unspecified";
  }
}

} // namespace trackmatch::model
