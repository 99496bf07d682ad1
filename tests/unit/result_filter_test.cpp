#include "internal/search/result_filter.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "test_fixtures.hpp"

namespace {

using namespace trackmatch::core::v1;
using trackmatch::search::ResultFilter;
using trackmatch::testing::Candidate;
using trackmatch::testing::Reference;

ResultFilter DefaultFilter() {
  return ResultFilter(trackmatch::testing::TestConfig().filter());
}

void TestDurationBoundExcludes() {
  auto filter    = DefaultFilter();
  auto reference = Reference("Artist", "Song", 162);

  auto passing = filter.Filter({Candidate("a", "Artist - Song.flac", 161), Candidate("b", "Artist - Song (2).flac", 162),
                                Candidate("c", "Artist - Song (3).flac", 200)},
                               reference);

  assert(passing.size() == 2);
  for (const auto& item : passing) {
    assert(item.candidate.username() != "c");
    assert(item.duration_match == DURATION_MATCH_PERFECT);
    assert(!item.fallback_format);
  }
}

void TestDurationClasses() {
  auto filter    = DefaultFilter();
  auto reference = Reference("Artist", "Song", 200);

  assert(*filter.ClassifyDuration(Candidate("u", "x.flac", 205), reference) == DURATION_MATCH_PERFECT);
  assert(*filter.ClassifyDuration(Candidate("u", "x.flac", 209), reference) == DURATION_MATCH_ACCEPTABLE);
  assert(*filter.ClassifyDuration(Candidate("u", "x.flac", 230), reference) == DURATION_MATCH_MARGINAL);
  assert(!filter.ClassifyDuration(Candidate("u", "x.flac", 231), reference).has_value());
  assert(*filter.ClassifyDuration(Candidate("u", "x.flac"), reference) == DURATION_MATCH_UNKNOWN);
  assert(*filter.ClassifyDuration(Candidate("u", "x.flac", 100), Reference("Artist", "Song", 0)) == DURATION_MATCH_UNKNOWN);
}

void TestKeywordExclusionIsTitleSafe() {
  auto filter = DefaultFilter();

  auto live_file = Candidate("u", "\\Music\\AC-DC\\Live Wire (live).flac", 350);
  assert(!filter.IsExcludedByKeyword(live_file, Reference("AC/DC", "Live Wire", 350)));
  assert(filter.IsExcludedByKeyword(live_file, Reference("AC/DC", "Wire", 350)));

  auto remix = Candidate("u", "Artist - Song (Club Remix).flac", 200);
  assert(filter.IsExcludedByKeyword(remix, Reference("Artist", "Song", 200)));
}

void TestKeywordLooksAtBasenameOnly() {
  auto filter = DefaultFilter();
  auto studio = Candidate("u", "\\Music\\Live Recordings\\Artist - Song.flac", 200);
  assert(!filter.IsExcludedByKeyword(studio, Reference("Artist", "Song", 200)));
}

void TestFallbackFormatUsedOnlyWithoutPreferred() {
  auto filter    = DefaultFilter();
  auto reference = Reference("Artist", "Song", 200);

  auto mp3 = Candidate("m", "Artist - Song.mp3", 200);
  auto wav = Candidate("w", "Artist - Song.wav", 200);

  auto passing = filter.Filter({mp3, wav}, reference);
  assert(passing.size() == 1);
  assert(passing[0].candidate.username() == "w");
  assert(passing[0].fallback_format);

  auto flac = Candidate("f", "Artist - Song.flac", 200);
  passing   = filter.Filter({mp3, wav, flac}, reference);
  assert(passing.size() == 1);
  assert(passing[0].candidate.username() == "f");
  assert(!passing[0].fallback_format);
}

void TestFallbackWhenEveryPreferredCandidateIsRejected() {
  auto filter    = DefaultFilter();
  auto reference = Reference("Artist", "Song", 200);

  auto bad_flac = Candidate("f", "Artist - Song (Karaoke).flac", 200);
  auto mp3      = Candidate("m", "Artist - Song.mp3", 201);

  auto passing = filter.Filter({bad_flac, mp3}, reference);
  assert(passing.size() == 1);
  assert(passing[0].candidate.username() == "m");
  assert(passing[0].fallback_format);
}

void TestAcceptableToleranceIsConfigurable() {
  auto config = trackmatch::testing::TestConfig().filter();
  config.set_tight_tolerance_secs(3);
  config.set_acceptable_tolerance_secs(15);
  config.set_exclusion_bound_secs(20);
  ResultFilter filter(config);
  auto         reference = Reference("Artist", "Song", 200);

  assert(*filter.ClassifyDuration(Candidate("u", "x.flac", 203), reference) == DURATION_MATCH_PERFECT);
  assert(*filter.ClassifyDuration(Candidate("u", "x.flac", 212), reference) == DURATION_MATCH_ACCEPTABLE);
  assert(*filter.ClassifyDuration(Candidate("u", "x.flac", 215), reference) == DURATION_MATCH_ACCEPTABLE);
  assert(*filter.ClassifyDuration(Candidate("u", "x.flac", 216), reference) == DURATION_MATCH_MARGINAL);
  assert(!filter.ClassifyDuration(Candidate("u", "x.flac", 221), reference).has_value());
}

void TestNarrowedPreferredFormatFirst() {
  auto filter    = DefaultFilter();
  auto reference = Reference("Artist", "Kurenai", 200);
  const std::vector<std::string> keywords{"kurenai"};

  auto other_flac   = Candidate("of", "Artist\\Artist - Other.flac", 200);
  auto kurenai_flac = Candidate("kf", "Artist\\Artist - Kurenai.flac", 200);
  auto kurenai_mp3  = Candidate("km", "Artist\\Artist - Kurenai.mp3", 200);
  auto other_mp3    = Candidate("om", "Artist\\Artist - Other.mp3", 200);

  auto passing = filter.FilterNarrowed({other_flac, kurenai_flac, kurenai_mp3}, reference, keywords);
  assert(passing.size() == 1);
  assert(passing[0].candidate.username() == "kf");

  // whole preferred set beats a narrowed fallback format
  passing = filter.FilterNarrowed({other_flac, kurenai_mp3}, reference, keywords);
  assert(passing.size() == 1);
  assert(passing[0].candidate.username() == "of");
  assert(!passing[0].fallback_format);

  passing = filter.FilterNarrowed({other_mp3, kurenai_mp3}, reference, keywords);
  assert(passing.size() == 1);
  assert(passing[0].candidate.username() == "km");
  assert(passing[0].fallback_format);

  passing = filter.FilterNarrowed({other_mp3}, reference, keywords);
  assert(passing.size() == 1);
  assert(passing[0].candidate.username() == "om");
}

void TestDeclaredExtensionWins() {
  auto candidate = Candidate("u", "track", 200);
  candidate.set_extension(".FLAC");
  assert(trackmatch::search::CandidateExtension(candidate) == "flac");
  assert(trackmatch::search::CandidateExtension(Candidate("u", "a\\b.Flac")) == "flac");
}

void TestNothingPasses() {
  auto filter = DefaultFilter();
  assert(filter.Filter({Candidate("u", "Artist - Song.txt", 200)}, Reference("Artist", "Song", 200)).empty());
  assert(filter.Filter({}, Reference("Artist", "Song", 200)).empty());
}

} // namespace

int main() {
  TestDurationBoundExcludes();
  TestDurationClasses();
  TestKeywordExclusionIsTitleSafe();
  TestKeywordLooksAtBasenameOnly();
  TestFallbackFormatUsedOnlyWithoutPreferred();
  TestFallbackWhenEveryPreferredCandidateIsRejected();
  TestAcceptableToleranceIsConfigurable();
  TestNarrowedPreferredFormatFirst();
  TestDeclaredExtensionWins();
  TestNothingPasses();

  std::cout << "trackmatch_unit_result_filter: pass\n";
  return 0;
}
