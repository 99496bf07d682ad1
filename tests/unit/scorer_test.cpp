#include "internal/search/scorer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/search/result_filter.hpp"
#include "test_fixtures.hpp"

namespace {

using namespace trackmatch::core::v1;
using trackmatch::search::FilteredCandidate;
using trackmatch::search::Scorer;
using trackmatch::testing::Candidate;
using trackmatch::testing::Reference;

Scorer DefaultScorer() {
  auto config = trackmatch::testing::TestConfig();
  return Scorer(config.scoring(), config.filter());
}

FilteredCandidate Filtered(CandidateResult candidate) {
  return {std::move(candidate), DURATION_MATCH_PERFECT, false};
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestExactDurationOutranksOneSecondMiss() {
  auto scorer    = DefaultScorer();
  auto reference = Reference("Artist", "Song", 162);

  auto exact = Candidate("exact", "Artist - Song.flac", 162);
  auto close = Candidate("close", "Artist - Song (1).flac", 161);

  assert(Near(scorer.DurationScore(exact, reference), Scorer::kMaxDuration));
  assert(scorer.DurationScore(close, reference) < scorer.DurationScore(exact, reference));

  auto ranked = scorer.Rank({Filtered(close), Filtered(exact)}, reference);
  assert(ranked.size() == 2);
  assert(ranked[0].candidate().username() == "exact");
  assert(ranked[0].rank() == 1);
  assert(ranked[1].rank() == 2);
  assert(ranked[0].score().total() > ranked[1].score().total());
}

void TestDurationScoreNeverIncreasesWithDelta() {
  auto scorer    = DefaultScorer();
  auto reference = Reference("Artist", "Song", 300);

  double previous_duration = 1e9;
  double previous_total    = 1e9;
  for (double delta = 0; delta <= 30.0; delta += 0.25) {
    auto candidate = Candidate("u", "Artist - Song.flac", 300 + delta);

    const double duration = scorer.DurationScore(candidate, reference);
    const double total    = scorer.Score(Filtered(candidate), reference).score().total();
    assert(duration <= previous_duration);
    assert(total <= previous_total);
    previous_duration = duration;
    previous_total    = total;
  }

  assert(Near(scorer.DurationScore(Candidate("u", "x.flac", 305), reference), 30.0));
  assert(Near(scorer.DurationScore(Candidate("u", "x.flac", 310), reference), 25.0));
  assert(Near(scorer.DurationScore(Candidate("u", "x.flac", 330), reference), 0.5));
  assert(Near(scorer.DurationScore(Candidate("u", "x.flac"), reference), 15.0));
}

void TestDurationCurveFollowsConfiguredTolerances() {
  auto config = trackmatch::testing::TestConfig();
  config.mutable_filter()->set_tight_tolerance_secs(4);
  config.mutable_filter()->set_acceptable_tolerance_secs(12);
  config.mutable_filter()->set_exclusion_bound_secs(30);
  Scorer scorer(config.scoring(), config.filter());
  auto   reference = Reference("Artist", "Song", 300);

  assert(Near(scorer.DurationScore(Candidate("u", "x.flac", 304), reference), 30.0));
  assert(Near(scorer.DurationScore(Candidate("u", "x.flac", 308), reference), 27.5));
  assert(Near(scorer.DurationScore(Candidate("u", "x.flac", 312), reference), 25.0));
  assert(Near(scorer.DurationScore(Candidate("u", "x.flac", 330), reference), 0.5));
  assert(Near(scorer.DurationScore(Candidate("u", "x.flac", 331), reference), 0.0));
}

void TestQualityTable() {
  auto scorer = DefaultScorer();

  auto cd = Candidate("u", "x.flac");
  assert(Near(scorer.QualityScore(cd), 25.0));

  auto hires = cd;
  hires.set_bit_depth(24);
  hires.set_sample_rate(96000);
  assert(Near(scorer.QualityScore(hires), 19.0));

  auto unknown = cd;
  unknown.clear_bit_depth();
  unknown.clear_sample_rate();
  assert(Near(scorer.QualityScore(unknown), 2.0));

  auto odd = cd;
  odd.set_bit_depth(32);
  odd.set_sample_rate(22050);
  assert(Near(scorer.QualityScore(odd), 8.0));
}

void TestReliabilityParts() {
  auto scorer = DefaultScorer();

  auto best = Candidate("u", "x.flac");
  best.set_upload_speed(50'000'000);
  best.set_queue_length(0);
  assert(Near(scorer.ReliabilityScore(best), 20.0));

  auto worst = best;
  worst.set_has_free_slot(false);
  worst.set_upload_speed(0);
  worst.set_queue_length(4);
  assert(Near(scorer.ReliabilityScore(worst), 2.5));
}

void TestFilenameRelevance() {
  auto scorer    = DefaultScorer();
  auto reference = Reference("Daft Punk", "One More Time - Radio Edit", 320);

  assert(Near(scorer.FilenameScore(Candidate("u", "\\Music\\Daft Punk - One More Time.flac"), reference), 15.0));
  assert(Near(scorer.FilenameScore(Candidate("u", "Other - More Time.flac"), reference), 6.0));
  assert(Near(scorer.FilenameScore(Candidate("u", "track01.flac"), reference), 0.0));
}

void TestTieBreakPolicy() {
  auto reference = Reference("Artist", "Song", 200);

  // equal totals: a is more reliable, b has the shorter path
  auto a = Candidate("a", "\\Music\\Artist\\Artist - Song.flac", 200);
  a.set_sample_rate(48000);
  a.set_upload_speed(0);
  a.set_queue_length(0);

  auto b = Candidate("b", "Artist - Song.flac", 200);
  b.set_upload_speed(0);
  b.set_queue_length(6);

  auto config = trackmatch::testing::TestConfig();
  Scorer reliability_first(config.scoring(), config.filter());

  const auto sa = reliability_first.Score(Filtered(a), reference);
  const auto sb = reliability_first.Score(Filtered(b), reference);
  assert(Near(sa.score().total(), sb.score().total()));
  assert(sa.score().reliability_score() > sb.score().reliability_score());

  assert(reliability_first.RanksBefore(sa, sb));
  assert(!reliability_first.RanksBefore(sb, sa));

  config.mutable_scoring()->set_tie_break(trackmatch::runtime::config::TIE_BREAK_FILENAME_THEN_RELIABILITY);
  Scorer filename_first(config.scoring(), config.filter());
  assert(filename_first.RanksBefore(sb, sa));
  assert(!filename_first.RanksBefore(sa, sb));
}

void TestDuplicateBasenamesCollapse() {
  auto scorer    = DefaultScorer();
  auto reference = Reference("Artist", "Song", 200);

  auto fast = Candidate("fast", "\\A\\Artist - Song.flac", 200);
  auto slow = Candidate("slow", "\\B\\artist - song.FLAC", 200);
  slow.set_has_free_slot(false);

  auto ranked = scorer.Rank({Filtered(slow), Filtered(fast)}, reference);
  assert(ranked.size() == 1);
  assert(ranked[0].candidate().username() == "fast");
  assert(ranked[0].rank() == 1);
}

void TestTotalIsSumAndBounded() {
  auto scorer    = DefaultScorer();
  auto reference = Reference("Artist", "Song", 200);

  auto candidate = Candidate("u", "Artist - Song.flac", 200);
  candidate.set_upload_speed(10'000'000);

  const auto scored = scorer.Score(Filtered(candidate), reference);
  const auto& s     = scored.score();
  assert(Near(s.total(), s.duration_score() + s.quality_score() + s.reliability_score() + s.filename_score()));
  assert(Near(s.total(), 100.0));
  assert(s.total() <= 100.0);
}

} // namespace

int main() {
  TestExactDurationOutranksOneSecondMiss();
  TestDurationScoreNeverIncreasesWithDelta();
  TestDurationCurveFollowsConfiguredTolerances();
  TestQualityTable();
  TestReliabilityParts();
  TestFilenameRelevance();
  TestTieBreakPolicy();
  TestDuplicateBasenamesCollapse();
  TestTotalIsSumAndBounded();

  std::cout << "trackmatch_unit_scorer: pass\n";
  return 0;
}
