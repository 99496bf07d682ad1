#include "internal/model/session_state.hpp"

#include <cassert>
#include <iostream>

namespace {

using trackmatch::model::CanTransition;
using trackmatch::model::SessionState;

void TestHappyPaths() {
  assert(CanTransition(SessionState::kInit, SessionState::kSubmitted));
  assert(CanTransition(SessionState::kSubmitted, SessionState::kPolling));
  assert(CanTransition(SessionState::kPolling, SessionState::kCompleted));
  assert(CanTransition(SessionState::kCompleted, SessionState::kCollected));
  assert(CanTransition(SessionState::kPolling, SessionState::kTimedOut));
  assert(CanTransition(SessionState::kTimedOut, SessionState::kStopped));
  assert(CanTransition(SessionState::kStopped, SessionState::kCollected));
  assert(CanTransition(SessionState::kCollected, SessionState::kCleanedUp));
}

void TestCleanupReachableFromAnywhere() {
  for (auto state : {SessionState::kInit, SessionState::kSubmitted, SessionState::kPolling, SessionState::kCompleted, SessionState::kTimedOut,
                     SessionState::kStopped, SessionState::kCollected}) {
    assert(CanTransition(state, SessionState::kCleanedUp));
  }
}

void TestBackwardsAndIllegalMovesRejected() {
  assert(!CanTransition(SessionState::kPolling, SessionState::kSubmitted));
  assert(!CanTransition(SessionState::kCollected, SessionState::kPolling));
  assert(!CanTransition(SessionState::kCompleted, SessionState::kTimedOut));
  assert(!CanTransition(SessionState::kCompleted, SessionState::kStopped));
  assert(!CanTransition(SessionState::kPolling, SessionState::kStopped));
  assert(!CanTransition(SessionState::kPolling, SessionState::kPolling));
  assert(!CanTransition(SessionState::kSubmitted, SessionState::kInit));
  assert(!CanTransition(SessionState::kCleanedUp, SessionState::kCleanedUp));
  assert(!CanTransition(SessionState::kCleanedUp, SessionState::kInit));
}

void TestNames() {
  assert(trackmatch::model::ToString(SessionState::kTimedOut) == "timed_out");
  assert(trackmatch::model::ToString(SessionState::kCleanedUp) == "cleaned_up");
}

} // namespace

int main() {
  TestHappyPaths();
  TestCleanupReachableFromAnywhere();
  TestBackwardsAndIllegalMovesRejected();
  TestNames();

  std::cout << "trackmatch_unit_session_state: pass\n";
  return 0;
}
