#pragma once

#include <cstdint>
#include <string_view>

namespace trackmatch::model {

/*
  Lifecycle of one provider search session.

  INIT -> SUBMITTED -> POLLING -> {COMPLETED | TIMED_OUT} -> STOPPED
       -> COLLECTED -> CLEANED_UP

  Forward skips are legal (COMPLETED needs no stop, a failed submit goes
  straight to cleanup). Nothing ever moves backwards.
*/
enum class SessionState : std::uint8_t {
  kInit      = 0,
  kSubmitted = 1,
  kPolling   = 2,
  kCompleted = 3,
  kTimedOut  = 4,
  kStopped   = 5,
  kCollected = 6,
  kCleanedUp = 7,
};

constexpr bool IsTerminal(SessionState state) {
  return state == SessionState::kCleanedUp;
}

constexpr bool CanTransition(SessionState from, SessionState to) {
  if (from == to) {
    return false;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == SessionState::kInit) {
    return false;
  }
  if (to == SessionState::kCleanedUp) {
    return true;
  }
  // COMPLETED and TIMED_OUT are alternatives, not a sequence.
  if (from == SessionState::kCompleted && to == SessionState::kTimedOut) {
    return false;
  }
  // Stop only follows a timeout.
  if (to == SessionState::kStopped && from != SessionState::kTimedOut) {
    return false;
  }

  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

constexpr std::string_view ToString(SessionState state) {
  switch (state) {
    case SessionState::kInit:
      return "init";
    case SessionState::kSubmitted:
      return "submitted";
    case SessionState::kPolling:
      return "polling";
    case SessionState::kCompleted:
      return "completed";
    case SessionState::kTimedOut:
      return "timed_out";
    case SessionState::kStopped:
      return "stopped";
    case SessionState::kCollected:
      return "collected";
    case SessionState::kCleanedUp:
    default:
      return "cleaned_up";
  }
}

} // namespace trackmatch::model
