#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/session_state.hpp"
#include "internal/search/query_builder.hpp"
#include "internal/util/errors.hpp"
#include "trackmatch/core/v1/types.pb.h"

namespace trackmatch::search {

/*
  One provider search opened for one tier query.

  Owned by the run that opened it and only touched from the scheduler
  thread.
*/
struct SearchSession {
  using Clock = std::chrono::steady_clock;

  std::string             requester;
  QueryPlan               plan;
  std::string             provider_id;
  model::SessionState     state{model::SessionState::kInit};
  Clock::time_point       started_at{};
  Clock::time_point       deadline{};
  std::uint32_t           last_file_count{0};
  bool                    stable_tracking{false};
  Clock::time_point       stable_since{};
  std::vector<trackmatch::core::v1::CandidateResult> raw_results;

  void Transition(model::SessionState next) {
    if (!model::CanTransition(state, next)) {
      throw util::InvalidState("search session " + provider_id + ": illegal transition " + std::string(model::ToString(state)) + " -> " +
                               std::string(model::ToString(next)));
    }
    state = next;
  }

  bool Opened() const {
    return !provider_id.empty();
  }

  bool Finished() const {
    return model::IsTerminal(state);
  }
};

} // namespace trackmatch::search
