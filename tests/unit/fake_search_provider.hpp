#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/provider/search_provider.hpp"
#include "internal/util/errors.hpp"

namespace trackmatch::testing {

/*
  Scripted in-memory SearchProvider. Every call is appended to Events()
  as "<op>:<arg>".
*/
class FakeSearchProvider : public trackmatch::provider::SearchProvider {
 public:
  struct Script {
    std::vector<trackmatch::core::v1::CandidateResult> results;
    bool                                               complete{true};
    bool                                               fail_submit{false};
    bool                                               fail_status{false};
    // Status blocks this long before answering, as a slow daemon would.
    std::chrono::milliseconds                          status_delay{0};
  };

  void SetScript(const std::string& query, Script script) {
    std::lock_guard lock(mutex_);
    scripts_[query] = std::move(script);
  }

  // A session that exists before the run, e.g. left by a crashed one.
  void AddExisting(const std::string& id) {
    std::lock_guard lock(mutex_);
    sessions_[id] = Script{};
  }

  void SetDeleteFails(bool fails) {
    std::lock_guard lock(mutex_);
    delete_fails_ = fails;
  }

  std::string Submit(const std::string& query, std::chrono::milliseconds search_timeout) override {
    std::lock_guard lock(mutex_);
    events_.push_back("submit:" + query);
    timeouts_.push_back(search_timeout);

    auto script = scripts_.count(query) ? scripts_[query] : Script{};
    if (script.fail_submit) {
      throw trackmatch::util::ProviderError("submit refused", 503);
    }

    const auto id = "s-" + std::to_string(++next_id_);
    sessions_[id] = script;
    return id;
  }

  trackmatch::provider::SearchStatus Status(const std::string& id) override {
    std::chrono::milliseconds delay{0};
    {
      std::lock_guard lock(mutex_);
      delay = Find(id).status_delay;
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }

    std::lock_guard lock(mutex_);
    const auto& script = Find(id);
    if (script.fail_status) {
      throw trackmatch::util::ProviderError("status timed out");
    }

    trackmatch::provider::SearchStatus status;
    status.state      = script.complete ? "Completed, Succeeded" : "InProgress";
    status.complete   = script.complete;
    status.file_count = static_cast<uint32_t>(script.results.size());
    return status;
  }

  void Stop(const std::string& id) override {
    std::lock_guard lock(mutex_);
    Find(id);
    events_.push_back("stop:" + id);
  }

  void Delete(const std::string& id) override {
    std::lock_guard lock(mutex_);
    events_.push_back("delete:" + id);
    if (delete_fails_) {
      throw trackmatch::util::ProviderError("delete failed", 500);
    }
    if (!sessions_.erase(id)) {
      throw trackmatch::util::NotFound("no session " + id);
    }
  }

  std::vector<trackmatch::core::v1::CandidateResult> Results(const std::string& id) override {
    std::lock_guard lock(mutex_);
    events_.push_back("results:" + id);
    return Find(id).results;
  }

  std::vector<std::string> List() override {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, script] : sessions_) ids.push_back(id);
    return ids;
  }

  std::vector<std::string> Events() {
    std::lock_guard lock(mutex_);
    return events_;
  }

  std::vector<std::chrono::milliseconds> SubmitTimeouts() {
    std::lock_guard lock(mutex_);
    return timeouts_;
  }

  size_t LiveSessions() {
    std::lock_guard lock(mutex_);
    return sessions_.size();
  }

  size_t Count(const std::string& prefix) {
    std::lock_guard lock(mutex_);
    size_t n = 0;
    for (const auto& event : events_) {
      if (event.rfind(prefix, 0) == 0) ++n;
    }
    return n;
  }

 private:
  const Script& Find(const std::string& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      throw trackmatch::util::NotFound("no session " + id);
    }
    return it->second;
  }

  std::mutex                             mutex_;
  std::map<std::string, Script>          scripts_;
  std::map<std::string, Script>          sessions_;
  std::vector<std::string>               events_;
  std::vector<std::chrono::milliseconds> timeouts_;
  bool                                   delete_fails_{false};
  int                                    next_id_{0};
};

} // namespace trackmatch::testing
