#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace trackmatch::session {

enum class Activity {
  kSearch,
  kVerify,
};

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

class RequesterRegistry;

/*
  Holds one requester's search or verification slot until destroyed.
*/
class RequesterSlot {
 public:
  RequesterSlot() = default;
  RequesterSlot(RequesterRegistry* registry, std::string requester, Activity activity, CancelFlag cancel);
  ~RequesterSlot();

  RequesterSlot(const RequesterSlot&)            = delete;
  RequesterSlot& operator=(const RequesterSlot&) = delete;

  RequesterSlot(RequesterSlot&& other) noexcept;
  RequesterSlot& operator=(RequesterSlot&& other) noexcept;

  const std::string& Requester() const {
    return requester_;
  }

  const CancelFlag& Cancel() const {
    return cancel_;
  }

  void Release();

 private:
  RequesterRegistry* registry_{nullptr};
  std::string        requester_;
  Activity           activity_{Activity::kSearch};
  CancelFlag         cancel_;
};

/*
  Per-requester bookkeeping shared by the orchestrator and the service.

  A requester may have at most one search and one verification in flight;
  a second Acquire for the same activity throws util::RequesterBusy.
  Provider session ids opened on behalf of a requester are remembered
  until deleted, so a run that died before cleanup leaves a trail the next
  run clears first. Entries disappear once nothing is active or
  remembered.
*/
class RequesterRegistry {
 public:
  RequesterSlot Acquire(const std::string& requester, Activity activity);

  bool IsActive(const std::string& requester, Activity activity);

  // Signals the active search of `requester`; false when there is none.
  bool Cancel(const std::string& requester);
  void CancelAll();

  void RecordProviderSession(const std::string& requester, const std::string& session_id);
  void ForgetProviderSession(const std::string& requester, const std::string& session_id);
  std::vector<std::string> ProviderSessions(const std::string& requester);

  size_t ActiveCount(Activity activity);

 private:
  friend class RequesterSlot;

  struct Entry {
    bool                  search_active{false};
    bool                  verify_active{false};
    CancelFlag            search_cancel;
    std::set<std::string> provider_sessions;
  };

  void Release(const std::string& requester, Activity activity);
  void EraseIfIdle(std::unordered_map<std::string, Entry>::iterator it);

  std::mutex                             mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace trackmatch::session
