#include "requester_registry.hpp"

#include "internal/util/errors.hpp"

namespace trackmatch::session {

// ------------------------------------------------------------
// RequesterSlot
// ------------------------------------------------------------

RequesterSlot::RequesterSlot(RequesterRegistry* registry, std::string requester, Activity activity, CancelFlag cancel)
    : registry_(registry), requester_(std::move(requester)), activity_(activity), cancel_(std::move(cancel)) {
}

RequesterSlot::~RequesterSlot() {
  Release();
}

RequesterSlot::RequesterSlot(RequesterSlot&& other) noexcept
    : registry_(other.registry_), requester_(std::move(other.requester_)), activity_(other.activity_), cancel_(std::move(other.cancel_)) {
  other.registry_ = nullptr;
}

RequesterSlot& RequesterSlot::operator=(RequesterSlot&& other) noexcept {
  if (this != &other) {
    Release();
    registry_       = other.registry_;
    requester_      = std::move(other.requester_);
    activity_       = other.activity_;
    cancel_         = std::move(other.cancel_);
    other.registry_ = nullptr;
  }
  return *this;
}

void RequesterSlot::Release() {
  if (registry_) {
    registry_->Release(requester_, activity_);
    registry_ = nullptr;
  }
}

// ------------------------------------------------------------
// RequesterRegistry
// ------------------------------------------------------------

RequesterSlot RequesterRegistry::Acquire(const std::string& requester, Activity activity) {
  std::lock_guard lock(mutex_);

  auto& entry = entries_[requester];
  if (activity == Activity::kSearch) {
    if (entry.search_active) {
      throw util::RequesterBusy("requester busy: search already in progress for " + requester);
    }
    entry.search_active = true;
    entry.search_cancel = std::make_shared<std::atomic<bool>>(false);
    return RequesterSlot(this, requester, activity, entry.search_cancel);
  }

  if (entry.verify_active) {
    throw util::RequesterBusy("requester busy: verification already in progress for " + requester);
  }
  entry.verify_active = true;
  return RequesterSlot(this, requester, activity, std::make_shared<std::atomic<bool>>(false));
}

bool RequesterRegistry::IsActive(const std::string& requester, Activity activity) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(requester);
  if (it == entries_.end()) return false;
  return activity == Activity::kSearch ? it->second.search_active : it->second.verify_active;
}

bool RequesterRegistry::Cancel(const std::string& requester) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(requester);
  if (it == entries_.end() || !it->second.search_active || !it->second.search_cancel) return false;

  it->second.search_cancel->store(true);
  return true;
}

void RequesterRegistry::CancelAll() {
  std::lock_guard lock(mutex_);

  for (auto& [requester, entry] : entries_) {
    if (entry.search_active && entry.search_cancel) entry.search_cancel->store(true);
  }
}

void RequesterRegistry::RecordProviderSession(const std::string& requester, const std::string& session_id) {
  std::lock_guard lock(mutex_);
  entries_[requester].provider_sessions.insert(session_id);
}

void RequesterRegistry::ForgetProviderSession(const std::string& requester, const std::string& session_id) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(requester);
  if (it == entries_.end()) return;
  it->second.provider_sessions.erase(session_id);
  EraseIfIdle(it);
}

std::vector<std::string> RequesterRegistry::ProviderSessions(const std::string& requester) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(requester);
  if (it == entries_.end()) return {};
  return {it->second.provider_sessions.begin(), it->second.provider_sessions.end()};
}

size_t RequesterRegistry::ActiveCount(Activity activity) {
  std::lock_guard lock(mutex_);

  size_t count = 0;
  for (const auto& [requester, entry] : entries_) {
    if (activity == Activity::kSearch ? entry.search_active : entry.verify_active) ++count;
  }
  return count;
}

void RequesterRegistry::Release(const std::string& requester, Activity activity) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(requester);
  if (it == entries_.end()) return;

  if (activity == Activity::kSearch) {
    it->second.search_active = false;
    it->second.search_cancel.reset();
  } else {
    it->second.verify_active = false;
  }
  EraseIfIdle(it);
}

void RequesterRegistry::EraseIfIdle(std::unordered_map<std::string, Entry>::iterator it) {
  const auto& entry = it->second;
  if (!entry.search_active && !entry.verify_active && entry.provider_sessions.empty()) {
    entries_.erase(it);
  }
}

} // namespace trackmatch::session
