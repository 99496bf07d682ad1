#include "match_service.hpp"

#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

#include "internal/core/match_pipeline.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/session/requester_registry.hpp"
#include "internal/util/errors.hpp"

namespace trackmatch::service {

using namespace trackmatch::v1;

namespace {

constexpr std::chrono::milliseconds kWaitSlice{100};

double MillisSince(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& requester, Fn&& fn) {
  trackmatch::observability::SpanScope span(route);
  span.SetAttribute("requester", requester);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    trackmatch::observability::Metrics::Instance().RecordRpc(route, true, MillisSince(started_at));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    TRACKMATCH_LOG_ERROR("RPC failed", {trackmatch::observability::StringField("route", route), trackmatch::observability::StringField("error", ex.what()),
                                        trackmatch::observability::StringField("requester", requester)});
    trackmatch::observability::Metrics::Instance().RecordRpc(route, false, MillisSince(started_at));
    throw;
  }
}

void RequireRequester(const std::string& requester) {
  if (requester.empty()) {
    throw trackmatch::util::InvalidArgument("requester is required");
  }
}

void ValidateReference(const TrackReference& reference) {
  if (reference.artist().empty() && reference.title().empty()) {
    throw trackmatch::util::InvalidArgument("reference needs an artist or a title");
  }
  if (reference.duration_secs() < 0) {
    throw trackmatch::util::InvalidArgument("reference duration must not be negative");
  }
}

// Waits for `future`, polling `client_gone` between slices. `on_gone` runs
// once; when it returns false the wait is abandoned.
template <typename T>
T Await(std::future<T>& future, const MatchService::CancelCheck& client_gone, const std::function<bool()>& on_gone) {
  bool signalled = false;
  while (future.wait_for(kWaitSlice) != std::future_status::ready) {
    if (!signalled && client_gone && client_gone()) {
      signalled = true;
      if (!on_gone()) {
        throw trackmatch::util::Cancelled("client went away");
      }
    }
  }

  try {
    return future.get();
  } catch (const std::future_error&) {
    throw trackmatch::util::Cancelled("request abandoned during shutdown");
  }
}

} // namespace

MatchService::MatchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.pipeline || !ctx_.registry) {
    throw std::invalid_argument("MatchService: pipeline and registry are required");
  }
}

FindCandidatesResponse MatchService::FindCandidates(const FindCandidatesRequest& req, const CancelCheck& client_gone) {
  return ObserveRpc("trackmatch.match.find_candidates", req.requester(), [&] {
    RequireRequester(req.requester());
    ValidateReference(req.reference());
    if (shutting_down_) {
      throw trackmatch::util::Cancelled("service is shutting down");
    }

    auto slot = ctx_.registry->Acquire(req.requester(), session::Activity::kSearch);
    PublishActivity();

    auto future = ctx_.pipeline->StartSearch(req.requester(), slot.Cancel(), req.reference());
    auto run    = Await(future, client_gone, [&] {
      ctx_.registry->Cancel(req.requester());
      return true;
    });

    slot.Release();
    PublishActivity();

    if (run.summary.outcome() == SEARCH_OUTCOME_CANCELLED) {
      throw trackmatch::util::Cancelled("search cancelled for " + req.requester());
    }

    auto result = ctx_.pipeline->Rank(std::move(run), req.reference());

    FindCandidatesResponse resp;
    for (auto& candidate : result.candidates) {
      *resp.add_candidates() = std::move(candidate);
    }
    *resp.mutable_summary() = std::move(result.summary);
    return resp;
  });
}

VerifyResponse MatchService::Verify(const VerifyRequest& req, const CancelCheck& client_gone) {
  return ObserveRpc("trackmatch.match.verify", req.requester(), [&] {
    RequireRequester(req.requester());
    if (shutting_down_) {
      throw trackmatch::util::Cancelled("service is shutting down");
    }

    std::future<AuthenticityVerdict> future;
    switch (req.source_case()) {
      case VerifyRequest::kFilePath:
        if (req.file_path().empty()) {
          throw trackmatch::util::InvalidArgument("file_path is empty");
        }
        break;
      case VerifyRequest::kPcm:
        break;
      default:
        throw trackmatch::util::InvalidArgument("verify needs a file_path or pcm source");
    }

    auto slot = ctx_.registry->Acquire(req.requester(), session::Activity::kVerify);
    PublishActivity();

    if (req.source_case() == VerifyRequest::kFilePath) {
      future = ctx_.pipeline->StartVerify(req.file_path());
    } else {
      const auto& pcm = req.pcm();
      future = ctx_.pipeline->StartVerify(std::vector<float>(pcm.samples().begin(), pcm.samples().end()), pcm.sample_rate(), pcm.bit_depth());
    }

    VerifyResponse resp;
    *resp.mutable_verdict() = Await(future, client_gone, [] { return false; });

    slot.Release();
    PublishActivity();
    return resp;
  });
}

CancelSearchResponse MatchService::CancelSearch(const CancelSearchRequest& req) {
  return ObserveRpc("trackmatch.match.cancel_search", req.requester(), [&] {
    RequireRequester(req.requester());

    CancelSearchResponse resp;
    resp.set_cancelled(ctx_.registry->Cancel(req.requester()));
    TRACKMATCH_LOG_INFO("Cancel requested", {trackmatch::observability::StringField("requester", req.requester()),
                                             trackmatch::observability::BoolField("active", resp.cancelled())});
    return resp;
  });
}

void MatchService::Shutdown() {
  shutting_down_ = true;
  ctx_.registry->CancelAll();
}

void MatchService::PublishActivity() const {
  auto& metrics = trackmatch::observability::Metrics::Instance();
  metrics.SetInFlight("search", static_cast<std::int64_t>(ctx_.registry->ActiveCount(session::Activity::kSearch)));
  metrics.SetInFlight("verify", static_cast<std::int64_t>(ctx_.registry->ActiveCount(session::Activity::kVerify)));
}

}
