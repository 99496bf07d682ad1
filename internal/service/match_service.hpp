#pragma once

#include <atomic>
#include <functional>

#include "service_context.hpp"
#include "trackmatch/v1.hpp"

namespace trackmatch::service {

/*
  Transport-independent MatchService.

  `client_gone` is polled while a call waits; when it turns true a search
  is cancelled cooperatively (provider cleanup still runs) and a
  verification is abandoned. Either way the call throws util::Cancelled.
*/
class MatchService {
public:
  using CancelCheck = std::function<bool()>;

  explicit MatchService(ServiceContext ctx);

  trackmatch::v1::FindCandidatesResponse
  FindCandidates(const trackmatch::v1::FindCandidatesRequest& req, const CancelCheck& client_gone = {});

  trackmatch::v1::VerifyResponse
  Verify(const trackmatch::v1::VerifyRequest& req, const CancelCheck& client_gone = {});

  trackmatch::v1::CancelSearchResponse
  CancelSearch(const trackmatch::v1::CancelSearchRequest& req);

  // Rejects new calls and cancels every running search.
  void Shutdown();

private:
  void PublishActivity() const;

  ServiceContext ctx_;
  std::atomic<bool> shutting_down_{false};
};

}
