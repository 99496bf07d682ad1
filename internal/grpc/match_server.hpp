#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/match_service.hpp"
#include "trackmatch/v1.hpp"

namespace trackmatch::grpc {

class MatchServer final : public trackmatch::v1::MatchService::Service {
public:
  explicit MatchServer(std::shared_ptr<trackmatch::service::MatchService> svc);

  ::grpc::Status FindCandidates(::grpc::ServerContext*,
                                const trackmatch::v1::FindCandidatesRequest*,
                                trackmatch::v1::FindCandidatesResponse*) override;

  ::grpc::Status Verify(::grpc::ServerContext*,
                        const trackmatch::v1::VerifyRequest*,
                        trackmatch::v1::VerifyResponse*) override;

  ::grpc::Status CancelSearch(::grpc::ServerContext*,
                              const trackmatch::v1::CancelSearchRequest*,
                              trackmatch::v1::CancelSearchResponse*) override;

private:
  std::shared_ptr<trackmatch::service::MatchService> service_;
};

}
