#include "match_server.hpp"
#include "grpc_error.hpp"

namespace trackmatch::grpc {

MatchServer::MatchServer(std::shared_ptr<trackmatch::service::MatchService> svc)
    : service_(std::move(svc)) {}

::grpc::Status MatchServer::FindCandidates(::grpc::ServerContext* ctx,
                                           const trackmatch::v1::FindCandidatesRequest* req,
                                           trackmatch::v1::FindCandidatesResponse* resp) {
  try {
    *resp = service_->FindCandidates(*req, [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MatchServer::Verify(::grpc::ServerContext* ctx,
                                   const trackmatch::v1::VerifyRequest* req,
                                   trackmatch::v1::VerifyResponse* resp) {
  try {
    *resp = service_->Verify(*req, [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MatchServer::CancelSearch(::grpc::ServerContext*,
                                         const trackmatch::v1::CancelSearchRequest* req,
                                         trackmatch::v1::CancelSearchResponse* resp) {
  try {
    *resp = service_->CancelSearch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
