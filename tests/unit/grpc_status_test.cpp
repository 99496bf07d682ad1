#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/match_server.hpp"
#include "internal/service/match_service.hpp"
#include "internal/util/errors.hpp"
#include "pipeline_harness.hpp"
#include "trackmatch/v1.hpp"

namespace {

using trackmatch::grpc::ToStatus;
using namespace trackmatch::util;

void TestErrorMapping() {
  assert(ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(RequesterBusy("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(ProviderError("x", 502)).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(DecodeError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(Cancelled("x")).error_code() == ::grpc::StatusCode::CANCELLED);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(RequesterBusy("search in progress")).error_message() == "search in progress");
}

std::unique_ptr<trackmatch::grpc::MatchServer> BuildServer(trackmatch::testing::PipelineHarness& h) {
  auto service = std::make_shared<trackmatch::service::MatchService>(h.Context());
  return std::make_unique<trackmatch::grpc::MatchServer>(service);
}

void TestFindWithoutRequesterReturnsInvalidArgument() {
  trackmatch::testing::PipelineHarness h;
  auto                                 server = BuildServer(h);

  trackmatch::v1::FindCandidatesRequest req;
  req.mutable_reference()->set_title("Song");
  trackmatch::v1::FindCandidatesResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  const auto status = server->FindCandidates(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestVerifyWithoutSourceReturnsInvalidArgument() {
  trackmatch::testing::PipelineHarness h;
  auto                                 server = BuildServer(h);

  trackmatch::v1::VerifyRequest req;
  req.set_requester("alice");
  trackmatch::v1::VerifyResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  const auto status = server->Verify(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCancelWithoutSearchIsOk() {
  trackmatch::testing::PipelineHarness h;
  auto                                 server = BuildServer(h);

  trackmatch::v1::CancelSearchRequest req;
  req.set_requester("alice");
  trackmatch::v1::CancelSearchResponse resp;
  ::grpc::ServerContext                grpc_ctx;

  const auto status = server->CancelSearch(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.cancelled());
}

} // namespace

int main() {
  TestErrorMapping();
  TestFindWithoutRequesterReturnsInvalidArgument();
  TestVerifyWithoutSourceReturnsInvalidArgument();
  TestCancelWithoutSearchIsOk();

  std::cout << "trackmatch_unit_grpc_status: pass\n";
  return 0;
}
