#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "internal/analysis/authenticity_analyzer.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/model/search_tier.hpp"
#include "trackmatch/v1.hpp"

using namespace trackmatch::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  trackmatchctl <addr> find <requester> <artist> <title> [duration_secs] [year]\n"
            << "  trackmatchctl <addr> verify <requester> <file>\n"
            << "  trackmatchctl <addr> cancel <requester>\n"
            << "  trackmatchctl analyze <file> [config.yaml]\n";
}

static void PrintVerdict(const AuthenticityVerdict& verdict) {
  std::cout << trackmatch::analysis::DisplayLine(verdict) << "\n"
            << "verdict=" << trackmatch::analysis::ToString(verdict.verdict()) << " cutoff_hz=" << verdict.cutoff_hz()
            << " nyquist_hz=" << verdict.nyquist_hz() << " sample_rate=" << verdict.sample_rate() << " bit_depth=" << verdict.bit_depth()
            << "\n";
  if (!verdict.rationale().empty()) {
    std::cout << "rationale: " << verdict.rationale() << "\n";
  }
}

static int Analyze(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    auto config = argc >= 4 ? trackmatch::config::ConfigLoader::LoadFromYaml(argv[3]) : trackmatch::config::ConfigLoader::Defaults();
    trackmatch::analysis::AuthenticityAnalyzer analyzer(config.analysis());
    PrintVerdict(analyzer.AnalyzeFile(argv[2]));
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc >= 2 && std::string(argv[1]) == "analyze") {
    return Analyze(argc, argv);
  }

  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr      = argv[1];
  std::string cmd       = argv[2];
  std::string requester = argv[3];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = MatchService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  if (cmd == "find") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    FindCandidatesRequest req;
    req.set_requester(requester);
    req.mutable_reference()->set_artist(argv[4]);
    req.mutable_reference()->set_title(argv[5]);
    if (argc >= 7) req.mutable_reference()->set_duration_secs(std::stod(argv[6]));
    if (argc >= 8) req.mutable_reference()->set_year(argv[7]);

    FindCandidatesResponse resp;
    auto status = stub->FindCandidates(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "tier=" << trackmatch::model::ToString(resp.summary().tier()) << " query=\"" << resp.summary().query()
              << "\" sessions=" << resp.summary().sessions_opened() << " raw=" << resp.summary().raw_result_count() << "\n";
    for (const auto& scored : resp.candidates()) {
      std::cout << std::setw(2) << scored.rank() << ". " << std::fixed << std::setprecision(2) << scored.score().total() << "  "
                << scored.candidate().username() << "  " << scored.candidate().filename() << (scored.fallback_format() ? "  [fallback]" : "")
                << "\n";
    }
    if (resp.candidates().empty()) {
      std::cout << "no match\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "verify") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    VerifyRequest req;
    req.set_requester(requester);
    req.set_file_path(argv[4]);

    VerifyResponse resp;
    auto status = stub->Verify(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintVerdict(resp.verdict());
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "cancel") {
    CancelSearchRequest req;
    req.set_requester(requester);

    CancelSearchResponse resp;
    auto status = stub->CancelSearch(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << (resp.cancelled() ? "cancelled" : "no active search") << "\n";
    return 0;
  }

  Usage();
  return 1;
}
