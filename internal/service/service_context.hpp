#pragma once

#include <memory>

namespace trackmatch::core { class MatchPipeline; }
namespace trackmatch::session { class RequesterRegistry; }

namespace trackmatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<trackmatch::core::MatchPipeline> pipeline;
  std::shared_ptr<trackmatch::session::RequesterRegistry> registry;
};

}
