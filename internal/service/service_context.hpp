#pragma once

#include <memory>

namespace pipeline::context { class SystemContext; }
namespace pipeline::normalize { class DealNormalizer; }
namespace pipeline::db { class DealRepository; }

namespace pipeline::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<const pipeline::context::SystemContext> context;
  std::shared_ptr<const pipeline::normalize::DealNormalizer> normalizer;
  std::shared_ptr<pipeline::db::DealRepository> repository;
};

}
