#pragma once

#include <memory>

namespace repricer::engine {
class EventProcessor;
}
namespace repricer::campaign {
class CampaignRepository;
}
namespace repricer::cooldown {
class CooldownTracker;
}
namespace repricer::lock {
class LockManager;
}
namespace repricer::db {
class Repository;
}
namespace repricer::rollback {
class CampaignRollback;
}

namespace repricer::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<repricer::engine::EventProcessor>     processor;
  std::shared_ptr<repricer::campaign::CampaignRepository> campaigns;
  std::shared_ptr<repricer::cooldown::CooldownTracker>  cooldowns;
  std::shared_ptr<repricer::lock::LockManager>          locks;
  std::shared_ptr<repricer::db::Repository>             repository;
  std::shared_ptr<repricer::rollback::CampaignRollback> rollback;
};

} // namespace repricer::service
