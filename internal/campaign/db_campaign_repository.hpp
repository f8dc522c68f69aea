#pragma once

#include <memory>

#include "internal/campaign/campaign_repository.hpp"
#include "internal/db/api/repository.hpp"

namespace repricer::campaign {

// CampaignRepository over the shared store; definitions are kept as protobuf JSON.
class DbCampaignRepository final : public CampaignRepository {
 public:
  explicit DbCampaignRepository(std::shared_ptr<db::Repository> repository, util::ClockFn clock = util::Now);

  std::vector<repricer::engine::v1::Campaign> FindActiveCampaigns(const std::string& shop) override;

  void IncrementTriggerCount(const std::string& campaign_id, util::TimePoint at) override;

  repricer::engine::v1::Campaign PutCampaign(const repricer::engine::v1::Campaign& campaign) override;

  std::optional<repricer::engine::v1::Campaign> GetCampaign(const std::string& campaign_id) override;

 private:
  static repricer::engine::v1::Campaign FromRecord(const db::model::CampaignRecord& record);

  std::shared_ptr<db::Repository> repository_;
  util::ClockFn                   clock_;
};

} // namespace repricer::campaign
