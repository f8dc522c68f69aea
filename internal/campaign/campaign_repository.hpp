#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "repricer/engine/v1/campaign.pb.h"

namespace repricer::campaign {

/*
  Campaign source for the engine.

  FindActiveCampaigns returns ACTIVE campaigns of one shop with their
  rules, ordered by (priority, id). The engine only ever writes the
  trigger counters.
*/
class CampaignRepository {
 public:
  virtual ~CampaignRepository() = default;

  virtual std::vector<repricer::engine::v1::Campaign> FindActiveCampaigns(const std::string& shop) = 0;

  virtual void IncrementTriggerCount(const std::string& campaign_id, util::TimePoint at) = 0;

  // Insert or replace. Trigger counters of an existing campaign are kept.
  virtual repricer::engine::v1::Campaign PutCampaign(const repricer::engine::v1::Campaign& campaign) = 0;

  virtual std::optional<repricer::engine::v1::Campaign> GetCampaign(const std::string& campaign_id) = 0;
};

} // namespace repricer::campaign
