#include "internal/campaign/db_campaign_repository.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace repricer::campaign {

using repricer::engine::v1::Campaign;

DbCampaignRepository::DbCampaignRepository(std::shared_ptr<db::Repository> repository, util::ClockFn clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

Campaign DbCampaignRepository::FromRecord(const db::model::CampaignRecord& record) {
  Campaign campaign;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(record.definition_json, &campaign, options);
  if (!status.ok()) {
    throw repricer::util::StoreUnavailable("campaign " + record.id + ": corrupt definition: " + std::string(status.message()));
  }

  campaign.set_id(record.id);
  campaign.set_shop(record.shop);
  campaign.set_status(record.status);
  campaign.set_priority(record.priority);
  campaign.set_trigger_count(record.trigger_count);
  if (record.last_triggered_at_ms > 0) {
    *campaign.mutable_last_triggered() = util::ToProto(util::FromUnixMillis(record.last_triggered_at_ms));
  } else {
    campaign.clear_last_triggered();
  }
  for (auto& rule : *campaign.mutable_rules()) {
    rule.set_campaign_id(record.id);
  }
  return campaign;
}

std::vector<Campaign> DbCampaignRepository::FindActiveCampaigns(const std::string& shop) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListCampaigns(*tx, shop, repricer::engine::v1::CAMPAIGN_STATUS_ACTIVE);
  tx->Commit();

  std::vector<Campaign> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(FromRecord(record));
  }
  return out;
}

void DbCampaignRepository::IncrementTriggerCount(const std::string& campaign_id, util::TimePoint at) {
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->IncrementCampaignTriggerCount(*tx, campaign_id, util::ToUnixMillis(at)), "increment trigger count");
  tx->Commit();
}

Campaign DbCampaignRepository::PutCampaign(const Campaign& campaign) {
  auto tx       = repository_->Begin();
  auto existing = repository_->GetCampaign(*tx, campaign.id());

  Campaign definition = campaign;
  definition.clear_trigger_count();
  definition.clear_last_triggered();

  db::model::CampaignRecord record;
  record.id       = campaign.id();
  record.shop     = campaign.shop();
  record.status   = campaign.status();
  record.priority = campaign.priority();
  if (existing) {
    record.trigger_count        = existing->trigger_count;
    record.last_triggered_at_ms = existing->last_triggered_at_ms;
  }
  record.updated_at_ms = util::ToUnixMillis(clock_());

  auto status = google::protobuf::util::MessageToJsonString(definition, &record.definition_json);
  if (!status.ok()) {
    throw repricer::util::InvalidArgument("campaign " + campaign.id() + ": " + std::string(status.message()));
  }

  db::ThrowIfError(repository_->UpsertCampaign(*tx, record), "put campaign");
  tx->Commit();
  return FromRecord(record);
}

std::optional<Campaign> DbCampaignRepository::GetCampaign(const std::string& campaign_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetCampaign(*tx, campaign_id);
  tx->Commit();
  if (!record) return std::nullopt;
  return FromRecord(*record);
}

} // namespace repricer::campaign
