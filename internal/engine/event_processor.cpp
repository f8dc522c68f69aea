#include "internal/engine/event_processor.hpp"

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

#include <chrono>
#include <utility>
#include <vector>

#include "internal/engine/target_matcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/rules/price_calculator.hpp"
#include "internal/rules/prioritizer.hpp"
#include "internal/util/errors.hpp"

namespace repricer::engine {

using namespace repricer::engine::v1;
using repricer::observability::BoolField;
using repricer::observability::DoubleField;
using repricer::observability::IntField;
using repricer::observability::StringField;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

CampaignResult MakeResult(const Campaign& campaign, CampaignResultStatus status, const std::string& reason) {
  CampaignResult result;
  result.set_campaign_id(campaign.id());
  result.set_campaign_name(campaign.name());
  result.set_status(status);
  result.set_reason(reason);
  return result;
}

} // namespace

EventProcessor::EventProcessor(EngineContext context, EngineOptions options, util::ClockFn clock)
    : context_(std::move(context)),
      options_(std::move(options)),
      clock_(std::move(clock)),
      extractor_(context_.gateway),
      rng_(std::random_device{}()) {
}

EngineStats EventProcessor::Stats() const {
  EngineStats stats;
  stats.events_received  = events_received_.load();
  stats.events_processed = events_processed_.load();
  stats.price_updates    = price_updates_.load();
  stats.failures         = failures_.load();
  stats.skipped          = skipped_.load();
  return stats;
}

ProcessingOutcome EventProcessor::Process(const InventoryChangeEvent& event) {
  repricer::observability::SpanScope span("EventProcessor.Process");
  span.SetAttribute("message_id", event.message_id());
  span.SetAttribute("topic", event.topic());
  span.SetAttribute("shop", event.shop_domain());

  const auto started_at = std::chrono::steady_clock::now();
  ++events_received_;

  ProcessingOutcome outcome;
  outcome.set_message_id(event.message_id());
  outcome.set_topic(event.topic());

  try {
    Run(event, &outcome);
  } catch (const std::exception& ex) {
    ++failures_;
    span.RecordException(ex.what());
    REPRICER_LOG_ERROR("event processing failed", {StringField("message_id", event.message_id()), StringField("topic", event.topic()),
                                                   StringField("error", ex.what())});
    repricer::observability::Metrics::Instance().RecordEventOutcome("ERROR");
    repricer::observability::Metrics::Instance().ObserveEventLatencyMs(ElapsedMs(started_at));
    throw;
  }

  outcome.set_processing_time_ms(ElapsedMs(started_at));
  if (outcome.status() == OUTCOME_STATUS_PROCESSED) {
    ++events_processed_;
  } else {
    ++skipped_;
  }

  const auto& status_name = OutcomeStatus_Name(outcome.status());
  span.SetAttribute("outcome", status_name);
  repricer::observability::Metrics::Instance().RecordEventOutcome(status_name);
  repricer::observability::Metrics::Instance().ObserveEventLatencyMs(outcome.processing_time_ms());

  REPRICER_LOG_INFO("event processed", {StringField("message_id", event.message_id()), StringField("topic", event.topic()),
                                        StringField("outcome", status_name), StringField("variant_id", outcome.variant_id()),
                                        IntField("updated", outcome.updated()), IntField("failed", outcome.failed()),
                                        DoubleField("elapsed_ms", outcome.processing_time_ms())});
  return outcome;
}

void EventProcessor::Run(const InventoryChangeEvent& event, ProcessingOutcome* outcome) {
  auto message_lock = context_.locks->Acquire(lock::LockManager::WebhookKey(event.message_id()), LOCK_TYPE_WEBHOOK_PROCESSING,
                                              options_.message_lock_ttl);
  if (!message_lock) {
    outcome->set_status(OUTCOME_STATUS_ALREADY_PROCESSED);
    return;
  }

  MaybeCleanup();

  if (IsSelfEcho(event)) {
    outcome->set_status(OUTCOME_STATUS_SELF_ECHO);
    outcome->set_detail("recent price update by this engine");
    return;
  }

  auto campaigns = context_.campaigns->FindActiveCampaigns(event.shop_domain());
  if (campaigns.empty()) {
    outcome->set_status(OUTCOME_STATUS_NO_ACTIVE_CAMPAIGNS);
    return;
  }

  auto extraction = extractor_.Extract(event);
  if (extraction.status == ExtractionStatus::kUnsupportedTopic) {
    REPRICER_LOG_WARN("unsupported topic", {StringField("message_id", event.message_id()), StringField("topic", event.topic())});
    outcome->set_status(OUTCOME_STATUS_UNSUPPORTED_TOPIC);
    outcome->set_detail(extraction.detail);
    return;
  }
  if (extraction.status == ExtractionStatus::kFailed) {
    REPRICER_LOG_WARN("variant extraction failed",
                      {StringField("message_id", event.message_id()), StringField("topic", event.topic()), StringField("detail", extraction.detail)});
    outcome->set_status(OUTCOME_STATUS_EXTRACTION_FAILED);
    outcome->set_detail(extraction.detail);
    return;
  }

  const auto& variant_id = extraction.variant.variant_id;
  outcome->set_variant_id(variant_id);
  outcome->set_product_id(extraction.variant.product_id);

  auto variant_lock = context_.locks->Acquire(lock::LockManager::VariantKey(variant_id), LOCK_TYPE_CAMPAIGN_EXECUTION, options_.variant_lock_ttl);
  if (!variant_lock) {
    outcome->set_status(OUTCOME_STATUS_VARIANT_LOCKED);
    return;
  }

  if (context_.cooldowns->IsSuppressed(variant_id, COOLDOWN_TYPE_PRICE_UPDATE)) {
    outcome->set_status(OUTCOME_STATUS_VARIANT_COOLDOWN);
    return;
  }

  cooldown::CooldownReservation reservation(*context_.cooldowns, variant_id, COOLDOWN_TYPE_PRICE_UPDATE, options_.price_update_cooldown);

  auto details = std::move(extraction.variant.details);
  if (!details) {
    details = context_.gateway->GetVariant(event.shop_domain(), variant_id);
  }
  if (!details) {
    REPRICER_LOG_WARN("variant not found on platform", {StringField("message_id", event.message_id()), StringField("variant_id", variant_id)});
    outcome->set_status(OUTCOME_STATUS_EXTRACTION_FAILED);
    outcome->set_detail("variant not found: " + variant_id);
    return;
  }
  if (outcome->product_id().empty()) {
    outcome->set_product_id(details->product_id());
  }

  outcome->set_status(OUTCOME_STATUS_PROCESSED);

  if (!details->inventory_tracked()) {
    for (const auto& campaign : campaigns) {
      *outcome->add_campaigns() = MakeResult(campaign, CAMPAIGN_RESULT_STATUS_SKIPPED, "inventory not tracked");
      outcome->set_skipped(outcome->skipped() + 1);
    }
    outcome->set_processed(static_cast<uint32_t>(campaigns.size()));
    outcome->set_success(false);
    return;
  }

  const auto snapshot = context_.capturer->Capture(*details, extraction.variant.inventory, "webhook_update");

  VariantView view;
  view.shop       = event.shop_domain();
  view.message_id = event.message_id();
  view.variant_id = variant_id;
  view.product_id = outcome->product_id();
  view.price      = snapshot.price;
  view.compare_at = snapshot.compare_at_price;

  for (const auto& campaign : campaigns) {
    const auto     started_at = std::chrono::steady_clock::now();
    CampaignResult result;
    try {
      result = EvaluateCampaign(campaign, *details, snapshot, &view);
    } catch (const std::exception& ex) {
      REPRICER_LOG_ERROR("campaign evaluation failed", {StringField("message_id", event.message_id()), StringField("campaign_id", campaign.id()),
                                                        StringField("variant_id", variant_id), StringField("error", ex.what())});
      result = MakeResult(campaign, CAMPAIGN_RESULT_STATUS_FAILED, "evaluation error");
      result.add_errors(ex.what());
    }
    result.set_processing_time_ms(ElapsedMs(started_at));

    switch (result.status()) {
      case CAMPAIGN_RESULT_STATUS_UPDATED:
        outcome->set_updated(outcome->updated() + 1);
        break;
      case CAMPAIGN_RESULT_STATUS_FAILED:
        outcome->set_failed(outcome->failed() + 1);
        ++failures_;
        break;
      case CAMPAIGN_RESULT_STATUS_SKIPPED:
      case CAMPAIGN_RESULT_STATUS_NOT_TARGETED:
        outcome->set_skipped(outcome->skipped() + 1);
        break;
      default:
        break;
    }
    outcome->set_processed(outcome->processed() + 1);
    *outcome->add_campaigns() = std::move(result);
  }

  outcome->set_success(outcome->updated() > 0);
  if (outcome->updated() > 0) {
    reservation.Commit();
  }
}

bool EventProcessor::IsSelfEcho(const InventoryChangeEvent& event) {
  // products/create always carries a fresh updated_at.
  if (event.topic() != kTopicProductsUpdate) {
    return false;
  }

  const auto now = clock_();
  for (const auto& variant : PayloadExtractor::ProductVariants(event.payload())) {
    if (variant.updated_at) {
      google::protobuf::Timestamp updated_at;
      if (google::protobuf::util::TimeUtil::FromString(*variant.updated_at, &updated_at)) {
        if (now - util::FromProto(updated_at) < options_.self_echo_window) {
          REPRICER_LOG_DEBUG("self echo: recent update", {StringField("variant_id", variant.variant_id), StringField("updated_at", *variant.updated_at)});
          return true;
        }
      }
    }
    if (context_.cooldowns->IsSuppressed(variant.variant_id, COOLDOWN_TYPE_PRICE_UPDATE)) {
      REPRICER_LOG_DEBUG("self echo: price cooldown", {StringField("variant_id", variant.variant_id)});
      return true;
    }
  }
  return false;
}

CampaignResult EventProcessor::EvaluateCampaign(const Campaign& campaign, const VariantDetails& details, const variant::VariantSnapshot& snapshot,
                                                VariantView* view) {
  if (context_.cooldowns->IsSuppressed(cooldown::CooldownTracker::CampaignKey(campaign.id()), COOLDOWN_TYPE_CAMPAIGN_TRIGGER)) {
    return MakeResult(campaign, CAMPAIGN_RESULT_STATUS_SKIPPED, "campaign cooldown");
  }
  if (!TargetMatches(campaign.target(), view->variant_id, view->product_id, &details)) {
    return MakeResult(campaign, CAMPAIGN_RESULT_STATUS_NOT_TARGETED, "variant not targeted");
  }

  // An earlier campaign of this event may already have moved the price.
  auto current             = snapshot;
  current.price            = view->price;
  current.compare_at_price = view->compare_at;

  bool                         degraded = false;
  std::vector<rules::RuleMatch> matches;
  for (const auto& rule : campaign.rules()) {
    auto evaluation = context_.rule_states->Evaluate(rule, campaign, current);
    degraded        = degraded || evaluation.mode == rules::EvaluationMode::kDegraded;
    if (evaluation.should_execute) {
      matches.push_back({rule, std::move(evaluation)});
    }
  }

  if (matches.empty()) {
    auto result = MakeResult(campaign, CAMPAIGN_RESULT_STATUS_NO_RULE_FIRED, "no rule crossed its threshold");
    result.set_degraded(degraded);
    return result;
  }

  const auto  ordered = rules::Prioritize(std::move(matches));
  const auto& winner  = ordered.front();

  const double old_price      = view->price;
  const double new_price      = rules::ComputePrice(old_price, winner.rule);
  const auto   new_compare_at = rules::ComputeCompareAt(view->compare_at, old_price, winner.rule);

  auto result = MakeResult(campaign, CAMPAIGN_RESULT_STATUS_UPDATED, winner.evaluation.reason);
  result.set_rule_id(winner.rule.id());
  result.set_degraded(degraded);
  result.set_old_price(old_price);
  result.set_new_price(new_price);
  if (view->compare_at) result.set_old_compare_at(*view->compare_at);
  if (new_compare_at) result.set_new_compare_at(*new_compare_at);

  PriceUpdateResult update;
  try {
    update = context_.gateway->UpdateVariantPrice(view->shop, view->product_id, view->variant_id, new_price,
                                                  winner.rule.change_compare_at() ? new_compare_at : std::nullopt);
  } catch (const repricer::util::GatewayError& ex) {
    update.set_success(false);
    update.add_errors(ex.what());
  }

  audit::PriceChange change;
  change.shop              = view->shop;
  change.variant_id        = view->variant_id;
  change.product_id        = view->product_id;
  change.campaign_id       = campaign.id();
  change.old_price         = old_price;
  change.new_price         = new_price;
  change.old_compare_at    = view->compare_at;
  change.new_compare_at    = new_compare_at;
  change.reason            = winner.evaluation.reason;
  change.source_message_id = view->message_id;
  change.success           = update.success();
  for (const auto& error : update.errors()) {
    change.error += change.error.empty() ? error : "; " + error;
  }
  RecordAudit(change);
  repricer::observability::Metrics::Instance().RecordPriceMutation(update.success());

  if (!update.success()) {
    REPRICER_LOG_WARN("price update rejected", {StringField("campaign_id", campaign.id()), StringField("variant_id", view->variant_id),
                                                 DoubleField("price", new_price), StringField("error", change.error)});
    result.set_status(CAMPAIGN_RESULT_STATUS_FAILED);
    for (const auto& error : update.errors()) {
      result.add_errors(error);
    }
    return result;
  }

  ++price_updates_;
  view->price      = new_price;
  view->compare_at = new_compare_at;

  REPRICER_LOG_INFO("price updated", {StringField("campaign_id", campaign.id()), StringField("rule_id", winner.rule.id()),
                                      StringField("variant_id", view->variant_id), DoubleField("old_price", old_price),
                                      DoubleField("new_price", new_price), BoolField("degraded", degraded)});

  // The price already changed; bookkeeping failures must not report the campaign as failed.
  // Each step runs on its own so one failure does not drop the others.
  Bookkeep("trigger count", campaign.id(), view->variant_id, [&] { context_.campaigns->IncrementTriggerCount(campaign.id(), clock_()); });
  Bookkeep("campaign cooldown", campaign.id(), view->variant_id, [&] {
    context_.cooldowns->Set(cooldown::CooldownTracker::CampaignKey(campaign.id()), COOLDOWN_TYPE_CAMPAIGN_TRIGGER, options_.campaign_cooldown,
                            campaign.id());
  });
  Bookkeep("variant cooldown", campaign.id(), view->variant_id,
           [&] { context_.cooldowns->Set(view->variant_id, COOLDOWN_TYPE_PRICE_UPDATE, options_.price_update_cooldown); });
  return result;
}

template <typename Fn>
void EventProcessor::Bookkeep(const char* step, const std::string& campaign_id, const std::string& variant_id, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& ex) {
    REPRICER_LOG_WARN("post-update bookkeeping failed", {StringField("step", step), StringField("campaign_id", campaign_id),
                                                         StringField("variant_id", variant_id), StringField("error", ex.what())});
  }
}

void EventProcessor::RecordAudit(const audit::PriceChange& change) {
  try {
    context_.audit->RecordPriceChange(change);
  } catch (const std::exception& ex) {
    REPRICER_LOG_ERROR("audit write failed",
                       {StringField("variant_id", change.variant_id), StringField("campaign_id", change.campaign_id), StringField("error", ex.what())});
  }
}

void EventProcessor::MaybeCleanup() {
  if (options_.cleanup_probability <= 0.0) {
    return;
  }

  bool run = false;
  {
    std::lock_guard<std::mutex>            lock(rng_mutex_);
    std::uniform_real_distribution<double> draw(0.0, 1.0);
    run = draw(rng_) < options_.cleanup_probability;
  }
  if (!run) {
    return;
  }

  try {
    const auto locks     = context_.locks->CleanupExpired();
    const auto cooldowns = context_.cooldowns->CleanupExpired();
    REPRICER_LOG_DEBUG("expired records removed", {IntField("locks", static_cast<int64_t>(locks)), IntField("cooldowns", static_cast<int64_t>(cooldowns))});
  } catch (const std::exception& ex) {
    REPRICER_LOG_WARN("expired record cleanup failed", {StringField("error", ex.what())});
  }
}

} // namespace repricer::engine
