#pragma once

#include <optional>
#include <string>

namespace repricer::audit {

enum class ChangeKind {
  kCampaignUpdate,
  kRollback,
};

struct PriceChange {
  ChangeKind            kind = ChangeKind::kCampaignUpdate;
  std::string           shop;
  std::string           variant_id;
  std::string           product_id;
  std::string           campaign_id;
  double                old_price = 0.0;
  double                new_price = 0.0;
  std::optional<double> old_compare_at;
  std::optional<double> new_compare_at;
  std::string           reason;
  std::string           source_message_id;
  bool                  success = false;
  std::string           error;
};

/*
  Write-only audit sink for price mutation attempts.

  Both successful and failed attempts are recorded. Failures to record
  are thrown; callers log them and never undo an applied price change.
*/
class AuditRecorder {
 public:
  virtual ~AuditRecorder() = default;

  virtual void RecordPriceChange(const PriceChange& change) = 0;
};

} // namespace repricer::audit
