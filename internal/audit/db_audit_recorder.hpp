#pragma once

#include <memory>

#include "internal/audit/audit_recorder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace repricer::audit {

class DbAuditRecorder final : public AuditRecorder {
 public:
  explicit DbAuditRecorder(std::shared_ptr<db::Repository> repository, util::ClockFn clock = util::Now);

  void RecordPriceChange(const PriceChange& change) override;

 private:
  std::shared_ptr<db::Repository> repository_;
  util::ClockFn                   clock_;
};

} // namespace repricer::audit
