#pragma once

#include <string>

#include "internal/model/delivery_method.hpp"
#include "internal/util/time.hpp"

namespace quotecast::delivery {

struct DeliveryNotice {
  std::string           schedule_id;
  std::string           quote_id;
  model::DeliveryMethod method = model::DeliveryMethod::kBoth;
  std::string           text;
  std::string           author;
  util::TimePoint       delivered_at{};
};

/*
  Where a chosen quote ends up (notification, widget, ...).

  Called after the delivery is committed. Implementations may throw; the
  caller logs the failure and the delivery stays recorded.
*/
class DeliverySurface {
 public:
  virtual ~DeliverySurface() = default;

  virtual void Deliver(const DeliveryNotice& notice) = 0;
};

// Writes one info line per surface the schedule's method selects.
class LoggingDeliverySurface final : public DeliverySurface {
 public:
  void Deliver(const DeliveryNotice& notice) override;
};

} // namespace quotecast::delivery
