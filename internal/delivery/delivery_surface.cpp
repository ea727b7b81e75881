#include "delivery_surface.hpp"

#include "internal/observability/logging.hpp"

namespace quotecast::delivery {

using observability::StringField;

void LoggingDeliverySurface::Deliver(const DeliveryNotice& notice) {
  if (model::UsesNotification(notice.method)) {
    QUOTECAST_LOG_INFO("notification", {StringField("schedule_id", notice.schedule_id), StringField("quote_id", notice.quote_id),
                                        StringField("author", notice.author), StringField("text", notice.text)});
  }
  if (model::UsesWidget(notice.method)) {
    QUOTECAST_LOG_INFO("widget updated", {StringField("schedule_id", notice.schedule_id), StringField("quote_id", notice.quote_id)});
  }
}

} // namespace quotecast::delivery
