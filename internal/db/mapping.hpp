#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/model/delivery_record.hpp"
#include "internal/db/model/quote_record.hpp"
#include "internal/db/model/schedule_record.hpp"
#include "internal/model/delivery.hpp"
#include "internal/model/quote.hpp"
#include "internal/model/schedule.hpp"

namespace quotecast::db {

/*
  Row <-> domain conversion.

  Rows keep timestamps as unix milliseconds and sets as sorted vectors;
  FromRecord throws util::PersistenceFailure on values no writer produces.
*/

model::ScheduleRecord     ToRecord(const quotecast::model::Schedule& schedule);
quotecast::model::Schedule FromRecord(const model::ScheduleRecord& record);

model::QuoteRecord      ToRecord(const quotecast::model::Quote& quote);
quotecast::model::Quote FromRecord(const model::QuoteRecord& record);

model::DeliveryRecord            ToRecord(const quotecast::model::DeliveryRecord& delivery);
quotecast::model::DeliveryRecord FromRecord(const model::DeliveryRecord& record);

/*
  Result -> util exception, for callers that propagate by throwing.

    NotFound                         -> util::NotFound
    AlreadyExists / Constraint...    -> util::AlreadyExists
    Conflict / Busy                  -> util::Conflict
    anything else                    -> util::PersistenceFailure
*/
void ThrowIfError(const Result& result, const std::string& what);

} // namespace quotecast::db
