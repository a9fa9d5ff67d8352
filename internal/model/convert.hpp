#pragma once

#include "internal/db/model/access_log_record.hpp"
#include "internal/db/model/authorization_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "lotgate/v1/types.pb.h"

namespace lotgate::model {

/*
  Row <-> wire conversions. Millisecond fields equal to 0 stay unset on the
  wire and vice versa.
*/

lotgate::v1::ParkingSession      ToProto(const db::model::SessionRecord& record);
lotgate::v1::AuthorizationRecord ToProto(const db::model::AuthorizationRecord& record);
lotgate::v1::AccessLogEntry      ToProto(const db::model::AccessLogRecord& record);

// Normalizes the plate.
db::model::AuthorizationRecord FromProto(const lotgate::v1::AuthorizationRecord& proto);

} // namespace lotgate::model
