#include "internal/model/convert.hpp"

#include "internal/model/plate.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace lotgate::model {
namespace {

void SetTime(uint64_t ms, google::protobuf::Timestamp* out) {
  *out = util::ToProto(util::FromUnixMillis(ms));
}

uint64_t GetTime(bool present, const google::protobuf::Timestamp& ts) {
  return present ? util::ToUnixMillis(util::FromProto(ts)) : 0;
}

} // namespace

lotgate::v1::ParkingSession ToProto(const db::model::SessionRecord& record) {
  lotgate::v1::ParkingSession out;
  out.set_id(record.id);
  out.set_plate(record.plate);
  if (record.entry_time_ms != 0) SetTime(record.entry_time_ms, out.mutable_entry_time());
  if (record.exit_time_ms != 0) SetTime(record.exit_time_ms, out.mutable_exit_time());
  out.set_status(record.status);
  if (record.fee_minor) {
    *out.mutable_fee() = util::ToProto(util::Money{*record.fee_minor, record.currency});
  }
  out.set_payment_method(record.payment_method);
  out.set_camera_entry_id(record.camera_entry_id);
  out.set_camera_exit_id(record.camera_exit_id);
  out.set_transaction_id(record.transaction_id);
  if (record.payment_time_ms != 0) SetTime(record.payment_time_ms, out.mutable_payment_time());
  out.set_visitor(record.visitor);
  out.set_notes(record.notes);
  return out;
}

lotgate::v1::AuthorizationRecord ToProto(const db::model::AuthorizationRecord& record) {
  lotgate::v1::AuthorizationRecord out;
  out.set_plate(record.plate);
  out.set_owner(record.owner);
  out.set_vehicle_type(record.vehicle_type);
  out.set_authorized(record.authorized);
  if (record.valid_from_ms != 0) SetTime(record.valid_from_ms, out.mutable_valid_from());
  if (record.valid_until_ms != 0) SetTime(record.valid_until_ms, out.mutable_valid_until());
  return out;
}

lotgate::v1::AccessLogEntry ToProto(const db::model::AccessLogRecord& record) {
  lotgate::v1::AccessLogEntry out;
  out.set_id(record.id);
  out.set_plate(record.plate);
  out.set_camera_id(record.camera_id);
  if (record.timestamp_ms != 0) SetTime(record.timestamp_ms, out.mutable_timestamp());
  out.set_direction(record.direction);
  out.set_granted(record.granted);
  out.set_reason(record.reason);
  out.set_confidence(record.confidence);
  out.set_image_ref(record.image_ref);
  out.set_session_id(record.session_id);
  return out;
}

db::model::AuthorizationRecord FromProto(const lotgate::v1::AuthorizationRecord& proto) {
  db::model::AuthorizationRecord record;
  record.plate          = NormalizePlate(proto.plate());
  record.owner          = proto.owner();
  record.vehicle_type   = proto.vehicle_type();
  record.authorized     = proto.authorized();
  record.valid_from_ms  = GetTime(proto.has_valid_from(), proto.valid_from());
  record.valid_until_ms = GetTime(proto.has_valid_until(), proto.valid_until());
  return record;
}

} // namespace lotgate::model
