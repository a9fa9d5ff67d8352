#include "internal/events/domain_events.hpp"

namespace lotgate::events {

DomainEvent MakeAccessGranted(const std::string& plate, const std::string& camera_id, util::TimePoint at,
                              const std::string& session_id) {
  DomainEvent event;
  auto*       granted = event.mutable_access_granted();
  granted->set_plate(plate);
  granted->set_camera_id(camera_id);
  *granted->mutable_timestamp() = util::ToProto(at);
  granted->set_session_id(session_id);
  return event;
}

DomainEvent MakeAccessDenied(const std::string& plate, const std::string& camera_id, lotgate::v1::DecisionReason reason,
                             util::TimePoint at) {
  DomainEvent event;
  auto*       denied = event.mutable_access_denied();
  denied->set_plate(plate);
  denied->set_reason(reason);
  *denied->mutable_timestamp() = util::ToProto(at);
  denied->set_camera_id(camera_id);
  return event;
}

DomainEvent MakeSessionOpened(const std::string& session_id, const std::string& plate, util::TimePoint entry_time) {
  DomainEvent event;
  auto*       opened = event.mutable_session_opened();
  opened->set_session_id(session_id);
  opened->set_plate(plate);
  *opened->mutable_entry_time() = util::ToProto(entry_time);
  return event;
}

DomainEvent MakeSessionPaymentDue(const std::string& session_id, const std::string& plate, const util::Money& fee) {
  DomainEvent event;
  auto*       due = event.mutable_session_payment_due();
  due->set_session_id(session_id);
  *due->mutable_fee() = util::ToProto(fee);
  due->set_plate(plate);
  return event;
}

DomainEvent MakeSessionClosed(const std::string& session_id, const std::string& plate, util::TimePoint exit_time,
                              const util::Money& fee, const std::string& payment_method) {
  DomainEvent event;
  auto*       closed = event.mutable_session_closed();
  closed->set_session_id(session_id);
  closed->set_plate(plate);
  *closed->mutable_exit_time() = util::ToProto(exit_time);
  *closed->mutable_fee()       = util::ToProto(fee);
  closed->set_payment_method(payment_method);
  return event;
}

DomainEvent MakeBarrierFault(const std::string& barrier_id, const std::string& reason, util::TimePoint at) {
  DomainEvent event;
  auto*       fault = event.mutable_barrier_fault();
  fault->set_reason(reason);
  *fault->mutable_timestamp() = util::ToProto(at);
  fault->set_barrier_id(barrier_id);
  return event;
}

DomainEvent MakeOperatorAlert(lotgate::v1::AlertCode code, const std::string& plate, const std::string& session_id,
                              const std::string& message, util::TimePoint at) {
  DomainEvent event;
  auto*       alert = event.mutable_operator_alert();
  alert->set_code(code);
  alert->set_plate(plate);
  alert->set_session_id(session_id);
  alert->set_message(message);
  *alert->mutable_timestamp() = util::ToProto(at);
  return event;
}

} // namespace lotgate::events
