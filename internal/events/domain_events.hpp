#pragma once

#include <string>

#include "internal/util/money.hpp"
#include "internal/util/time.hpp"
#include "lotgate/v1/events.pb.h"

namespace lotgate::events {

using lotgate::v1::DomainEvent;

DomainEvent MakeAccessGranted(const std::string& plate, const std::string& camera_id, util::TimePoint at,
                              const std::string& session_id);
DomainEvent MakeAccessDenied(const std::string& plate, const std::string& camera_id, lotgate::v1::DecisionReason reason,
                             util::TimePoint at);
DomainEvent MakeSessionOpened(const std::string& session_id, const std::string& plate, util::TimePoint entry_time);
DomainEvent MakeSessionPaymentDue(const std::string& session_id, const std::string& plate, const util::Money& fee);
DomainEvent MakeSessionClosed(const std::string& session_id, const std::string& plate, util::TimePoint exit_time,
                              const util::Money& fee, const std::string& payment_method);
DomainEvent MakeBarrierFault(const std::string& barrier_id, const std::string& reason, util::TimePoint at);
DomainEvent MakeOperatorAlert(lotgate::v1::AlertCode code, const std::string& plate, const std::string& session_id,
                              const std::string& message, util::TimePoint at);

} // namespace lotgate::events
