#pragma once

#include "lotgate/v1/access_service.pb.h"
#include "service_context.hpp"

namespace lotgate::service {

/*
  Detection intake for camera adapters plus session lookups.
*/
class AccessService {
 public:
  explicit AccessService(ServiceContext ctx);

  lotgate::v1::SubmitDetectionResponse SubmitDetection(const lotgate::v1::SubmitDetectionRequest& req);

  lotgate::v1::GetSessionResponse GetSession(const lotgate::v1::GetSessionRequest& req);
  lotgate::v1::GetSessionResponse FindOpenSession(const lotgate::v1::FindOpenSessionRequest& req);
  lotgate::v1::GetSessionResponse PayAtStation(const lotgate::v1::PayAtStationRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace lotgate::service
