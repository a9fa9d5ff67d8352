#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "barrier_factory.hpp"

namespace lotgate::barrier {

using lotgate::runtime::config::CameraConfig;

/*
  Camera -> barrier resolution.

  A camera drives the barrier it names. Detections from cameras missing
  from the configuration fall back to the only barrier when exactly one
  is configured.
*/
class BarrierRouter {
 public:
  BarrierRouter(BarrierFactory::BarrierMap barriers, const google::protobuf::RepeatedPtrField<CameraConfig>& cameras);

  std::optional<CameraConfig>        FindCamera(const std::string& camera_id) const;
  std::shared_ptr<BarrierController> ForCamera(const std::string& camera_id) const;
  std::shared_ptr<BarrierController> Get(const std::string& barrier_id) const;

  const BarrierFactory::BarrierMap& Barriers() const {
    return barriers_;
  }

  void StartAll();
  void StopAll();

 private:
  BarrierFactory::BarrierMap                    barriers_;
  std::unordered_map<std::string, CameraConfig> cameras_;
};

} // namespace lotgate::barrier
