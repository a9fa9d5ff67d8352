#include "barrier_router.hpp"

namespace lotgate::barrier {

BarrierRouter::BarrierRouter(BarrierFactory::BarrierMap barriers, const google::protobuf::RepeatedPtrField<CameraConfig>& cameras)
    : barriers_(std::move(barriers)) {
  for (const auto& camera : cameras) {
    cameras_.emplace(camera.id(), camera);
  }
}

std::optional<CameraConfig> BarrierRouter::FindCamera(const std::string& camera_id) const {
  auto it = cameras_.find(camera_id);
  if (it == cameras_.end()) return std::nullopt;
  return it->second;
}

std::shared_ptr<BarrierController> BarrierRouter::ForCamera(const std::string& camera_id) const {
  auto camera = cameras_.find(camera_id);
  if (camera != cameras_.end()) {
    return Get(camera->second.barrier_id());
  }
  if (barriers_.size() == 1) {
    return barriers_.begin()->second;
  }
  return nullptr;
}

std::shared_ptr<BarrierController> BarrierRouter::Get(const std::string& barrier_id) const {
  auto it = barriers_.find(barrier_id);
  if (it == barriers_.end()) return nullptr;
  return it->second;
}

void BarrierRouter::StartAll() {
  for (auto& [_, barrier] : barriers_) {
    barrier->Start();
  }
}

void BarrierRouter::StopAll() {
  for (auto& [_, barrier] : barriers_) {
    barrier->Stop();
  }
}

} // namespace lotgate::barrier
