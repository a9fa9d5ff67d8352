#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "barrier_controller.hpp"
#include "config/config.pb.h"

namespace lotgate::barrier {

/*
  Builds one controller per configured barrier.

      auto barriers = BarrierFactory::Build(config.barriers(), on_fault);
      barriers.at("main")->RequestOpen();

  Barriers with a gpio output pin drive sysfs GPIO; the rest are simulated.
*/
class BarrierFactory {
 public:
  using BarrierMap = std::unordered_map<std::string, std::shared_ptr<BarrierController>>;

  static BarrierMap Build(const google::protobuf::RepeatedPtrField<lotgate::runtime::config::BarrierConfig>& configs,
                          const FaultListener&                                                              on_fault);
};

} // namespace lotgate::barrier
