#pragma once

#include <memory>
#include <string>

namespace lotgate::integration {

/*
  Hands a plate to an external access controller, which makes the decision
  and drives its own barrier.

  Forward() blocks until the plate is on the wire and throws
  util::BarrierFault when an output line cannot be driven.
*/
class AccessForwarder {
 public:
  virtual ~AccessForwarder() = default;

  virtual void Forward(const std::string& plate) = 0;
};

using AccessForwarderPtr = std::shared_ptr<AccessForwarder>;

} // namespace lotgate::integration
