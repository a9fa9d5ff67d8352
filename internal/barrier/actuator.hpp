#pragma once

#include <memory>

namespace lotgate::barrier {

/*
  Physical barrier arm. Calls block until the motion command is issued and
  throw on hardware errors.
*/
class Actuator {
 public:
  virtual ~Actuator() = default;

  virtual void Raise() = 0;
  virtual void Lower() = 0;
};

/*
  Presence/obstruction sensor under the arm. Throws when it cannot be read;
  a read failure counts as not clear.
*/
class SafetySensor {
 public:
  virtual ~SafetySensor() = default;

  virtual bool IsClear() = 0;
};

using ActuatorPtr     = std::shared_ptr<Actuator>;
using SafetySensorPtr = std::shared_ptr<SafetySensor>;

} // namespace lotgate::barrier
