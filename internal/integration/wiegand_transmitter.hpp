#pragma once

#include <bitset>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "access_forwarder.hpp"
#include "internal/barrier/actuator.hpp"

namespace lotgate::integration {

// Bits in wire order: even parity, 8-bit facility code, 16-bit card number,
// odd parity. Index 0 goes out first.
using WiegandFrame = std::bitset<26>;

// Card number for a plate: h = h * 31 + c over its characters, mod 2^16.
uint16_t PlateToCardNumber(const std::string& plate);

// Even parity covers frame bits 1..12, odd parity covers bits 13..24.
WiegandFrame EncodeWiegand26(uint8_t facility_code, uint16_t card_number);

std::string FrameToString(const WiegandFrame& frame);

struct WiegandOptions {
  uint8_t                   facility_code = 1;
  std::chrono::microseconds pulse_width{100};
  std::chrono::microseconds pulse_interval{2000};
};

/*
  Wiegand-26 sender for card-reader inputs of access controllers.

  DATA0 and DATA1 idle high. A 0 bit pulses DATA0 low for pulse_width, a 1
  bit pulses DATA1; bits are pulse_interval apart. The lines are plain
  output pins driven through the actuator interface (Raise = high).

  Without lines the frame is only logged. One frame is on the wire at a
  time.
*/
class WiegandTransmitter final : public AccessForwarder {
 public:
  WiegandTransmitter(barrier::ActuatorPtr data0, barrier::ActuatorPtr data1, WiegandOptions options);

  void Forward(const std::string& plate) override;

  uint64_t FramesSent() const {
    return frames_sent_;
  }

 private:
  void SendBit(bool bit);

  barrier::ActuatorPtr data0_;
  barrier::ActuatorPtr data1_;
  WiegandOptions       options_;

  std::mutex wire_;
  uint64_t   frames_sent_ = 0;
};

} // namespace lotgate::integration
