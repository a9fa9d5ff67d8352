#include "wiegand_transmitter.hpp"

#include <thread>

#include "internal/observability/logging.hpp"

namespace lotgate::integration {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kFacilityBits = 8;
constexpr std::size_t kCardBits     = 16;
constexpr std::size_t kParityBits   = 12;

} // namespace

uint16_t PlateToCardNumber(const std::string& plate) {
  uint32_t hash = 0;
  for (unsigned char c : plate) {
    hash = (hash * 31 + c) & 0xFFFF;
  }
  return static_cast<uint16_t>(hash);
}

WiegandFrame EncodeWiegand26(uint8_t facility_code, uint16_t card_number) {
  WiegandFrame frame;

  std::size_t pos = 1;
  for (std::size_t i = kFacilityBits; i-- > 0;) {
    frame[pos++] = (facility_code >> i) & 1;
  }
  for (std::size_t i = kCardBits; i-- > 0;) {
    frame[pos++] = (card_number >> i) & 1;
  }

  std::size_t leading = 0;
  std::size_t trailing = 0;
  for (std::size_t i = 0; i < kParityBits; ++i) {
    leading += frame[1 + i];
    trailing += frame[1 + kParityBits + i];
  }
  frame[0]  = leading % 2 == 1;
  frame[25] = trailing % 2 == 0;
  return frame;
}

std::string FrameToString(const WiegandFrame& frame) {
  std::string out;
  out.reserve(frame.size());
  for (std::size_t i = 0; i < frame.size(); ++i) {
    out.push_back(frame[i] ? '1' : '0');
  }
  return out;
}

WiegandTransmitter::WiegandTransmitter(barrier::ActuatorPtr data0, barrier::ActuatorPtr data1, WiegandOptions options)
    : data0_(std::move(data0)), data1_(std::move(data1)), options_(options) {
  if (data0_ && data1_) {
    data0_->Raise();
    data1_->Raise();
  }
  LOTGATE_LOG_INFO("wiegand transmitter ready", {IntField("facility_code", options_.facility_code),
                                                 StringField("lines", data0_ && data1_ ? "gpio" : "simulated")});
}

void WiegandTransmitter::Forward(const std::string& plate) {
  const auto card  = PlateToCardNumber(plate);
  const auto frame = EncodeWiegand26(options_.facility_code, card);

  std::lock_guard<std::mutex> lock(wire_);
  if (data0_ && data1_) {
    for (std::size_t i = 0; i < frame.size(); ++i) {
      SendBit(frame[i]);
    }
  }
  ++frames_sent_;

  LOTGATE_LOG_INFO("plate forwarded as wiegand-26",
                   {StringField("plate", plate), IntField("facility_code", options_.facility_code), IntField("card", card),
                    StringField("frame", FrameToString(frame))});
}

void WiegandTransmitter::SendBit(bool bit) {
  auto& line = bit ? data1_ : data0_;
  line->Lower();
  std::this_thread::sleep_for(options_.pulse_width);
  line->Raise();
  std::this_thread::sleep_for(options_.pulse_interval);
}

} // namespace lotgate::integration
