#include "internal/integration/wiegand_transmitter.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

namespace {

using lotgate::integration::EncodeWiegand26;
using lotgate::integration::FrameToString;
using lotgate::integration::PlateToCardNumber;
using lotgate::integration::WiegandOptions;
using lotgate::integration::WiegandTransmitter;

// Appends its symbol to the shared wire on every low pulse.
class RecordingLine final : public lotgate::barrier::Actuator {
 public:
  RecordingLine(std::string& wire, char symbol) : wire_(wire), symbol_(symbol) {
  }

  void Raise() override {
    ++raises;
  }
  void Lower() override {
    wire_.push_back(symbol_);
  }

  int raises = 0;

 private:
  std::string& wire_;
  char         symbol_;
};

void TestCardNumberFromPlate() {
  assert(PlateToCardNumber("") == 0);
  assert(PlateToCardNumber("A") == 65);
  assert(PlateToCardNumber("ABC123") == 17072);
  assert(PlateToCardNumber("AB123") == 46705);
}

void TestParityBits() {
  // one bit set in each half: even parity 1, odd parity 0
  assert(FrameToString(EncodeWiegand26(1, 1)) == "1000000010000000000000001" "0");
  // nothing set: odd parity alone is 1
  assert(FrameToString(EncodeWiegand26(0, 0)) == "0000000000000000000000000" "1");
  assert(FrameToString(EncodeWiegand26(255, 0xFFFF)) == "0111111111111111111111111" "1");
}

void TestFrameLayout() {
  // card 17072 = 0x42B0
  const auto frame = EncodeWiegand26(1, PlateToCardNumber("ABC123"));
  assert(FrameToString(frame) == "0" "00000001" "0100001010110000" "1");
}

void TestForwardPulsesBothLines() {
  std::string wire;
  auto        data0 = std::make_shared<RecordingLine>(wire, '0');
  auto        data1 = std::make_shared<RecordingLine>(wire, '1');

  WiegandOptions options;
  options.facility_code  = 1;
  options.pulse_width    = std::chrono::microseconds(0);
  options.pulse_interval = std::chrono::microseconds(0);

  WiegandTransmitter transmitter(data0, data1, options);
  assert(data0->raises == 1 && data1->raises == 1);

  transmitter.Forward("ABC123");
  assert(wire == "0" "00000001" "0100001010110000" "1");
  assert(data0->raises + data1->raises == 2 + 26);
  assert(transmitter.FramesSent() == 1);
}

void TestSimulatedTransmitterOnlyCounts() {
  WiegandTransmitter transmitter(nullptr, nullptr, WiegandOptions{});
  transmitter.Forward("AB123");
  transmitter.Forward("AB123");
  assert(transmitter.FramesSent() == 2);
}

} // namespace

int main() {
  TestCardNumberFromPlate();
  TestParityBits();
  TestFrameLayout();
  TestForwardPulsesBothLines();
  TestSimulatedTransmitterOnlyCounts();

  std::cout << "lotgate_unit_wiegand_transmitter: pass\n";
  return 0;
}
