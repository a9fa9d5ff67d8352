#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using lotgate::config::ConfigLoader;
using lotgate::runtime::config::RuntimeConfig;
using namespace lotgate::runtime::config;

constexpr const char* kValidConfig = R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/tmp/lotgate.db"
    wal_mode: true
recognition:
  confidence_threshold: 0.7
  processing_interval: "0.2s"
parking:
  operating_mode: OPERATING_MODE_PARKING
  entry_exit_mode: ENTRY_EXIT_MODE_DUAL_CAMERA
  payment_required: PAYMENT_REQUIRED_GRACE_PERIOD
  payment_timeout: "90s"
  fee_policy:
    mode: FEE_MODE_TIERED
    currency: EUR
    grace_period_minutes: 10
    tiers:
      - hours_threshold: 3
        rate: 5
      - hours_threshold: 1
        rate: 2
    special_rates:
      - name: night
        flat_rate: 4.5
        entry_after: "18:00"
barriers:
  - id: entry
    open_time: "4s"
    safety_check: true
  - id: exit
cameras:
  - id: cam-entry
    role: CAMERA_ROLE_ENTRY
    barrier_id: entry
  - id: cam-exit
    role: CAMERA_ROLE_EXIT
    barrier_id: exit
)";

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "lotgate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

RuntimeConfig LoadValid() {
  return ConfigLoader::LoadFromYaml(WriteYaml("valid", kValidConfig).string());
}

bool Rejects(const std::function<void()>& f) {
  try {
    f();
  } catch (const lotgate::util::ConfigurationError&) {
    return true;
  }
  return false;
}

void TestValidConfigLoads() {
  const auto config = LoadValid();
  ConfigLoader::Validate(config);

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.recognition().confidence_threshold() == 0.7);
  assert(config.parking().entry_exit_mode() == ENTRY_EXIT_MODE_DUAL_CAMERA);
  assert(config.parking().payment_timeout().seconds() == 90);
  assert(config.parking().fee_policy().tiers_size() == 2);
  assert(config.parking().fee_policy().special_rates(0).entry_after() == "18:00");
  assert(config.barriers_size() == 2);
  assert(config.barriers(0).open_time().seconds() == 4);
  assert(config.cameras(1).role() == CAMERA_ROLE_EXIT);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\lotgate\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\lotgate\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(parking:
  fee_policy:
    mode: FEE_MODE_FIXED
    currency: "978"
    fixed_rate: 3
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.parking().fee_policy().currency() == "978");
  assert(config.parking().fee_policy().fixed_rate() == 3.0);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsConfigurationError() {
  assert(Rejects([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/lotgate.yaml"); }));
}

void TestInlineYamlMatchesFile() {
  const auto inline_config = ConfigLoader::FromYaml(kValidConfig);
  assert(inline_config.SerializeAsString() == LoadValid().SerializeAsString());

  assert(Rejects([] { (void)ConfigLoader::FromYaml("server: [unterminated"); }));
  assert(Rejects([] { (void)ConfigLoader::FromYaml("parking:\n  operating_mode: OPERATING_MODE_CARWASH\n"); }));
}

void TestValidationFailures() {
  {
    auto config = LoadValid();
    config.mutable_recognition()->set_confidence_threshold(1.5);
    assert(Rejects([&] { ConfigLoader::Validate(config); }));
  }
  {
    auto config = LoadValid();
    config.clear_barriers();
    assert(Rejects([&] { ConfigLoader::Validate(config); }));
  }
  {
    auto config = LoadValid();
    config.mutable_barriers(1)->set_id("entry");
    assert(Rejects([&] { ConfigLoader::Validate(config); }));
  }
  {
    auto config = LoadValid();
    config.mutable_cameras(0)->set_barrier_id("side-gate");
    assert(Rejects([&] { ConfigLoader::Validate(config); }));
  }
  {
    // dual camera without an exit camera
    auto config = LoadValid();
    config.mutable_cameras()->RemoveLast();
    assert(Rejects([&] { ConfigLoader::Validate(config); }));
  }
  {
    auto config = LoadValid();
    config.mutable_parking()->mutable_fee_policy()->clear_tiers();
    assert(Rejects([&] { ConfigLoader::Validate(config); }));
  }
  {
    auto config = LoadValid();
    config.mutable_parking()->mutable_payment_timeout()->set_seconds(-1);
    assert(Rejects([&] { ConfigLoader::Validate(config); }));
  }
}

void TestBrokenFeePolicyIgnoredWithoutFees() {
  auto config = LoadValid();
  config.mutable_parking()->mutable_fee_policy()->clear_tiers();
  config.mutable_parking()->set_payment_required(PAYMENT_REQUIRED_NEVER);
  ConfigLoader::Validate(config);
}

void TestForwarderSection() {
  const auto config = ConfigLoader::FromYaml(R"(
parking:
  operating_mode: OPERATING_MODE_FORWARD
forwarder:
  wiegand:
    data0_pin: 23
    data1_pin: 24
    facility_code: 12
    pulse_width_us: 100
    pulse_interval_us: 2000
barriers:
  - id: entry
cameras:
  - id: cam-entry
    role: CAMERA_ROLE_ENTRY
    barrier_id: entry
)");
  assert(config.parking().operating_mode() == OPERATING_MODE_FORWARD);
  assert(config.forwarder().wiegand().data1_pin() == 24);
  assert(config.forwarder().wiegand().facility_code() == 12);
  ConfigLoader::Validate(config);

  {
    auto broken = config;
    broken.mutable_forwarder()->mutable_wiegand()->set_facility_code(256);
    assert(Rejects([&] { ConfigLoader::Validate(broken); }));
  }
  {
    auto broken = config;
    broken.mutable_forwarder()->mutable_wiegand()->set_data1_pin(0);
    assert(Rejects([&] { ConfigLoader::Validate(broken); }));
  }
  {
    auto broken = config;
    broken.mutable_forwarder()->mutable_wiegand()->set_data1_pin(23);
    assert(Rejects([&] { ConfigLoader::Validate(broken); }));
  }
}

void TestDebounceWindowDefaultsToTenIntervals() {
  const auto config = LoadValid();
  assert(ConfigLoader::DebounceWindow(config.recognition()) == std::chrono::milliseconds(2000));

  RecognitionConfig explicit_window;
  explicit_window.mutable_debounce_window()->set_seconds(3);
  assert(ConfigLoader::DebounceWindow(explicit_window) == std::chrono::milliseconds(3000));

  assert(ConfigLoader::DebounceWindow(RecognitionConfig{}) == std::chrono::milliseconds(5000));
}

} // namespace

int main() {
  TestValidConfigLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsConfigurationError();
  TestInlineYamlMatchesFile();
  TestValidationFailures();
  TestBrokenFeePolicyIgnoredWithoutFees();
  TestForwarderSection();
  TestDebounceWindowDefaultsToTenIntervals();

  std::cout << "lotgate_unit_config_loader: pass\n";
  return 0;
}
