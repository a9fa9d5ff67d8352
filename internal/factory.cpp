#include "factory.hpp"

#include <memory>

#include "internal/access/authorization_store.hpp"
#include "internal/access/debounce_filter.hpp"
#include "internal/access/decision_engine.hpp"
#include "internal/access/plate_lock_table.hpp"
#include "internal/barrier/barrier_factory.hpp"
#include "internal/barrier/barrier_router.hpp"
#include "internal/barrier/gpio_actuator.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/domain_events.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/grpc/access_server.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/event_server.hpp"
#include "internal/grpc/terminal_server.hpp"
#include "internal/integration/wiegand_transmitter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/parking/parking_options.hpp"
#include "internal/parking/payment_timeout_worker.hpp"
#include "internal/parking/session_manager.hpp"
#include "internal/payment/terminal_bridge_processor.hpp"
#include "internal/service/access_service.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/event_service.hpp"
#include "internal/service/terminal_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if LOTGATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace lotgate::factory {

using namespace lotgate;

namespace {

// Cadence of the payment-timeout sweep.
constexpr std::chrono::milliseconds kTimeoutSweepInterval{1000};

std::shared_ptr<db::Repository> BuildRepository(const lotgate::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LOTGATE_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw util::ConfigurationError("database.sqlite.path is required");
    }
    auto sqlite_db = db::sqlite::SqliteDB::Open(sqlite.path(), sqlite.wal_mode());
    LOTGATE_LOG_INFO("using sqlite repository",
                     {observability::StringField("path", sqlite.path()), observability::IntField("schema_version", sqlite_db->SchemaVersion())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  LOTGATE_LOG_WARN("using in-memory repository; sessions are lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

integration::AccessForwarderPtr BuildForwarder(const lotgate::runtime::config::RuntimeConfig& config) {
  if (config.parking().operating_mode() != lotgate::runtime::config::OPERATING_MODE_FORWARD) {
    return nullptr;
  }

  const auto& wiegand = config.forwarder().wiegand();

  integration::WiegandOptions options;
  options.facility_code = static_cast<uint8_t>(wiegand.facility_code() == 0 ? 1 : wiegand.facility_code());
  if (wiegand.pulse_width_us() != 0) options.pulse_width = std::chrono::microseconds(wiegand.pulse_width_us());
  if (wiegand.pulse_interval_us() != 0) options.pulse_interval = std::chrono::microseconds(wiegand.pulse_interval_us());

  barrier::ActuatorPtr data0;
  barrier::ActuatorPtr data1;
  if (wiegand.data0_pin() != 0) {
    const std::string sysfs_root = wiegand.sysfs_root().empty() ? "/sys/class/gpio" : wiegand.sysfs_root();
    data0 = std::make_shared<barrier::GpioActuator>(sysfs_root, wiegand.data0_pin());
    data1 = std::make_shared<barrier::GpioActuator>(sysfs_root, wiegand.data1_pin());
  } else {
    LOTGATE_LOG_WARN("forward mode without wiegand pins; frames are only logged");
  }
  return std::make_shared<integration::WiegandTransmitter>(std::move(data0), std::move(data1), options);
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const lotgate::runtime::config::RuntimeConfig& config) {
  Application app;

  auto repository = BuildRepository(config);
  auto bus        = std::make_shared<events::EventBus>();

  // ------------------------------------------------------------------
  // Barriers
  // ------------------------------------------------------------------
  std::weak_ptr<events::EventBus> weak_bus = bus;
  auto on_fault = [weak_bus](const std::string& barrier_id, const std::string& reason) {
    if (auto target = weak_bus.lock()) {
      target->Publish(events::MakeBarrierFault(barrier_id, reason, util::Now()));
    }
  };
  auto barriers = std::make_shared<barrier::BarrierRouter>(barrier::BarrierFactory::Build(config.barriers(), on_fault),
                                                           config.cameras());

  // ------------------------------------------------------------------
  // Sessions and payment
  // ------------------------------------------------------------------
  auto locks    = std::make_shared<access::PlateLockTable>();
  auto terminal = std::make_shared<payment::TerminalBridgeProcessor>();
  auto options  = parking::ParkingOptions::FromConfig(config.parking());
  auto sessions = std::make_shared<parking::SessionManager>(options, repository, terminal, bus, barriers, locks);

  std::weak_ptr<parking::SessionManager> weak_sessions = sessions;
  terminal->SetListener([weak_sessions](const payment::TransactionUpdate& update) {
    if (auto target = weak_sessions.lock()) {
      target->OnTransactionUpdate(update);
    }
  });

  // ------------------------------------------------------------------
  // Decision path
  // ------------------------------------------------------------------
  const auto& recognition = config.recognition();

  access::DebounceOptions debounce_options;
  debounce_options.confidence_threshold = recognition.confidence_threshold();
  debounce_options.window               = lotgate::config::ConfigLoader::DebounceWindow(recognition);
  debounce_options.per_camera           = recognition.debounce_scope() == lotgate::runtime::config::DEBOUNCE_SCOPE_PER_CAMERA;

  auto engine = std::make_shared<access::DecisionEngine>(
      std::make_shared<access::DebounceFilter>(debounce_options),
      std::make_shared<access::RepositoryAuthorizationStore>(repository), locks, sessions, barriers, repository, bus,
      BuildForwarder(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.engine     = engine;
  ctx.sessions   = sessions;
  ctx.barriers   = barriers;
  ctx.terminal   = terminal;
  ctx.bus        = bus;

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AccessServer>(std::make_shared<service::AccessService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(std::make_shared<service::AdminService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::TerminalServer>(std::make_shared<service::TerminalService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::EventServer>(std::make_shared<service::EventService>(ctx)));

  app.context        = ctx;
  app.barriers       = barriers;
  app.timeout_worker = std::make_shared<parking::PaymentTimeoutWorker>(sessions, kTimeoutSweepInterval);

  LOTGATE_LOG_INFO("runtime built", {observability::IntField("barriers", static_cast<int64_t>(barriers->Barriers().size())),
                                     observability::IntField("cameras", config.cameras_size())});
  return app;
}

void Application::Start() {
  barriers->StartAll();
  timeout_worker->Start();
}

void Application::Stop() {
  timeout_worker->Stop();
  barriers->StopAll();
  context.bus->Shutdown();
}

} // namespace lotgate::factory
