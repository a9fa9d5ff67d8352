#pragma once

#include <memory>

namespace lotgate::db { class Repository; }
namespace lotgate::access { class DecisionEngine; }
namespace lotgate::parking { class SessionManager; }
namespace lotgate::barrier { class BarrierRouter; }
namespace lotgate::payment { class TerminalBridgeProcessor; }
namespace lotgate::events { class EventBus; }

namespace lotgate::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<lotgate::db::Repository>                   repository;
  std::shared_ptr<lotgate::access::DecisionEngine>           engine;
  std::shared_ptr<lotgate::parking::SessionManager>          sessions;
  std::shared_ptr<lotgate::barrier::BarrierRouter>           barriers;
  std::shared_ptr<lotgate::payment::TerminalBridgeProcessor> terminal;
  std::shared_ptr<lotgate::events::EventBus>                 bus;
};

} // namespace lotgate::service
