#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace lotgate::barrier { class BarrierRouter; }
namespace lotgate::parking { class PaymentTimeoutWorker; }

namespace lotgate::factory {

/*
  Application

  Owns all long-lived components of the daemon. Build() wires them;
  Start() launches the barrier and payment-timeout threads.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>>  grpc_services;
  lotgate::service::ServiceContext               context;
  std::shared_ptr<barrier::BarrierRouter>        barriers;
  std::shared_ptr<parking::PaymentTimeoutWorker> timeout_worker;

  void Start();
  void Stop();
};

/*
  Composition root. The only place that knows concrete repository,
  actuator and payment-processor types.
*/
Application Build(const lotgate::runtime::config::RuntimeConfig& config);

} // namespace lotgate::factory
