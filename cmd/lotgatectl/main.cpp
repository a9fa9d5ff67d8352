#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "lotgate/v1.hpp"

using namespace lotgate::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  lotgatectl <addr> detect <plate> <camera_id> [confidence=1.0]\n"
            << "  lotgatectl <addr> session <session_id>\n"
            << "  lotgatectl <addr> open-session <plate>\n"
            << "  lotgatectl <addr> pay <plate>\n"
            << "  lotgatectl <addr> barrier <barrier_id>\n"
            << "  lotgatectl <addr> reset <barrier_id>\n"
            << "  lotgatectl <addr> open <barrier_id>\n"
            << "  lotgatectl <addr> settle <session_id> [amount] [method]\n"
            << "  lotgatectl <addr> cancel <session_id> [note]\n"
            << "  lotgatectl <addr> release <session_id> [barrier_id]\n"
            << "  lotgatectl <addr> pending\n"
            << "  lotgatectl <addr> report <transaction_id> <completed|failed|cancelled|processing> [method]\n"
            << "  lotgatectl <addr> authorize <plate> [owner] [vehicle_type]\n"
            << "  lotgatectl <addr> revoke <plate>\n"
            << "  lotgatectl <addr> vehicles\n"
            << "  lotgatectl <addr> log [plate] [limit]\n"
            << "  lotgatectl <addr> watch\n";
}

static std::optional<TransactionState> ParseState(const std::string& value) {
  if (value == "processing") return TRANSACTION_STATE_PROCESSING;
  if (value == "completed") return TRANSACTION_STATE_COMPLETED;
  if (value == "failed") return TRANSACTION_STATE_FAILED;
  if (value == "cancelled") return TRANSACTION_STATE_CANCELLED;
  return std::nullopt;
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                               json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return "<unprintable: " + std::string(status.message()) + ">";
  }
  return json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto access_stub   = AccessService::NewStub(channel);
  auto admin_stub    = AdminService::NewStub(channel);
  auto terminal_stub = TerminalService::NewStub(channel);
  auto event_stub    = EventService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "detect") {
    if (argc < 5) return 1;

    SubmitDetectionRequest req;
    auto*                  detection = req.mutable_detection();
    detection->set_plate(argv[3]);
    detection->set_camera_id(argv[4]);
    detection->set_confidence(argc >= 6 ? std::stod(argv[5]) : 1.0);

    const auto now = std::chrono::system_clock::now().time_since_epoch();
    detection->mutable_timestamp()->set_seconds(std::chrono::duration_cast<std::chrono::seconds>(now).count());

    SubmitDetectionResponse resp;
    auto                    status = access_stub->SubmitDetection(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.admitted()) {
      std::cout << "debounced\n";
      return 0;
    }
    std::cout << ToJson(resp.decision());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "session" || cmd == "open-session" || cmd == "pay") {
    if (argc < 4) return 1;

    GetSessionResponse resp;
    grpc::Status       status;
    if (cmd == "session") {
      GetSessionRequest req;
      req.set_session_id(argv[3]);
      status = access_stub->GetSession(&ctx, req, &resp);
    } else if (cmd == "open-session") {
      FindOpenSessionRequest req;
      req.set_plate(argv[3]);
      status = access_stub->FindOpenSession(&ctx, req, &resp);
    } else {
      PayAtStationRequest req;
      req.set_plate(argv[3]);
      status = access_stub->PayAtStation(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp.session());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "barrier" || cmd == "reset" || cmd == "open") {
    if (argc < 4) return 1;

    BarrierRequest req;
    req.set_barrier_id(argv[3]);

    BarrierResponse resp;
    grpc::Status    status;
    if (cmd == "barrier") {
      status = admin_stub->GetBarrier(&ctx, req, &resp);
    } else if (cmd == "reset") {
      status = admin_stub->ResetBarrier(&ctx, req, &resp);
    } else {
      status = admin_stub->OpenBarrier(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    std::cout << resp.barrier_id() << " state=" << BarrierState_Name(resp.state()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "settle") {
    if (argc < 4) return 1;

    SettleSessionRequest req;
    req.set_session_id(argv[3]);
    if (argc >= 5) {
      // decimal amount in the session's currency
      req.mutable_amount()->set_minor_units(std::llround(std::stod(argv[4]) * 100.0));
    }
    if (argc >= 6) req.set_method(argv[5]);

    SessionResponse resp;
    auto            status = admin_stub->SettleSession(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp.session());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelSessionRequest req;
    req.set_session_id(argv[3]);
    if (argc >= 5) req.set_note(argv[4]);

    SessionResponse resp;
    auto            status = admin_stub->CancelSession(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp.session());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "release") {
    if (argc < 4) return 1;

    ReleaseVehicleRequest req;
    req.set_session_id(argv[3]);
    if (argc >= 5) req.set_barrier_id(argv[4]);

    SessionResponse resp;
    auto            status = admin_stub->ReleaseVehicle(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp.session());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pending") {
    google::protobuf::Empty req;
    ListPendingResponse     resp;
    auto                    status = terminal_stub->ListPending(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& transaction : resp.transactions()) {
      std::cout << transaction.transaction_id() << " session=" << transaction.session_id()
                << " amount=" << transaction.amount().minor_units() << " " << transaction.amount().currency() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "report") {
    if (argc < 5) return 1;

    auto state = ParseState(argv[4]);
    if (!state) {
      std::cerr << "unsupported state: " << argv[4] << "\n";
      return 1;
    }

    ReportTransactionRequest req;
    req.set_transaction_id(argv[3]);
    req.set_state(*state);
    if (argc >= 6) req.set_payment_method(argv[5]);

    google::protobuf::Empty resp;
    auto                    status = terminal_stub->ReportTransaction(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "reported\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "authorize") {
    if (argc < 4) return 1;

    UpsertAuthorizationRequest req;
    auto*                      record = req.mutable_record();
    record->set_plate(argv[3]);
    record->set_authorized(true);
    if (argc >= 5) record->set_owner(argv[4]);
    if (argc >= 6) record->set_vehicle_type(argv[5]);

    google::protobuf::Empty resp;
    auto                    status = admin_stub->UpsertAuthorization(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "authorized\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "revoke") {
    if (argc < 4) return 1;

    DeleteAuthorizationRequest req;
    req.set_plate(argv[3]);

    google::protobuf::Empty resp;
    auto                    status = admin_stub->DeleteAuthorization(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "revoked\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "vehicles") {
    google::protobuf::Empty    req;
    ListAuthorizationsResponse resp;
    auto                       status = admin_stub->ListAuthorizations(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& record : resp.records()) {
      std::cout << record.plate() << " owner=" << record.owner() << " authorized=" << (record.authorized() ? "yes" : "no") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "log") {
    ListAccessLogRequest req;
    if (argc >= 4) req.set_plate(argv[3]);
    req.set_limit(argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 50);

    ListAccessLogResponse resp;
    auto                  status = admin_stub->ListAccessLog(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << entry.id() << " " << entry.plate() << " camera=" << entry.camera_id()
                << " direction=" << Direction_Name(entry.direction()) << " granted=" << (entry.granted() ? "yes" : "no")
                << " reason=" << DecisionReason_Name(entry.reason()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    WatchEventsRequest req;
    auto               reader = event_stub->WatchEvents(&ctx, req);

    DomainEvent event;
    while (reader->Read(&event)) {
      std::cout << ToJson(event) << std::flush;
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  Usage();
  return 1;
}
