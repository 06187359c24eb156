#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "handoff/v1_grpc.hpp"

using namespace handoff::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  handoffctl <addr> create <contact_id> [account] [--agent <id>] [--team <id>] [--notes <text>]\n"
            << "  handoffctl <addr> assign <transfer_id> [agent_id]\n"
            << "  handoffctl <addr> pick [team_id|general]\n"
            << "  handoffctl <addr> resume <transfer_id>\n"
            << "  handoffctl <addr> list [active|resumed|expired] [team_id|general]\n"
            << "  handoffctl <addr> first-response <transfer_id>\n"
            << "\n"
            << "Caller identity comes from HANDOFF_ORG_ID, HANDOFF_USER_ID and\n"
            << "HANDOFF_ROLE (agent|manager|admin, default agent).\n";
}

static std::string Env(const char* name) {
  const char* value = std::getenv(name);
  return value ? value : "";
}

static Caller CallerFromEnv() {
  Caller caller;
  caller.set_organization_id(Env("HANDOFF_ORG_ID"));
  caller.set_user_id(Env("HANDOFF_USER_ID"));

  const auto role = Env("HANDOFF_ROLE");
  if (role == "admin") {
    caller.set_role(ROLE_ADMIN);
  } else if (role == "manager") {
    caller.set_role(ROLE_MANAGER);
  } else {
    caller.set_role(ROLE_AGENT);
  }
  return caller;
}

static std::optional<TransferStatus> ParseStatus(const std::string& value) {
  if (value == "active") return TRANSFER_STATUS_ACTIVE;
  if (value == "resumed") return TRANSFER_STATUS_RESUMED;
  if (value == "expired") return TRANSFER_STATUS_EXPIRED;
  return std::nullopt;
}

static void Print(const Transfer& t) {
  std::cout << "id=" << t.id() << " contact=" << t.contact_id() << " status=" << TransferStatus_Name(t.status())
            << " agent=" << (t.has_agent_id() ? t.agent_id() : "-") << " team=" << (t.has_team_id() ? t.team_id() : "-")
            << " breached=" << (t.sla().breached() ? "true" : "false") << " level=" << t.sla().escalation_level() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
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
  auto stub    = TransferService::NewStub(channel);

  grpc::ClientContext ctx;
  const auto          caller = CallerFromEnv();

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 4) return 1;

    CreateTransferRequest req;
    *req.mutable_caller() = caller;
    req.set_contact_id(argv[3]);
    req.set_source(TRANSFER_SOURCE_MANUAL);

    for (int i = 4; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--agent" && i + 1 < argc) {
        req.set_agent_id(argv[++i]);
      } else if (arg == "--team" && i + 1 < argc) {
        req.set_team_id(argv[++i]);
      } else if (arg == "--notes" && i + 1 < argc) {
        req.set_notes(argv[++i]);
      } else if (req.account().empty()) {
        req.set_account(arg);
      } else {
        std::cerr << "unexpected argument: " << arg << "\n";
        return 1;
      }
    }

    CreateTransferResponse resp;
    auto                   status = stub->CreateTransfer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.transfer());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "assign") {
    if (argc < 4) return 1;

    AssignTransferRequest req;
    *req.mutable_caller() = caller;
    req.set_transfer_id(argv[3]);
    if (argc >= 5) req.set_agent_id(argv[4]);

    AssignTransferResponse resp;
    auto                   status = stub->AssignTransfer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.transfer());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pick") {
    PickNextTransferRequest req;
    *req.mutable_caller() = caller;
    if (argc >= 4) req.set_team_id(argv[3]);

    PickNextTransferResponse resp;
    auto                     status = stub->PickNextTransfer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.queue_empty()) {
      std::cout << "queue empty\n";
      return 0;
    }
    Print(resp.transfer());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resume") {
    if (argc < 4) return 1;

    ResumeTransferRequest req;
    *req.mutable_caller() = caller;
    req.set_transfer_id(argv[3]);

    ResumeTransferResponse resp;
    auto                   status = stub->ResumeTransfer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.transfer());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListTransfersRequest req;
    *req.mutable_caller() = caller;
    if (argc >= 4) {
      auto parsed = ParseStatus(argv[3]);
      if (!parsed) {
        std::cerr << "unsupported status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status(*parsed);
    }
    if (argc >= 5) req.set_team_id(argv[4]);

    ListTransfersResponse resp;
    auto                  status = stub->ListTransfers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& t : resp.transfers()) Print(t);
    std::cout << "general_queue=" << resp.general_queue_count() << "\n";
    for (const auto& [team, count] : resp.team_queue_counts()) {
      std::cout << "team_queue[" << team << "]=" << count << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "first-response") {
    if (argc < 4) return 1;

    RecordFirstResponseRequest req;
    *req.mutable_caller() = caller;
    req.set_transfer_id(argv[3]);

    RecordFirstResponseResponse resp;
    auto                        status = stub->RecordFirstResponse(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.transfer());
    return 0;
  }

  Usage();
  return 1;
}
