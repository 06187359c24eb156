#include "transfer_service.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "internal/model/caller.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/settings/settings_cache.hpp"
#include "internal/transfer/transfer_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/phone_mask.hpp"
#include "internal/util/time.hpp"

namespace handoff::service {

using namespace handoff::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const Caller& caller, Fn&& fn) {
  handoff::observability::SpanScope span(route);
  span.SetAttribute("organization.id", caller.organization_id());
  span.SetAttribute("user.id", caller.user_id());

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    handoff::observability::Metrics::Instance().RecordRequest(route, true);
    handoff::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    HANDOFF_LOG_ERROR("RPC failed", {handoff::observability::StringField("route", route),
                                     handoff::observability::StringField("error", ex.what()),
                                     handoff::observability::StringField("user_id", caller.user_id())});
    handoff::observability::Metrics::Instance().RecordRequest(route, false);
    handoff::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

model::Caller FromProto(const Caller& caller) {
  model::Caller out;
  out.organization_id = caller.organization_id();
  out.user_id         = caller.user_id();
  // unspecified role gets the narrowest permissions
  out.role = caller.role() == ROLE_UNSPECIFIED ? ROLE_AGENT : caller.role();
  return out;
}

std::optional<std::string> Optional(bool has, const std::string& value) {
  if (!has || value.empty()) {
    return std::nullopt;
  }
  return value;
}

void SetSla(const db::model::TransferRecord& r, SlaInfo* sla) {
  util::SetTimestamp(r.response_deadline_ms, sla->mutable_response_deadline());
  util::SetTimestamp(r.resolution_deadline_ms, sla->mutable_resolution_deadline());
  util::SetTimestamp(r.escalation_at_ms, sla->mutable_escalation_at());
  util::SetTimestamp(r.expires_at_ms, sla->mutable_expires_at());
  sla->set_breached(r.sla_breached);
  util::SetTimestamp(r.sla_breached_at_ms, sla->mutable_breached_at());
  sla->set_escalation_level(static_cast<uint32_t>(r.escalation_level));
  util::SetTimestamp(r.escalated_at_ms, sla->mutable_escalated_at());
  util::SetTimestamp(r.picked_up_at_ms, sla->mutable_picked_up_at());
  util::SetTimestamp(r.first_response_at_ms, sla->mutable_first_response_at());
}

} // namespace

Transfer ToProto(const db::model::TransferRecord& record, bool mask) {
  Transfer out;
  out.set_id(record.id);
  out.set_organization_id(record.organization_id);
  out.set_contact_id(record.contact_id);
  out.set_account(record.account);
  out.set_phone_number(mask ? util::MaskPhoneNumber(record.phone_number) : record.phone_number);
  out.set_status(record.status);
  out.set_source(record.source);
  if (record.agent_id) out.set_agent_id(*record.agent_id);
  if (record.team_id) out.set_team_id(*record.team_id);
  if (record.transferred_by) out.set_transferred_by(*record.transferred_by);
  out.set_notes(record.notes);
  util::SetTimestamp(record.transferred_at_ms, out.mutable_transferred_at());
  util::SetTimestamp(record.resumed_at_ms, out.mutable_resumed_at());
  if (record.resumed_by) out.set_resumed_by(*record.resumed_by);
  SetSla(record, out.mutable_sla());
  return out;
}

TransferService::TransferService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

bool TransferService::MaskFor(const db::model::TransferRecord& record) {
  return ctx_.settings->Resolve(record.organization_id, record.account).mask_phone_numbers;
}

CreateTransferResponse TransferService::Create(const CreateTransferRequest& req) {
  return ObserveRpc("TransferService.Create", req.caller(), [&] {
    transfer::CreateTransferParams params;
    params.contact_id = req.contact_id();
    params.account    = req.account();
    params.agent_id   = Optional(req.has_agent_id(), req.agent_id());
    params.team_id    = Optional(req.has_team_id(), req.team_id());
    params.notes      = req.notes();
    params.source     = req.source();

    const auto record = ctx_.queue->Create(FromProto(req.caller()), params);

    CreateTransferResponse resp;
    *resp.mutable_transfer() = ToProto(record, MaskFor(record));
    return resp;
  });
}

AssignTransferResponse TransferService::Assign(const AssignTransferRequest& req) {
  return ObserveRpc("TransferService.Assign", req.caller(), [&] {
    const auto record =
        ctx_.queue->Assign(FromProto(req.caller()), req.transfer_id(), Optional(req.has_agent_id(), req.agent_id()));

    AssignTransferResponse resp;
    *resp.mutable_transfer() = ToProto(record, MaskFor(record));
    return resp;
  });
}

PickNextTransferResponse TransferService::PickNext(const PickNextTransferRequest& req) {
  return ObserveRpc("TransferService.PickNext", req.caller(), [&] {
    PickNextTransferResponse resp;
    auto                     record = ctx_.queue->PickNext(FromProto(req.caller()), Optional(req.has_team_id(), req.team_id()));
    if (!record) {
      resp.set_queue_empty(true);
      return resp;
    }
    *resp.mutable_transfer() = ToProto(*record, MaskFor(*record));
    return resp;
  });
}

ResumeTransferResponse TransferService::Resume(const ResumeTransferRequest& req) {
  return ObserveRpc("TransferService.Resume", req.caller(), [&] {
    const auto record = ctx_.queue->Resume(FromProto(req.caller()), req.transfer_id());

    ResumeTransferResponse resp;
    *resp.mutable_transfer() = ToProto(record, MaskFor(record));
    return resp;
  });
}

ListTransfersResponse TransferService::List(const ListTransfersRequest& req) {
  return ObserveRpc("TransferService.List", req.caller(), [&] {
    transfer::ListFilter filter;
    if (req.status() != TRANSFER_STATUS_UNSPECIFIED) {
      filter.status = req.status();
    }
    filter.team_id = Optional(req.has_team_id(), req.team_id());

    const auto listing = ctx_.queue->List(FromProto(req.caller()), filter);

    // masking is per account; resolve each account once
    std::map<std::string, bool> mask_by_account;
    ListTransfersResponse       resp;
    for (const auto& record : listing.transfers) {
      auto it = mask_by_account.find(record.account);
      if (it == mask_by_account.end()) {
        it = mask_by_account.emplace(record.account, MaskFor(record)).first;
      }
      *resp.add_transfers() = ToProto(record, it->second);
    }
    resp.set_general_queue_count(listing.general_queue_count);
    for (const auto& [team, count] : listing.team_queue_counts) {
      (*resp.mutable_team_queue_counts())[team] = count;
    }
    return resp;
  });
}

RecordFirstResponseResponse TransferService::RecordFirstResponse(const RecordFirstResponseRequest& req) {
  return ObserveRpc("TransferService.RecordFirstResponse", req.caller(), [&] {
    const auto record = ctx_.queue->RecordFirstResponse(FromProto(req.caller()), req.transfer_id());

    RecordFirstResponseResponse resp;
    *resp.mutable_transfer() = ToProto(record, MaskFor(record));
    return resp;
  });
}

}
