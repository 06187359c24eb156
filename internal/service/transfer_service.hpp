#pragma once

#include "handoff/v1.hpp"
#include "internal/db/model/transfer_record.hpp"
#include "service_context.hpp"

namespace handoff::service {

/*
  Proto facing wrapper over transfer::TransferQueue.

  Converts requests into domain calls, applies phone masking from the
  organization settings and records spans and request metrics.
  Domain exceptions pass through unchanged.
*/
class TransferService {
 public:
  explicit TransferService(ServiceContext ctx);

  handoff::v1::CreateTransferResponse Create(const handoff::v1::CreateTransferRequest& req);

  handoff::v1::AssignTransferResponse Assign(const handoff::v1::AssignTransferRequest& req);

  handoff::v1::PickNextTransferResponse PickNext(const handoff::v1::PickNextTransferRequest& req);

  handoff::v1::ResumeTransferResponse Resume(const handoff::v1::ResumeTransferRequest& req);

  handoff::v1::ListTransfersResponse List(const handoff::v1::ListTransfersRequest& req);

  handoff::v1::RecordFirstResponseResponse RecordFirstResponse(const handoff::v1::RecordFirstResponseRequest& req);

 private:
  bool MaskFor(const db::model::TransferRecord& record);

  ServiceContext ctx_;
};

// record -> wire form; `mask` hides all but the last four phone digits
handoff::v1::Transfer ToProto(const db::model::TransferRecord& record, bool mask);

}
