#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "handoff/v1_grpc.hpp"
#include "internal/service/transfer_service.hpp"

namespace handoff::grpc {

class TransferServer final : public handoff::v1::TransferService::Service {
 public:
  explicit TransferServer(std::shared_ptr<handoff::service::TransferService> svc);

  ::grpc::Status CreateTransfer(::grpc::ServerContext*, const handoff::v1::CreateTransferRequest*,
                                handoff::v1::CreateTransferResponse*) override;

  ::grpc::Status AssignTransfer(::grpc::ServerContext*, const handoff::v1::AssignTransferRequest*,
                                handoff::v1::AssignTransferResponse*) override;

  ::grpc::Status PickNextTransfer(::grpc::ServerContext*, const handoff::v1::PickNextTransferRequest*,
                                  handoff::v1::PickNextTransferResponse*) override;

  ::grpc::Status ResumeTransfer(::grpc::ServerContext*, const handoff::v1::ResumeTransferRequest*,
                                handoff::v1::ResumeTransferResponse*) override;

  ::grpc::Status ListTransfers(::grpc::ServerContext*, const handoff::v1::ListTransfersRequest*,
                               handoff::v1::ListTransfersResponse*) override;

  ::grpc::Status RecordFirstResponse(::grpc::ServerContext*, const handoff::v1::RecordFirstResponseRequest*,
                                     handoff::v1::RecordFirstResponseResponse*) override;

 private:
  std::shared_ptr<handoff::service::TransferService> service_;
};

}
