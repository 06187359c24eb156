#include "transfer_server.hpp"

#include "grpc_error.hpp"

namespace handoff::grpc {

namespace {

template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

TransferServer::TransferServer(std::shared_ptr<handoff::service::TransferService> svc) : service_(std::move(svc)) {
}

::grpc::Status TransferServer::CreateTransfer(::grpc::ServerContext*, const handoff::v1::CreateTransferRequest* req,
                                              handoff::v1::CreateTransferResponse* resp) {
  return Invoke([&] { *resp = service_->Create(*req); });
}

::grpc::Status TransferServer::AssignTransfer(::grpc::ServerContext*, const handoff::v1::AssignTransferRequest* req,
                                              handoff::v1::AssignTransferResponse* resp) {
  return Invoke([&] { *resp = service_->Assign(*req); });
}

::grpc::Status TransferServer::PickNextTransfer(::grpc::ServerContext*, const handoff::v1::PickNextTransferRequest* req,
                                                handoff::v1::PickNextTransferResponse* resp) {
  return Invoke([&] { *resp = service_->PickNext(*req); });
}

::grpc::Status TransferServer::ResumeTransfer(::grpc::ServerContext*, const handoff::v1::ResumeTransferRequest* req,
                                              handoff::v1::ResumeTransferResponse* resp) {
  return Invoke([&] { *resp = service_->Resume(*req); });
}

::grpc::Status TransferServer::ListTransfers(::grpc::ServerContext*, const handoff::v1::ListTransfersRequest* req,
                                             handoff::v1::ListTransfersResponse* resp) {
  return Invoke([&] { *resp = service_->List(*req); });
}

::grpc::Status TransferServer::RecordFirstResponse(::grpc::ServerContext*, const handoff::v1::RecordFirstResponseRequest* req,
                                                   handoff::v1::RecordFirstResponseResponse* resp) {
  return Invoke([&] { *resp = service_->RecordFirstResponse(*req); });
}

}
