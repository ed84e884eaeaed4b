#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <grpcpp/grpcpp.h>
#include "context_sync.grpc.pb.h"
#include "code_context/session/transport.hpp"

namespace code_context {

// Unknown or unspecified wire codes map to AbnormalClosure.
CloseCode from_wire(rpc::CloseCode code);
rpc::CloseCode to_wire(CloseCode code);

rpc::Frame close_message(CloseCode code, const std::string& reason);

// A frame with neither member set reads as an abnormal close.
InboundFrame from_message(const rpc::Frame& frame);

// Client end of ContextSync.Converse. One instance is one conversation.
class GrpcClientTransport : public Transport {
public:
    explicit GrpcClientTransport(std::shared_ptr<grpc::Channel> channel);
    ~GrpcClientTransport() override;

    GrpcClientTransport(const GrpcClientTransport&) = delete;
    GrpcClientTransport& operator=(const GrpcClientTransport&) = delete;

    bool send_text(const std::string& text) override;
    bool send_close(CloseCode code, const std::string& reason) override;
    InboundFrame receive() override;

    // Unary reachability check; nullopt when the server does not answer
    // within `timeout`.
    static std::optional<std::string> ping(const std::shared_ptr<grpc::Channel>& channel,
                                           std::chrono::milliseconds timeout);

private:
    std::unique_ptr<rpc::ContextSync::Stub> stub_;
    grpc::ClientContext context_;
    std::unique_ptr<grpc::ClientReaderWriter<rpc::Frame, rpc::Frame>> stream_;
    bool writes_done_ = false;
    bool finished_ = false;

    grpc::Status finish();
};

// Server end, wrapping the stream gRPC hands to the Converse handler.
class GrpcServerTransport : public Transport {
public:
    explicit GrpcServerTransport(grpc::ServerReaderWriter<rpc::Frame, rpc::Frame>* stream) : stream_(stream) {}

    bool send_text(const std::string& text) override;
    bool send_close(CloseCode code, const std::string& reason) override;
    InboundFrame receive() override;

private:
    grpc::ServerReaderWriter<rpc::Frame, rpc::Frame>* stream_;
};

} // namespace code_context
