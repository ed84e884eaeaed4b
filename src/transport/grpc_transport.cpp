#include "code_context/transport/grpc_transport.hpp"

namespace code_context {

CloseCode from_wire(rpc::CloseCode code) {
    switch (code) {
        case rpc::NORMAL_CLOSURE: return CloseCode::NormalClosure;
        case rpc::GOING_AWAY: return CloseCode::GoingAway;
        case rpc::INTERNAL_SERVER_ERROR: return CloseCode::InternalServerError;
        default: return CloseCode::AbnormalClosure;
    }
}

rpc::CloseCode to_wire(CloseCode code) {
    switch (code) {
        case CloseCode::NormalClosure: return rpc::NORMAL_CLOSURE;
        case CloseCode::GoingAway: return rpc::GOING_AWAY;
        case CloseCode::AbnormalClosure: return rpc::ABNORMAL_CLOSURE;
        case CloseCode::InternalServerError: return rpc::INTERNAL_SERVER_ERROR;
    }
    return rpc::ABNORMAL_CLOSURE;
}

rpc::Frame close_message(CloseCode code, const std::string& reason) {
    rpc::Frame frame;
    frame.mutable_close()->set_code(to_wire(code));
    frame.mutable_close()->set_reason(reason);
    return frame;
}

InboundFrame from_message(const rpc::Frame& frame) {
    switch (frame.kind_case()) {
        case rpc::Frame::kText:
            return InboundFrame::text_frame(frame.text());
        case rpc::Frame::kClose:
            return InboundFrame::close_frame(from_wire(frame.close().code()), frame.close().reason());
        default:
            return InboundFrame::close_frame(CloseCode::AbnormalClosure, "empty frame");
    }
}

// --- CLIENT ---

GrpcClientTransport::GrpcClientTransport(std::shared_ptr<grpc::Channel> channel)
    : stub_(rpc::ContextSync::NewStub(channel)) {
    stream_ = stub_->Converse(&context_);
    if (!stream_) {
        throw TransportError("failed to open Converse stream");
    }
}

GrpcClientTransport::~GrpcClientTransport() {
    if (finished_) return;
    if (!writes_done_) {
        stream_->WritesDone();
        writes_done_ = true;
    }
    // Finish() expects the read side to be drained
    rpc::Frame ignored;
    while (stream_->Read(&ignored)) {}
    finish();
}

bool GrpcClientTransport::send_text(const std::string& text) {
    if (writes_done_ || finished_) return false;
    rpc::Frame frame;
    frame.set_text(text);
    return stream_->Write(frame);
}

bool GrpcClientTransport::send_close(CloseCode code, const std::string& reason) {
    if (writes_done_ || finished_) return false;
    bool ok = stream_->Write(close_message(code, reason));
    stream_->WritesDone();
    writes_done_ = true;
    return ok;
}

InboundFrame GrpcClientTransport::receive() {
    if (finished_) {
        return InboundFrame::close_frame(CloseCode::AbnormalClosure, "stream already finished");
    }
    rpc::Frame frame;
    if (stream_->Read(&frame)) {
        return from_message(frame);
    }
    grpc::Status status = finish();
    return InboundFrame::close_frame(CloseCode::AbnormalClosure,
                                     status.ok() ? "stream ended without close frame" : status.error_message());
}

grpc::Status GrpcClientTransport::finish() {
    finished_ = true;
    return stream_->Finish();
}

std::optional<std::string> GrpcClientTransport::ping(const std::shared_ptr<grpc::Channel>& channel,
                                                     std::chrono::milliseconds timeout) {
    auto stub = rpc::ContextSync::NewStub(channel);
    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + timeout);

    rpc::PingRequest request;
    request.set_payload("ping");
    rpc::PingReply reply;
    grpc::Status status = stub->Ping(&ctx, request, &reply);
    if (!status.ok()) return std::nullopt;
    return reply.payload();
}

// --- SERVER ---

bool GrpcServerTransport::send_text(const std::string& text) {
    rpc::Frame frame;
    frame.set_text(text);
    return stream_->Write(frame);
}

bool GrpcServerTransport::send_close(CloseCode code, const std::string& reason) {
    return stream_->Write(close_message(code, reason));
}

InboundFrame GrpcServerTransport::receive() {
    rpc::Frame frame;
    if (stream_->Read(&frame)) {
        return from_message(frame);
    }
    return InboundFrame::close_frame(CloseCode::AbnormalClosure, "client stream ended");
}

} // namespace code_context
