#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace code_context {

enum class CloseCode : int {
    NormalClosure = 1000,
    GoingAway = 1001,
    AbnormalClosure = 1006,
    InternalServerError = 1011,
};

const char* to_string(CloseCode code);

// Process exit status for a conversation that ended with `code`.
int exit_code_for(CloseCode code);

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CloseFrame {
    CloseCode code = CloseCode::NormalClosure;
    std::string reason;
};

// What receive() produced: a text frame or a close. A stream that breaks
// without a close frame is reported as AbnormalClosure.
struct InboundFrame {
    std::optional<std::string> text;
    std::optional<CloseFrame> close;

    bool is_text() const { return text.has_value(); }
    bool is_close() const { return close.has_value(); }

    static InboundFrame text_frame(std::string body) {
        InboundFrame f;
        f.text = std::move(body);
        return f;
    }
    static InboundFrame close_frame(CloseCode code, std::string reason = "") {
        InboundFrame f;
        f.close = CloseFrame{code, std::move(reason)};
        return f;
    }
};

// Duplex, message-oriented channel carrying one conversation.
class Transport {
public:
    virtual ~Transport() = default;

    // false once the peer has gone away.
    virtual bool send_text(const std::string& text) = 0;
    virtual bool send_close(CloseCode code, const std::string& reason) = 0;

    // Blocks for the next frame.
    virtual InboundFrame receive() = 0;
};

} // namespace code_context
