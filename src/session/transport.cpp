#include "code_context/session/transport.hpp"

namespace code_context {

const char* to_string(CloseCode code) {
    switch (code) {
        case CloseCode::NormalClosure: return "NORMAL_CLOSURE";
        case CloseCode::GoingAway: return "GOING_AWAY";
        case CloseCode::AbnormalClosure: return "ABNORMAL_CLOSURE";
        case CloseCode::InternalServerError: return "INTERNAL_SERVER_ERROR";
    }
    return "UNKNOWN";
}

int exit_code_for(CloseCode code) {
    switch (code) {
        case CloseCode::NormalClosure: return 0;
        case CloseCode::GoingAway: return 2;
        case CloseCode::AbnormalClosure: return 3;
        case CloseCode::InternalServerError: return 4;
    }
    return 3;
}

} // namespace code_context
