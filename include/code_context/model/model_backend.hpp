#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace code_context {

class ModelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct GenerateOptions {
    double temperature = 0.8;
    std::string response_mime_type = "application/json";
};

// Ordered text parts in, free text out. The first part is always the
// serialized codebase context. Implementations must be safe to call from
// several connections at once.
class ModelBackend {
public:
    virtual ~ModelBackend() = default;

    // Throws ModelError on transport/HTTP failure or an empty reply.
    virtual std::string generate(const std::vector<std::string>& parts, const GenerateOptions& options) = 0;

    virtual std::string name() const = 0;
};

} // namespace code_context
