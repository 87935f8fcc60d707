#pragma once
#include <string>
#include <utility>

namespace aurix {

enum class ErrorKind : int {
    None = 0,
    WorkspaceUnavailable,
    ArtifactWriteFailed,
    FlasherNotStartable,
    FlasherFailed,
    InvalidInput,
    ConfigInvalid,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;
    ErrorKind kind{ErrorKind::None};

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    // Prefixes msg with "context: " and tags the result with kind.
    Result& WithContext(ErrorKind k, const std::string& context) {
        kind = k;
        msg = msg.empty() ? context : context + ": " + msg;
        return *this;
    }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = k};
    }
};

} // namespace aurix
