#ifndef WEBSWARM_CORE_ERROR_HPP
#define WEBSWARM_CORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace webswarm {

// Failure taxonomy shared by unit results, protocol results and oracles
enum class ErrorKind {
    NONE,
    TRANSPORT,       // network failure or timeout reaching a worker/oracle
    PROTOCOL,        // malformed envelope, unexpected status, session expiry
    STATE_CONFLICT,  // non-idle worker, duplicate claim
    ORACLE           // planning/synthesis oracle unavailable or unparseable
};

const char* error_kind_str(ErrorKind kind);

// Thrown by oracle adapters and plan validation only. The coordinator
// catches it and takes the documented fallback path.
class SwarmError : public std::runtime_error {
public:
    SwarmError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace webswarm

#endif // WEBSWARM_CORE_ERROR_HPP
