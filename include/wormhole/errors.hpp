#ifndef WORMHOLE_ERRORS_HPP
#define WORMHOLE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Wormhole {

/**
 * @brief Base class for all Wormhole exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

/**
 * @brief The rendezvous server or the other end took longer than allowed to respond.
 */
class TimeoutError : public RuntimeError {
public:
    explicit TimeoutError(const std::string& message) : RuntimeError(message) {}
    explicit TimeoutError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief One of the humans did something that breaks the wormhole,
 * e.g. entered the wrong code or declined the file.
 */
class HumanProtocolError : public RuntimeError {
public:
    explicit HumanProtocolError(const std::string& message) : RuntimeError(message) {}
    explicit HumanProtocolError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief The other side did not follow the protocol.
 */
class ProtocolViolation : public RuntimeError {
public:
    explicit ProtocolViolation(const std::string& message) : RuntimeError(message) {}
    explicit ProtocolViolation(const char* message) : RuntimeError(message) {}
};

/**
 * @brief A control message or record could not be decoded.
 */
class MalformedMessage : public ProtocolViolation {
public:
    explicit MalformedMessage(const std::string& message) : ProtocolViolation(message) {}
    explicit MalformedMessage(const char* message) : ProtocolViolation(message) {}
};

/**
 * @brief The digests computed at the two ends of a transfer differ.
 */
class IntegrityError : public RuntimeError {
public:
    explicit IntegrityError(const std::string& message) : RuntimeError(message) {}
    explicit IntegrityError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief The data stream ended before the whole file was transferred.
 */
class TransferIncomplete : public RuntimeError {
public:
    explicit TransferIncomplete(const std::string& message) : RuntimeError(message) {}
    explicit TransferIncomplete(const char* message) : RuntimeError(message) {}
};

/**
 * @brief Raised by rendezvous clients when key confirmation fails, i.e. the
 * two ends used different codes.
 */
class WrongSecretError : public RuntimeError {
public:
    explicit WrongSecretError(const std::string& message) : RuntimeError(message) {}
    explicit WrongSecretError(const char* message) : RuntimeError(message) {}
};

} // namespace Wormhole

#endif // WORMHOLE_ERRORS_HPP
