#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace topicbus {

/**
 * Base of every error raised by the bus.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

/// A publish was rejected by the topic's blacklist or whitelist.
class SenderDenied : public Error {
public:
    SenderDenied(const std::string& sender, const std::string& topic_id);

    const std::string& sender() const { return sender_; }

private:
    std::string sender_;
};

/// A handler threw while processing a payload. The original exception is kept in cause().
class HandlerExecutionError : public Error {
public:
    HandlerExecutionError(const std::string& handler_name, std::exception_ptr cause);

    const std::string& handler_name() const { return handler_name_; }
    std::exception_ptr cause() const { return cause_; }

private:
    std::string handler_name_;
    std::exception_ptr cause_;
};

/// The CUSTOM error handler itself threw. Only ever logged.
class CustomHandlerFailure : public Error {
public:
    CustomHandlerFailure(const std::string& topic_id, std::exception_ptr cause);

    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

/// Thrown to the publisher when a topic runs with ErrorStrategy::Raise.
class TopicProcessingError : public Error {
public:
    TopicProcessingError(const std::string& topic_id, std::exception_ptr cause);

    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

class TopicNotFound : public Error {
public:
    explicit TopicNotFound(const std::string& topic_id);

    const std::string& topic_id() const { return topic_id_; }

private:
    std::string topic_id_;
};

class MessageValidationError : public Error {
public:
    explicit MessageValidationError(const std::string& message)
        : Error(message) {}
};

/// A handler sender closure was used on a topic that has no broker.
class NoBrokerError : public Error {
public:
    explicit NoBrokerError(const std::string& topic_id);
};

/// Renders a captured exception as text ("unknown error" for non-std exceptions).
std::string describe(std::exception_ptr error);

} // namespace topicbus
