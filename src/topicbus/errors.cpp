#include "errors.hpp"

namespace topicbus {

SenderDenied::SenderDenied(const std::string& sender, const std::string& topic_id)
    : Error("Sender '" + sender + "' blocked by security policy in topic '" + topic_id + "'")
    , sender_(sender) {
}

HandlerExecutionError::HandlerExecutionError(const std::string& handler_name, std::exception_ptr cause)
    : Error("Handler '" + handler_name + "' failed: " + describe(cause))
    , handler_name_(handler_name)
    , cause_(cause) {
}

CustomHandlerFailure::CustomHandlerFailure(const std::string& topic_id, std::exception_ptr cause)
    : Error("Error in custom error handler for topic '" + topic_id + "': " + describe(cause))
    , cause_(cause) {
}

TopicProcessingError::TopicProcessingError(const std::string& topic_id, std::exception_ptr cause)
    : Error("Critical error in topic '" + topic_id + "': " + describe(cause))
    , cause_(cause) {
}

TopicNotFound::TopicNotFound(const std::string& topic_id)
    : Error("Topic with ID '" + topic_id + "' not found")
    , topic_id_(topic_id) {
}

NoBrokerError::NoBrokerError(const std::string& topic_id)
    : Error("No broker assigned to topic " + topic_id + ". Cannot send message.") {
}

std::string describe(std::exception_ptr error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace topicbus
