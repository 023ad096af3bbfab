#include <tcpmcp/session.hpp>
#include <tcpmcp/correlator.hpp>
#include <tcpmcp/errors.hpp>

#include <iostream>

namespace tcpmcp {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::PENDING: return "PENDING";
        case SessionState::IN_PROGRESS: return "IN_PROGRESS";
        case SessionState::COMPLETED: return "COMPLETED";
        case SessionState::FAILED: return "FAILED";
        case SessionState::TIMED_OUT: return "TIMED_OUT";
        case SessionState::CONNECTION_LOST: return "CONNECTION_LOST";
    }
    return "UNKNOWN";
}

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE: return "none";
        case FailureKind::TOOL_ERROR: return "tool error";
        case FailureKind::CORRELATION: return "correlation error";
        case FailureKind::DECODE: return "protocol decode error";
        case FailureKind::TIMEOUT: return "timeout";
        case FailureKind::CONNECTION_CLOSED: return "connection closed";
        case FailureKind::IO: return "I/O error";
    }
    return "unknown";
}

bool is_terminal(SessionState state) {
    return state != SessionState::PENDING && state != SessionState::IN_PROGRESS;
}

ToolSession::ToolSession(const std::string& request_id, MalformedPolicy policy)
    : policy_(policy) {
    outcome_.request_id = request_id;
}

SessionState ToolSession::on_message(const Message& message) {
    if (finished()) {
        return outcome_.state;
    }

    switch (message.type) {
        case MessageType::NOTIFICATION: {
            Notification notification{message.event, message.text};
            outcome_.state = SessionState::IN_PROGRESS;
            outcome_.notifications.push_back(notification);
            if (on_notification_) {
                on_notification_(notification);
            }
            return outcome_.state;
        }

        case MessageType::MALFORMED:
            outcome_.malformed.push_back(message);
            if (policy_ == MalformedPolicy::SKIP) {
                std::cerr << "Skipping malformed frame: " << message.cause << std::endl;
                return outcome_.state;
            }
            return finish(SessionState::FAILED, FailureKind::DECODE,
                          ProtocolDecodeError(message.raw, message.cause).what());

        case MessageType::RESPONSE:
        case MessageType::ERROR:
            break;
    }

    // "id": null on an error means the server could not read the request at
    // all; with one request outstanding it can only be ours.
    if (message.type == MessageType::ERROR && !message.has_id) {
        return finish(SessionState::FAILED, FailureKind::TOOL_ERROR, message.error);
    }

    if (!RequestCorrelator::matches(message, outcome_.request_id)) {
        return finish(SessionState::FAILED, FailureKind::CORRELATION,
                      CorrelationError(outcome_.request_id, message.id).what());
    }

    if (message.type == MessageType::RESPONSE) {
        outcome_.result = message.result;
        return finish(SessionState::COMPLETED, FailureKind::NONE, "");
    }
    return finish(SessionState::FAILED, FailureKind::TOOL_ERROR, message.error);
}

SessionState ToolSession::on_timeout(const std::string& detail) {
    if (finished()) return outcome_.state;
    return finish(SessionState::TIMED_OUT, FailureKind::TIMEOUT, detail);
}

SessionState ToolSession::on_connection_lost(const std::string& detail) {
    if (finished()) return outcome_.state;
    return finish(SessionState::CONNECTION_LOST, FailureKind::CONNECTION_CLOSED, detail);
}

SessionState ToolSession::on_io_error(const std::string& detail) {
    if (finished()) return outcome_.state;
    return finish(SessionState::CONNECTION_LOST, FailureKind::IO, detail);
}

const SessionOutcome& ToolSession::run(Connection& connection, std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = deadline_after(timeout);

    while (!finished()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() < 0) {
            left = std::chrono::milliseconds(0);
        }

        try {
            on_message(connection.receive_next(left));
        } catch (const TimeoutError& e) {
            on_timeout(e.what());
        } catch (const ConnectionClosed& e) {
            on_connection_lost(e.what());
        } catch (const IOError& e) {
            on_io_error(e.what());
        } catch (...) {
            // Thrown by the notification handler; the rest of the reply is still on the wire
            if (connection.is_connected()) {
                connection.require_reconnect("notification handler failed for request " + outcome_.request_id);
            }
            throw;
        }
    }

    switch (outcome_.failure) {
        case FailureKind::TIMEOUT:
        case FailureKind::CORRELATION:
        case FailureKind::DECODE:
            if (connection.is_connected()) {
                connection.require_reconnect("request " + outcome_.request_id + " ended with " +
                                             to_string(outcome_.failure));
            }
            break;
        default:
            break;
    }

    return outcome_;
}

SessionState ToolSession::finish(SessionState state, FailureKind failure, const std::string& error) {
    outcome_.state = state;
    outcome_.failure = failure;
    outcome_.error = error;
    return state;
}

} // namespace tcpmcp
