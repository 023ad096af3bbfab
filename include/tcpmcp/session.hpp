#ifndef TCPMCP_SESSION_HPP
#define TCPMCP_SESSION_HPP

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <tcpmcp/connection.hpp>
#include <tcpmcp/message.hpp>

namespace tcpmcp {

enum class SessionState {
    PENDING,          // request sent, nothing received yet
    IN_PROGRESS,      // at least one notification received
    COMPLETED,
    FAILED,
    TIMED_OUT,
    CONNECTION_LOST
};

// Why a session did not complete
enum class FailureKind {
    NONE,
    TOOL_ERROR,         // server answered with an error message
    CORRELATION,        // terminal message for another request id
    DECODE,             // malformed frame under MalformedPolicy::ABORT
    TIMEOUT,
    CONNECTION_CLOSED,
    IO
};

// What to do with a frame that fails to decode
enum class MalformedPolicy {
    ABORT,
    SKIP
};

const char* to_string(SessionState state);
const char* to_string(FailureKind kind);
bool is_terminal(SessionState state);

struct SessionOutcome {
    SessionState state = SessionState::PENDING;
    FailureKind failure = FailureKind::NONE;
    std::string request_id;

    // Every notification observed, in wire order
    std::vector<Notification> notifications;

    // Set when COMPLETED
    json result;

    // Error text for every other terminal state. For TOOL_ERROR this is the
    // server's literal message.
    std::string error;

    // Malformed frames seen during the exchange
    std::vector<Message> malformed;

    bool completed() const { return state == SessionState::COMPLETED; }
};

/**
 * State machine for one request/response exchange.
 *
 * Notifications move the session to IN_PROGRESS and are handed to the
 * notification handler as soon as they are decoded. The first terminal
 * message decides the outcome; once a terminal state is reached further
 * input is ignored.
 */
class ToolSession {
public:
    using NotificationHandler = std::function<void(const Notification&)>;

    explicit ToolSession(const std::string& request_id,
                         MalformedPolicy policy = MalformedPolicy::ABORT);

    void set_notification_handler(NotificationHandler handler) { on_notification_ = std::move(handler); }

    SessionState on_message(const Message& message);
    SessionState on_timeout(const std::string& detail);
    SessionState on_connection_lost(const std::string& detail);
    SessionState on_io_error(const std::string& detail);

    // Reads from `connection` until a terminal state or until `timeout`
    // elapses for the exchange as a whole. Transport exceptions become
    // terminal states. A connection left holding unread data for this
    // request (timeout, desync, aborted decode) is marked for reconnect.
    const SessionOutcome& run(Connection& connection, std::chrono::milliseconds timeout);

    SessionState state() const { return outcome_.state; }
    bool finished() const { return is_terminal(outcome_.state); }
    const std::string& request_id() const { return outcome_.request_id; }

    const SessionOutcome& outcome() const { return outcome_; }
    SessionOutcome take_outcome() { return std::move(outcome_); }

private:
    SessionState finish(SessionState state, FailureKind failure, const std::string& error);

    SessionOutcome outcome_;
    MalformedPolicy policy_;
    NotificationHandler on_notification_;
};

} // namespace tcpmcp

#endif // TCPMCP_SESSION_HPP
