// Session state machine tests
#include <tcpmcp/session.hpp>
#include "check.hpp"
#include "scripted_server.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace tcpmcp;
using tcpmcp::testing::check;
using tcpmcp::testing::check_throws;
using tcpmcp::testing::Reply;
using tcpmcp::testing::ScriptedServer;

namespace {

Message frame(const std::string& text) {
    return parse_message(text);
}

} // namespace

int main() {
    return tcpmcp::testing::run_tests("session", []() {
        {
            ToolSession session("1");
            check(session.state() == SessionState::PENDING && !session.finished(), "new session is pending");
            session.on_message(frame(R"({"type":"response","id":"1","result":{"server":"ushell","version":"1.0"}})"));
            check(session.state() == SessionState::COMPLETED && session.outcome().result["server"] == "ushell",
                  "initialize response completes the session");
        }

        {
            std::vector<std::string> streamed;
            ToolSession session("call_pwd");
            session.set_notification_handler([&streamed](const Notification& n) { streamed.push_back(n.event); });

            session.on_message(frame(R"({"type":"notification","event":"tool_started","message":"pwd"})"));
            check(session.state() == SessionState::IN_PROGRESS && streamed.size() == 1,
                  "notification forwarded immediately and moves to IN_PROGRESS");

            session.on_message(frame(R"({"type":"response","id":"call_pwd","result":{"output":"/home/user","exit_code":0}})"));
            check(session.state() == SessionState::COMPLETED &&
                  session.outcome().notifications.size() == 1 &&
                  session.outcome().result["output"] == "/home/user",
                  "pwd call: one notification then COMPLETED");
        }

        {
            ToolSession session("3");
            session.on_message(frame(R"({"type":"error","id":"3","error":"tool not found"})"));
            check(session.state() == SessionState::FAILED &&
                  session.outcome().failure == FailureKind::TOOL_ERROR &&
                  session.outcome().error == "tool not found",
                  "matching error fails with the literal message");
        }

        {
            ToolSession session("3");
            session.on_message(frame(R"({"type":"response","id":"99","result":{}})"));
            check(session.state() == SessionState::FAILED &&
                  session.outcome().failure == FailureKind::CORRELATION,
                  "mismatched response id is a correlation failure");

            ToolSession error_session("3");
            error_session.on_message(frame(R"({"type":"error","id":"99","error":"tool not found"})"));
            check(error_session.outcome().failure == FailureKind::CORRELATION,
                  "mismatched error id is a correlation failure too");
        }

        {
            ToolSession session("5");
            session.on_message(frame(R"({"id":null,"type":"error","error":"Failed to parse request"})"));
            check(session.state() == SessionState::FAILED &&
                  session.outcome().failure == FailureKind::TOOL_ERROR &&
                  session.outcome().error == "Failed to parse request",
                  "error without id is attributed to the outstanding request");
        }

        {
            ToolSession session("8");
            for (const char* event : {"N1", "N2", "N3"}) {
                session.on_message(Message::notification(event, ""));
            }
            session.on_message(Message::response("8", json::object()));
            const auto& seen = session.outcome().notifications;
            check(seen.size() == 3 && seen[0].event == "N1" && seen[1].event == "N2" && seen[2].event == "N3",
                  "notifications observed in wire order");
        }

        {
            // Terminal states absorb everything that follows
            ToolSession session("4");
            session.on_message(Message::response("4", {{"output", "first"}}));
            session.on_message(Message::failure("4", "late"));
            session.on_message(Message::notification("tool_progress", "late"));
            session.on_timeout("late");
            session.on_connection_lost("late");
            check(session.state() == SessionState::COMPLETED && session.outcome().result["output"] == "first" &&
                  session.outcome().notifications.empty(),
                  "exactly one terminal state is reached");

            ToolSession timed_out("4");
            timed_out.on_timeout("deadline");
            timed_out.on_message(Message::response("4", json::object()));
            check(timed_out.state() == SessionState::TIMED_OUT, "TIMED_OUT is final");

            ToolSession lost("4");
            lost.on_message(Message::notification("tool_started", "x"));
            lost.on_connection_lost("eof");
            check(lost.state() == SessionState::CONNECTION_LOST &&
                  lost.outcome().failure == FailureKind::CONNECTION_CLOSED,
                  "closure before a terminal message is CONNECTION_LOST");
        }

        {
            ToolSession abort_session("6");
            abort_session.on_message(frame("{oops"));
            check(abort_session.state() == SessionState::FAILED &&
                  abort_session.outcome().failure == FailureKind::DECODE &&
                  abort_session.outcome().malformed.size() == 1,
                  "malformed frame aborts by default");

            ToolSession skip_session("6", MalformedPolicy::SKIP);
            skip_session.on_message(frame(R"({"type":"notification","event":"a","message":""})"));
            skip_session.on_message(frame("{oops"));
            skip_session.on_message(frame(R"({"type":"notification","event":"b","message":""})"));
            skip_session.on_message(frame(R"({"type":"response","id":"6","result":{}})"));
            check(skip_session.state() == SessionState::COMPLETED &&
                  skip_session.outcome().notifications.size() == 2 &&
                  skip_session.outcome().malformed.size() == 1,
                  "skipped malformed frame leaves its neighbours intact");
        }

        // Driven over a real socket
        {
            ScriptedServer server([](const json&) {
                return ScriptedServer::frames({
                    R"({"id":null,"type":"notification","event":"tool_started","message":"ls"})",
                    R"({"id":null,"type":"notification","event":"tool_progress","message":"half"})",
                    R"({"id":"{id}","type":"response","result":{"output":"a b","exit_code":0}})"
                }, 1);
            });
            Connection connection;
            connection.connect("127.0.0.1", server.port(), std::chrono::seconds(2));

            Request request{"41", method::kCallTool, {{"tool", "ls"}, {"args", json::object()}}};
            connection.send(request);

            ToolSession session("41");
            const SessionOutcome& outcome = session.run(connection, std::chrono::seconds(5));
            check(outcome.completed() && outcome.notifications.size() == 2 &&
                  outcome.notifications[1].message == "half" && !connection.needs_reconnect(),
                  "byte-at-a-time delivery still yields notifications then COMPLETED");
        }

        {
            ScriptedServer server([](const json&) {
                return ScriptedServer::frames({R"({"type":"notification","event":"tool_started","message":"sleep"})"});
            });
            Connection connection;
            connection.connect("127.0.0.1", server.port(), std::chrono::seconds(2));
            connection.send(Request{"1", method::kCallTool, {{"tool", "sleep"}, {"args", json::object()}}});

            ToolSession session("1");
            session.run(connection, std::chrono::milliseconds(200));
            check(session.state() == SessionState::TIMED_OUT && session.outcome().notifications.size() == 1,
                  "silence after progress times out");
            check(connection.is_connected() && connection.needs_reconnect(),
                  "timed-out connection stays open but requires reconnect");
        }

        {
            ScriptedServer server([](const json&) {
                Reply reply = ScriptedServer::frames({R"({"type":"notification","event":"tool_started","message":"x"})"});
                reply.writes.push_back("{\"type\":\"response\",\"id\":");
                reply.close = true;
                return reply;
            });
            Connection connection;
            connection.connect("127.0.0.1", server.port(), std::chrono::seconds(2));
            connection.send(Request{"2", method::kCallTool, json::object()});

            ToolSession session("2");
            session.run(connection, std::chrono::seconds(5));
            check(session.state() == SessionState::CONNECTION_LOST && !connection.is_connected(),
                  "server closing mid-response loses the connection without a fabricated frame");
        }

        {
            ScriptedServer server([](const json&) {
                return ScriptedServer::frames({R"({"type":"response","id":"99","result":{}})"});
            });
            Connection connection;
            connection.connect("127.0.0.1", server.port(), std::chrono::seconds(2));
            connection.send(Request{"3", method::kCallTool, json::object()});

            ToolSession session("3");
            session.run(connection, std::chrono::seconds(5));
            check(session.outcome().failure == FailureKind::CORRELATION && connection.needs_reconnect(),
                  "desynchronized connection requires reconnect");
        }

        {
            ScriptedServer server([](const json&) {
                return ScriptedServer::frames({R"({"type":"response","id":"{id}","result":{"output":"","exit_code":0}})"});
            });
            Connection connection;
            connection.connect("127.0.0.1", server.port(), std::chrono::seconds(2));
            connection.send(Request{"4", method::kCallTool, json::object()});

            ToolSession session("4");
            session.run(connection, std::chrono::milliseconds::max());
            check(session.state() == SessionState::COMPLETED && !connection.needs_reconnect(),
                  "largest representable timeout waits for the reply instead of expiring at once");
        }

        {
            ScriptedServer server([](const json&) {
                return ScriptedServer::frames({
                    R"({"type":"notification","event":"tool_started","message":"ls"})",
                    R"({"type":"response","id":"{id}","result":{"output":"","exit_code":0}})"
                });
            });
            Connection connection;
            connection.connect("127.0.0.1", server.port(), std::chrono::seconds(2));
            connection.send(Request{"5", method::kCallTool, json::object()});

            ToolSession session("5");
            session.set_notification_handler([](const Notification&) {
                throw std::runtime_error("display failed");
            });
            check_throws<std::runtime_error>([&]() { session.run(connection, std::chrono::seconds(5)); },
                                             "notification handler exception reaches the caller");
            check(connection.is_connected() && connection.needs_reconnect(),
                  "connection with the rest of the reply unread requires reconnect");
        }
    });
}
