#pragma once

#include <atomic>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

class ActionDispatcher;

// Inbound:  {"type":"model-action","action":"<name>"}
// Outbound: {"type":"iframe-ready"}
// One JSON object per line.

struct ModelActionMessage {
    std::string action;
};

// Any other well-formed message; dropped without a response.
struct IgnoredMessage {
    std::string type;
};

// A line that wasn't a JSON object. Carried to the main thread so that all
// stdout writes (log lines and protocol lines) happen on one thread.
struct MalformedMessage {
    std::string line;
};

using InboundMessage = std::variant<ModelActionMessage, IgnoredMessage, MalformedMessage>;

namespace protocol {

inline constexpr const char* MODEL_ACTION_TYPE = "model-action";
inline constexpr const char* READY_TYPE = "iframe-ready";

// nullopt for lines that are not a JSON object.
std::optional<InboundMessage> parseInbound(const std::string& line);

std::string readyMessage();

// Hands model actions to the dispatcher and reports malformed lines;
// everything else is ignored.
void route(const InboundMessage& msg, ActionDispatcher& dispatcher);

} // namespace protocol

// Thread-safe hand-off from the reader thread to the frame loop.
class MessageInbox {
public:
    void push(InboundMessage msg);

    // Main thread, once per frame. Returns messages in arrival order.
    std::vector<InboundMessage> drain();

    bool empty() const;

private:
    mutable std::mutex m_mutex;
    std::vector<InboundMessage> m_queue;
};

// Reads protocol lines from a stream on a background thread. The thread only
// touches the inbox; it never logs.
// The stream must outlive the reader thread (std::cin in practice).
class LineMessageReader {
public:
    LineMessageReader(std::istream& in, std::shared_ptr<MessageInbox> inbox);
    ~LineMessageReader();

    LineMessageReader(const LineMessageReader&) = delete;
    LineMessageReader& operator=(const LineMessageReader&) = delete;

    void start();
    bool finished() const { return m_finished->load(); }

private:
    std::istream& m_in;
    std::shared_ptr<MessageInbox> m_inbox;
    std::shared_ptr<std::atomic<bool>> m_finished;
    std::thread m_thread;

    static void run(std::istream& in, std::shared_ptr<MessageInbox> inbox,
                    std::shared_ptr<std::atomic<bool>> finished);
};

// Emits the readiness notification at most once.
class ReadyNotifier {
public:
    explicit ReadyNotifier(std::ostream& out) : m_out(out) {}

    // Returns true only for the call that actually wrote the message.
    bool notify();
    bool sent() const { return m_sent; }

private:
    std::ostream& m_out;
    bool m_sent = false;
};
