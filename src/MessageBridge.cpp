#include "MessageBridge.hpp"

#include "ActionDispatcher.hpp"
#include "Util.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace protocol {

std::optional<InboundMessage> parseInbound(const std::string& line) {
    nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        return InboundMessage{IgnoredMessage{}};
    }

    std::string type = typeIt->get<std::string>();
    if (type != MODEL_ACTION_TYPE) {
        return InboundMessage{IgnoredMessage{type}};
    }

    auto actionIt = j.find("action");
    if (actionIt == j.end() || !actionIt->is_string()) {
        // Still a model action; the dispatcher reports the empty name as unknown
        return InboundMessage{ModelActionMessage{}};
    }
    return InboundMessage{ModelActionMessage{actionIt->get<std::string>()}};
}

std::string readyMessage() {
    nlohmann::json j = {{"type", READY_TYPE}};
    return j.dump();
}

void route(const InboundMessage& msg, ActionDispatcher& dispatcher) {
    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ModelActionMessage>) {
            dispatcher.dispatch(m.action);
        } else if constexpr (std::is_same_v<T, MalformedMessage>) {
            util::logWarn("Ignoring malformed message: " + m.line);
        }
    }, msg);
}

} // namespace protocol

void MessageInbox::push(InboundMessage msg) {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_queue.push_back(std::move(msg));
}

std::vector<InboundMessage> MessageInbox::drain() {
    std::vector<InboundMessage> out;
    std::lock_guard<std::mutex> lk(m_mutex);
    out.swap(m_queue);
    return out;
}

bool MessageInbox::empty() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_queue.empty();
}

LineMessageReader::LineMessageReader(std::istream& in, std::shared_ptr<MessageInbox> inbox)
    : m_in(in), m_inbox(std::move(inbox)), m_finished(std::make_shared<std::atomic<bool>>(false)) {}

LineMessageReader::~LineMessageReader() {
    if (!m_thread.joinable()) return;
    if (m_finished->load()) {
        m_thread.join();
    } else {
        // Blocked in getline on an open stream; nothing can wake it up.
        // The thread only touches the shared inbox and flag from here on.
        m_thread.detach();
    }
}

void LineMessageReader::start() {
    if (m_thread.joinable()) return;
    m_thread = std::thread(&LineMessageReader::run, std::ref(m_in), m_inbox, m_finished);
}

void LineMessageReader::run(std::istream& in, std::shared_ptr<MessageInbox> inbox,
                            std::shared_ptr<std::atomic<bool>> finished) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto msg = protocol::parseInbound(line);
        if (!msg) {
            inbox->push(MalformedMessage{std::move(line)});
            continue;
        }
        inbox->push(std::move(*msg));
    }
    finished->store(true);
}

bool ReadyNotifier::notify() {
    if (m_sent) return false;
    m_sent = true;
    m_out << protocol::readyMessage() << std::endl;
    return true;
}
