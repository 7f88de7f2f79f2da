#include "client_channel.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Engine text can carry a split UTF-8 sequence; never let that throw
static std::string dumpMessage(const json& msg) {
    return msg.dump(-1, ' ', false, json::error_handler_t::replace);
}

ClientChannel::ClientChannel(const std::string& id)
    : id_(id) {
}

bool ClientChannel::deleteChars(size_t count) {
    if (!isOpen()) return false;
    if (count == 0) return true;
    enqueueMessage(makeDeleteMessage(count));
    return true;
}

bool ClientChannel::insertText(const std::string& text) {
    if (!isOpen()) return false;
    if (text.empty()) return true;
    enqueueMessage(makeInsertMessage(text));
    return true;
}

void ClientChannel::enqueueMessage(const std::string& msg) {
    {
        std::lock_guard<std::mutex> lock(outgoing_mutex_);
        outgoing_messages_.push_back(msg);
    }

    std::function<void()> notifier;
    {
        std::lock_guard<std::mutex> lock(notifier_mutex_);
        notifier = notifier_;
    }
    if (notifier) notifier();
}

std::deque<std::string> ClientChannel::drainMessages() {
    std::lock_guard<std::mutex> lock(outgoing_mutex_);
    std::deque<std::string> messages;
    messages.swap(outgoing_messages_);
    return messages;
}

void ClientChannel::setNotifier(std::function<void()> notifier) {
    std::lock_guard<std::mutex> lock(notifier_mutex_);
    notifier_ = std::move(notifier);
}

// === JSON Message Helpers ===

std::string ClientChannel::makeReadyMessage(const std::string& model, int sample_rate) {
    json msg;
    msg["type"] = "ready";
    msg["model"] = model;
    msg["sample_rate"] = sample_rate;
    return dumpMessage(msg);
}

std::string ClientChannel::makeStateMessage(const std::string& state) {
    json msg;
    msg["type"] = "state";
    msg["state"] = state;
    return dumpMessage(msg);
}

std::string ClientChannel::makeDeleteMessage(size_t count) {
    json msg;
    msg["type"] = "delete";
    msg["count"] = count;
    return dumpMessage(msg);
}

std::string ClientChannel::makeInsertMessage(const std::string& text) {
    json msg;
    msg["type"] = "insert";
    msg["text"] = text;
    return dumpMessage(msg);
}

std::string ClientChannel::makeTranscriptMessage(const std::string& committed, const std::string& tentative) {
    json msg;
    msg["type"] = "transcript";
    msg["committed"] = committed;
    msg["tentative"] = tentative;
    return dumpMessage(msg);
}

std::string ClientChannel::makeFinalMessage(const std::string& text) {
    json msg;
    msg["type"] = "final";
    msg["text"] = text;
    return dumpMessage(msg);
}

std::string ClientChannel::makeErrorMessage(const std::string& error) {
    json msg;
    msg["type"] = "error";
    msg["message"] = error;
    return dumpMessage(msg);
}

bool ClientChannel::parseControlMessage(std::string_view text, ControlMessage& out, std::string& error) {
    json msg = json::parse(text.begin(), text.end(), nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        error = "control message must be a JSON object";
        return false;
    }

    auto type_it = msg.find("type");
    if (type_it == msg.end() || !type_it->is_string()) {
        error = "control message needs a string \"type\"";
        return false;
    }

    const std::string type = type_it->get<std::string>();
    if (type == "start") {
        out.type = ControlType::Start;
    } else if (type == "stop") {
        out.type = ControlType::Stop;
    } else if (type == "toggle") {
        out.type = ControlType::Toggle;
    } else if (type == "inject_error") {
        out.type = ControlType::InjectError;
        auto detail = msg.find("message");
        out.message = (detail != msg.end() && detail->is_string())
            ? detail->get<std::string>()
            : "unspecified";
    } else {
        error = "unknown control message type '" + type + "'";
        return false;
    }

    return true;
}
