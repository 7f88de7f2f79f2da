#ifndef LIVEDICT_CLIENT_CHANNEL_HPP
#define LIVEDICT_CLIENT_CHANNEL_HPP

#include "diff_injector.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

// Control messages the client sends as JSON text frames
enum class ControlType { Start, Stop, Toggle, InjectError };

struct ControlMessage {
    ControlType type = ControlType::Toggle;
    std::string message;    // inject_error detail
};

// Outgoing side of the client connection.
//
// Producer threads (inference loop, control handlers) enqueue JSON messages;
// the socket's event loop drains and sends them. Doubles as the keystroke
// sink: edits become delete/insert messages the client applies at its
// input focus.
class ClientChannel : public KeystrokeSink {
public:
    explicit ClientChannel(const std::string& id);

    const std::string& id() const { return id_; }

    // KeystrokeSink: fail once the client is gone
    bool deleteChars(size_t count) override;
    bool insertText(const std::string& text) override;

    // Thread-safe outgoing message queue
    void enqueueMessage(const std::string& msg);

    // Returns all pending messages and clears the queue
    std::deque<std::string> drainMessages();

    // Called after every enqueue, from the enqueuing thread
    void setNotifier(std::function<void()> notifier);

    void close() { open_.store(false); }
    bool isOpen() const { return open_.load(); }

    // === JSON message helpers ===
    static std::string makeReadyMessage(const std::string& model, int sample_rate);
    static std::string makeStateMessage(const std::string& state);
    static std::string makeDeleteMessage(size_t count);
    static std::string makeInsertMessage(const std::string& text);
    static std::string makeTranscriptMessage(const std::string& committed, const std::string& tentative);
    static std::string makeFinalMessage(const std::string& text);
    static std::string makeErrorMessage(const std::string& error);

    // Parse a client text frame. Returns false with `error` set on bad input.
    static bool parseControlMessage(std::string_view text, ControlMessage& out, std::string& error);

private:
    std::string id_;
    std::atomic<bool> open_{true};

    std::mutex outgoing_mutex_;
    std::deque<std::string> outgoing_messages_;

    std::mutex notifier_mutex_;
    std::function<void()> notifier_;
};

#endif // LIVEDICT_CLIENT_CHANNEL_HPP
