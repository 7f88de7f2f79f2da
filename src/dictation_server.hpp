#ifndef LIVEDICT_DICTATION_SERVER_HPP
#define LIVEDICT_DICTATION_SERVER_HPP

#include "client_channel.hpp"
#include "config.hpp"
#include "session.hpp"
#include "transcription.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <cstdint>

// Per-socket user data
struct PerSocketData {
    std::string client_id;
};

// The connected client: its socket, outgoing channel and dictation session
struct Client {
    std::string id;
    std::unique_ptr<ClientChannel> channel;
    std::unique_ptr<Session> session;
    std::atomic<bool> active{true};
    std::atomic<bool> ticking{false};

    // WebSocket handle (event loop thread only)
    void* ws_handle = nullptr;

    // Whether a flush has been scheduled (prevents spamming defer)
    std::atomic<bool> flush_pending{false};
};

// Main server class.
//
// One client at a time owns the engine. The uWS event loop thread feeds
// audio and control messages in; the inference thread ticks the session;
// outgoing messages are handed back to the event loop through defer().
class DictationServer {
public:
    DictationServer(const DictationConfig& config, TranscriptionPort& engine);
    ~DictationServer();

    // Start the inference thread
    void run();

    // Stop the inference thread and drop the client
    void stop();

    bool isRunning() const { return running_.load(); }

    // === Public methods for WebSocket handlers ===

    // Returns nullptr if another client is connected
    std::shared_ptr<Client> createClient(const std::string& id);
    void destroyClient(const std::string& id);

    void onAudioReceived(const std::string& client_id, const int16_t* data, size_t len);
    void onControlMessage(const std::string& client_id, std::string_view text);

    // Event loop integration for message flushing
    void setEventLoop(void* loop);
    void attachWebSocket(const std::string& client_id, void* ws_handle);
    void detachWebSocket(const std::string& client_id);

    std::string makeReadyMessage() const;

private:
    DictationConfig config_;
    TranscriptionPort& engine_;

    std::shared_ptr<Client> client_;
    mutable std::mutex client_mutex_;

    std::atomic<bool> running_{false};
    std::thread inference_thread_;

    // Event loop for deferred message flushing
    void* loop_ = nullptr;

    std::shared_ptr<Client> findClient(const std::string& id) const;

    // Inference loop
    void inferenceLoop();

    // Message flush methods
    void notifyClientHasMessages(const std::string& client_id);
    void flushClientMessagesOnEventLoop(const std::string& client_id);
};

#endif // LIVEDICT_DICTATION_SERVER_HPP
