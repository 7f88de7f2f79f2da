#include "dictation_server.hpp"

#include <App.h>  // For uWS::Loop and WebSocket types

#include <chrono>
#include <iostream>

DictationServer::DictationServer(const DictationConfig& config, TranscriptionPort& engine)
    : config_(config)
    , engine_(engine) {
}

DictationServer::~DictationServer() {
    stop();
}

void DictationServer::run() {
    running_ = true;

    inference_thread_ = std::thread(&DictationServer::inferenceLoop, this);

    std::cout << "[livedict] Inference: step=" << config_.step_ms << "ms, window="
              << config_.window_ms << "ms, buffer=" << config_.buffer_seconds << "s" << std::endl;
    std::cout << "[livedict] Stability: " << config_.stability_passes << " passes, hangover="
              << config_.hangover_ms << "ms (" << hangoverPolicyName(config_.hangover_policy) << ")"
              << std::endl;
}

void DictationServer::stop() {
    if (!running_) return;

    running_ = false;

    if (inference_thread_.joinable()) {
        inference_thread_.join();
    }

    std::lock_guard<std::mutex> lock(client_mutex_);
    if (client_) {
        client_->active = false;
        client_->channel->close();
        client_.reset();
    }
}

std::shared_ptr<Client> DictationServer::findClient(const std::string& id) const {
    std::lock_guard<std::mutex> lock(client_mutex_);
    if (client_ && client_->id == id) return client_;
    return nullptr;
}

std::shared_ptr<Client> DictationServer::createClient(const std::string& id) {
    std::lock_guard<std::mutex> lock(client_mutex_);
    if (client_) {
        std::cerr << "[livedict] Rejecting " << id << ": " << client_->id
                  << " is already connected" << std::endl;
        return nullptr;
    }

    auto client = std::make_shared<Client>();
    client->id = id;
    client->channel = std::make_unique<ClientChannel>(id);
    client->session = std::make_unique<Session>(id, config_, engine_, *client->channel);

    ClientChannel* channel = client->channel.get();
    client->channel->setNotifier([this, id]() { notifyClientHasMessages(id); });

    SessionCallbacks callbacks;
    callbacks.on_state = [channel](SessionState state) {
        channel->enqueueMessage(ClientChannel::makeStateMessage(sessionStateName(state)));
    };
    callbacks.on_transcript = [channel](const std::string& committed, const std::string& tentative) {
        channel->enqueueMessage(ClientChannel::makeTranscriptMessage(committed, tentative));
    };
    callbacks.on_final = [channel](const std::string& text) {
        channel->enqueueMessage(ClientChannel::makeFinalMessage(text));
    };
    client->session->setCallbacks(std::move(callbacks));

    client_ = client;
    std::cout << "[livedict] Created client " << id << std::endl;
    return client;
}

void DictationServer::destroyClient(const std::string& id) {
    std::shared_ptr<Client> client;

    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (client_ && client_->id == id) {
            client = client_;
            client_.reset();
        }
    }

    if (client) {
        client->active = false;
        client->channel->close();

        // Wait for any ongoing pass to complete
        while (client->ticking) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (client->session->state() != SessionState::Idle) {
            std::cout << "[livedict] Client " << id << " left mid-session ("
                      << sessionStateName(client->session->state()) << "), transcript dropped"
                      << std::endl;
        }
        std::cout << "[livedict] Destroyed client " << id << std::endl;
    }
}

void DictationServer::onAudioReceived(const std::string& client_id, const int16_t* data, size_t len) {
    std::shared_ptr<Client> client = findClient(client_id);
    if (client && client->active) {
        client->session->onAudio(data, len);
    }
}

void DictationServer::onControlMessage(const std::string& client_id, std::string_view text) {
    std::shared_ptr<Client> client = findClient(client_id);
    if (!client || !client->active) return;

    ControlMessage control;
    std::string error;
    if (!ClientChannel::parseControlMessage(text, control, error)) {
        std::cerr << "[livedict] Bad control message from " << client_id << ": " << error << std::endl;
        client->channel->enqueueMessage(ClientChannel::makeErrorMessage(error));
        return;
    }

    using namespace std::chrono;
    int64_t now_ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();

    switch (control.type) {
        case ControlType::Start:
            client->session->start();
            break;
        case ControlType::Stop:
            client->session->stop();
            break;
        case ControlType::Toggle:
            client->session->toggle(now_ms);
            break;
        case ControlType::InjectError:
            client->session->onInjectionFailure(control.message);
            break;
    }
}

void DictationServer::inferenceLoop() {
    using namespace std::chrono;

    while (running_) {
        int64_t now_ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();

        std::shared_ptr<Client> client;
        {
            std::lock_guard<std::mutex> lock(client_mutex_);
            client = client_;
        }

        if (client && client->active) {
            client->ticking = true;
            client->session->tick(now_ms);
            client->ticking = false;
        }

        // Sleep briefly to avoid busy-wait
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

// === Event Loop Integration ===

void DictationServer::setEventLoop(void* loop) {
    loop_ = loop;
}

void DictationServer::attachWebSocket(const std::string& client_id, void* ws_handle) {
    std::shared_ptr<Client> client = findClient(client_id);
    if (client) {
        client->ws_handle = ws_handle;
    }
}

void DictationServer::detachWebSocket(const std::string& client_id) {
    std::shared_ptr<Client> client = findClient(client_id);
    if (client) {
        client->ws_handle = nullptr;
        client->flush_pending.store(false);
    }
}

void DictationServer::notifyClientHasMessages(const std::string& client_id) {
    if (!loop_) return;

    std::shared_ptr<Client> client = findClient(client_id);
    if (!client || !client->active) return;

    // If a flush is already pending, don't schedule another
    if (client->flush_pending.exchange(true)) {
        return;
    }

    // Schedule flush on the event loop thread
    auto* uws_loop = static_cast<uWS::Loop*>(loop_);
    uws_loop->defer([this, client_id]() {
        this->flushClientMessagesOnEventLoop(client_id);
    });
}

void DictationServer::flushClientMessagesOnEventLoop(const std::string& client_id) {
    std::shared_ptr<Client> client = findClient(client_id);
    if (!client) return;

    // Reset flush_pending for future messages
    client->flush_pending.store(false);

    // If socket is gone, discard messages
    if (!client->ws_handle) {
        client->channel->drainMessages();
        return;
    }

    auto* ws = static_cast<uWS::WebSocket<false, true, PerSocketData>*>(client->ws_handle);

    std::deque<std::string> pending = client->channel->drainMessages();
    for (const auto& msg : pending) {
        ws->send(msg, uWS::OpCode::TEXT);
    }
}

std::string DictationServer::makeReadyMessage() const {
    return ClientChannel::makeReadyMessage(config_.model_path, kSampleRate);
}
