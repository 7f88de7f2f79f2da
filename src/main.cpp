#include "config.hpp"
#include "dictation_server.hpp"
#include "whisper_engine.hpp"

#include <App.h>  // uWebSockets

#include <iostream>
#include <string>
#include <csignal>

// Global pointers for signal handling
static DictationServer* g_server = nullptr;
static us_listen_socket_t* g_listen_socket = nullptr;
static uWS::Loop* g_loop = nullptr;

static void signalHandler(int signum) {
    std::cout << "\n[livedict] Received signal " << signum << ", shutting down..." << std::endl;

    // Closing the listen socket lets the event loop exit once the client leaves
    if (g_loop && g_listen_socket) {
        g_loop->defer([]{
            if (g_listen_socket) {
                us_listen_socket_close(0, g_listen_socket);
                g_listen_socket = nullptr;
            }
        });
    }

    if (g_server) {
        g_server->stop();
    }
}

static std::string getQueryParam(std::string_view query, const std::string& param) {
    std::string search = param + "=";
    size_t pos = query.find(search);
    if (pos == std::string_view::npos) return "";
    pos += search.length();
    size_t end = query.find('&', pos);
    if (end == std::string_view::npos) end = query.length();
    return std::string(query.substr(pos, end - pos));
}

int main(int argc, char** argv) {
    DictationConfig config;

    if (!parseArgs(argc, argv, config)) {
        return 1;
    }

    WhisperEngine engine(config);
    if (!engine.init()) {
        std::cerr << "[livedict] Failed to initialize transcription engine" << std::endl;
        return 1;
    }

    DictationServer server(config, engine);
    g_server = &server;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    server.run();

    uWS::App()
        .ws<PerSocketData>("/*", {
            .compression = uWS::DISABLED,
            .maxPayloadLength = 1 * 1024 * 1024,
            .idleTimeout = 120,
            .maxBackpressure = 1 * 1024 * 1024,

            .upgrade = [&config](auto* res, auto* req, auto* context) {
                if (!config.auth_token.empty()) {
                    std::string token = getQueryParam(req->getQuery(), "token");
                    if (token != config.auth_token) {
                        res->writeStatus("401 Unauthorized");
                        res->end("Invalid or missing token");
                        return;
                    }
                }

                res->template upgrade<PerSocketData>(
                    { .client_id = "" },
                    req->getHeader("sec-websocket-key"),
                    req->getHeader("sec-websocket-protocol"),
                    req->getHeader("sec-websocket-extensions"),
                    context
                );
            },

            .open = [&server](auto* ws) {
                static int client_counter = 0;
                std::string client_id = "client_" + std::to_string(++client_counter);

                auto* data = ws->getUserData();
                data->client_id = client_id;

                std::cout << "[livedict] WebSocket connected: " << client_id << std::endl;

                if (!server.createClient(client_id)) {
                    ws->send(ClientChannel::makeErrorMessage("another client is already connected"),
                             uWS::OpCode::TEXT);
                    ws->end(1008, "busy");
                    return;
                }

                server.attachWebSocket(client_id, static_cast<void*>(ws));

                // Safe: we're on the uWS event loop thread
                ws->send(server.makeReadyMessage(), uWS::OpCode::TEXT);
                ws->send(ClientChannel::makeStateMessage(sessionStateName(SessionState::Idle)),
                         uWS::OpCode::TEXT);
            },

            .message = [&server](auto* ws, std::string_view message, uWS::OpCode opCode) {
                auto* data = ws->getUserData();

                if (opCode == uWS::OpCode::BINARY) {
                    // int16 PCM; a trailing odd byte is dropped
                    const int16_t* audio_data = reinterpret_cast<const int16_t*>(message.data());
                    size_t sample_count = message.size() / sizeof(int16_t);

                    server.onAudioReceived(data->client_id, audio_data, sample_count);
                }
                else if (opCode == uWS::OpCode::TEXT) {
                    server.onControlMessage(data->client_id, message);
                }
            },

            .close = [&server](auto* ws, int code, std::string_view) {
                auto* data = ws->getUserData();
                std::cout << "[livedict] WebSocket disconnected: " << data->client_id
                          << " (code=" << code << ")" << std::endl;

                server.detachWebSocket(data->client_id);
                server.destroyClient(data->client_id);
            }
        })
        .listen(config.host, config.port, [&config, &server](auto* listen_socket) {
            if (listen_socket) {
                g_listen_socket = listen_socket;
                g_loop = uWS::Loop::get();
                server.setEventLoop(static_cast<void*>(g_loop));
                std::cout << "[livedict] Listening on " << config.host << ":" << config.port << std::endl;
                if (!config.auth_token.empty()) {
                    std::cout << "[livedict] Token authentication enabled" << std::endl;
                }
            } else {
                std::cerr << "[livedict] Failed to listen on " << config.host << ":" << config.port << std::endl;
            }
        })
        .run();

    server.stop();
    std::cout << "[livedict] Server stopped" << std::endl;
    return 0;
}
