/**
 * Unit tests for ClientChannel
 *
 * The outgoing queue, keystroke edits as protocol messages and control
 * message parsing.
 */

#include <catch2/catch_test_macros.hpp>
#include "client_channel.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("Channel: edits become delete/insert messages", "[channel][sink]") {
    ClientChannel channel("c1");

    REQUIRE(channel.deleteChars(3));
    REQUIRE(channel.insertText("world"));

    auto messages = channel.drainMessages();
    REQUIRE(messages.size() == 2);

    json del = json::parse(messages[0]);
    REQUIRE(del["type"] == "delete");
    REQUIRE(del["count"] == 3);

    json ins = json::parse(messages[1]);
    REQUIRE(ins["type"] == "insert");
    REQUIRE(ins["text"] == "world");

    REQUIRE(channel.drainMessages().empty());
}

TEST_CASE("Channel: empty edits send nothing", "[channel][sink]") {
    ClientChannel channel("c1");

    REQUIRE(channel.deleteChars(0));
    REQUIRE(channel.insertText(""));
    REQUIRE(channel.drainMessages().empty());
}

TEST_CASE("Channel: closed channel refuses edits", "[channel][sink]") {
    ClientChannel channel("c1");
    channel.close();

    REQUIRE_FALSE(channel.isOpen());
    REQUIRE_FALSE(channel.deleteChars(1));
    REQUIRE_FALSE(channel.insertText("x"));
    REQUIRE(channel.drainMessages().empty());
}

TEST_CASE("Channel: notifier fires on every enqueue", "[channel]") {
    ClientChannel channel("c1");
    int notified = 0;
    channel.setNotifier([&notified]() { ++notified; });

    channel.enqueueMessage("a");
    channel.insertText("b");
    REQUIRE(notified == 2);
}

TEST_CASE("Channel: message builders", "[channel][protocol]") {
    json ready = json::parse(ClientChannel::makeReadyMessage("base.en", 16000));
    REQUIRE(ready["type"] == "ready");
    REQUIRE(ready["sample_rate"] == 16000);

    json state = json::parse(ClientChannel::makeStateMessage("recording"));
    REQUIRE(state["state"] == "recording");

    json transcript = json::parse(ClientChannel::makeTranscriptMessage("hello", "wor"));
    REQUIRE(transcript["committed"] == "hello");
    REQUIRE(transcript["tentative"] == "wor");

    json final_msg = json::parse(ClientChannel::makeFinalMessage("done"));
    REQUIRE(final_msg["type"] == "final");
    REQUIRE(final_msg["text"] == "done");

    json error = json::parse(ClientChannel::makeErrorMessage("bad"));
    REQUIRE(error["type"] == "error");
    REQUIRE(error["message"] == "bad");
}

TEST_CASE("Channel: invalid UTF-8 does not throw", "[channel][protocol]") {
    std::string broken = "caf\xC3";  // truncated sequence
    std::string msg;
    REQUIRE_NOTHROW(msg = ClientChannel::makeInsertMessage(broken));
    REQUIRE(json::parse(msg)["type"] == "insert");
}

TEST_CASE("Channel: control messages parse", "[channel][control]") {
    ControlMessage control;
    std::string error;

    REQUIRE(ClientChannel::parseControlMessage(R"({"type":"start"})", control, error));
    REQUIRE(control.type == ControlType::Start);

    REQUIRE(ClientChannel::parseControlMessage(R"({"type":"stop"})", control, error));
    REQUIRE(control.type == ControlType::Stop);

    REQUIRE(ClientChannel::parseControlMessage(R"({"type":"toggle"})", control, error));
    REQUIRE(control.type == ControlType::Toggle);

    REQUIRE(ClientChannel::parseControlMessage(R"({"type":"inject_error","message":"focus lost"})",
                                               control, error));
    REQUIRE(control.type == ControlType::InjectError);
    REQUIRE(control.message == "focus lost");
}

TEST_CASE("Channel: bad control messages are rejected", "[channel][control]") {
    ControlMessage control;
    std::string error;

    REQUIRE_FALSE(ClientChannel::parseControlMessage("not json", control, error));
    REQUIRE_FALSE(error.empty());

    REQUIRE_FALSE(ClientChannel::parseControlMessage("[1,2]", control, error));
    REQUIRE_FALSE(ClientChannel::parseControlMessage(R"({"kind":"start"})", control, error));
    REQUIRE_FALSE(ClientChannel::parseControlMessage(R"({"type":7})", control, error));

    REQUIRE_FALSE(ClientChannel::parseControlMessage(R"({"type":"rewind"})", control, error));
    REQUIRE(error.find("rewind") != std::string::npos);
}
