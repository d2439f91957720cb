#include <gtest/gtest.h>
#include "vexdoc/transport/stdio_transport.hpp"
#include "vexdoc/codec.hpp"
#include "vexdoc/error.hpp"
#include "../support/stdio_peer.hpp"
#include <unistd.h>
#include <chrono>
#include <future>
#include <thread>

using namespace vexdoc;
using vexdoc::test::StdioPeer;

namespace {

const JsonRpcRequest& as_request(const ReadResult& r) {
    EXPECT_TRUE(std::holds_alternative<JsonRpcMessage>(r));
    const auto& msg = std::get<JsonRpcMessage>(r);
    EXPECT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    return std::get<JsonRpcRequest>(msg);
}

} // anonymous namespace

TEST(StdioTransport, ReadsOneMessagePerLine) {
    StdioPeer peer;
    auto t = peer.server_transport();

    peer.send_raw("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
                  "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");

    auto first = t->read();
    EXPECT_EQ(as_request(first).method, "ping");
    auto second = t->read();
    EXPECT_EQ(as_request(second).method, "tools/list");
}

TEST(StdioTransport, StripsCarriageReturnAndSkipsBlankLines) {
    StdioPeer peer;
    auto t = peer.server_transport();

    peer.send_raw("\n   \r\n{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\r\n");
    auto r = t->read();
    EXPECT_EQ(as_request(r).method, "ping");
}

TEST(StdioTransport, FinalLineWithoutNewline) {
    StdioPeer peer;
    auto t = peer.server_transport();

    peer.send_raw("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}");
    peer.close_input();

    auto r = t->read();
    EXPECT_EQ(as_request(r).method, "ping");
    EXPECT_TRUE(std::holds_alternative<EndOfStream>(t->read()));
}

TEST(StdioTransport, EndOfStreamOnClosedInput) {
    StdioPeer peer;
    auto t = peer.server_transport();
    peer.close_input();
    EXPECT_TRUE(std::holds_alternative<EndOfStream>(t->read()));
}

TEST(StdioTransport, GarbageLineIsDecodeFailure) {
    StdioPeer peer;
    auto t = peer.server_transport();

    peer.send_line("not json at all");
    auto r = t->read();
    ASSERT_TRUE(std::holds_alternative<DecodeFailure>(r));
    EXPECT_EQ(std::get<DecodeFailure>(r).code, error::ParseError);
    EXPECT_FALSE(std::get<DecodeFailure>(r).id.has_value());
}

TEST(StdioTransport, BadEnvelopeKeepsId) {
    StdioPeer peer;
    auto t = peer.server_transport();

    peer.send_line(R"({"jsonrpc":"1.0","id":9,"method":"ping"})");
    auto r = t->read();
    ASSERT_TRUE(std::holds_alternative<DecodeFailure>(r));
    const auto& failure = std::get<DecodeFailure>(r);
    EXPECT_EQ(failure.code, error::InvalidRequest);
    ASSERT_TRUE(failure.id.has_value());
    EXPECT_EQ(std::get<int64_t>(*failure.id), 9);
}

TEST(StdioTransport, OversizedLineIsRejectedAndSkipped) {
    StdioPeer peer;
    auto t = peer.server_transport(64);

    std::string big = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"" + std::string(200, 'x') + "\"}";
    peer.send_line(big);
    peer.send_line(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");

    auto r = t->read();
    ASSERT_TRUE(std::holds_alternative<DecodeFailure>(r));
    EXPECT_EQ(std::get<DecodeFailure>(r).code, error::ParseError);

    auto next = t->read();
    EXPECT_EQ(std::get<int64_t>(as_request(next).id), 2);
}

TEST(StdioTransport, WriteProducesOneLine) {
    StdioPeer peer;
    auto t = peer.server_transport();

    t->write(JsonRpcResponse::success(RequestId{int64_t{3}}, nlohmann::json{{"text", "a\nb"}}));
    auto line = peer.read_line();
    ASSERT_TRUE(line.has_value());
    auto j = nlohmann::json::parse(*line);
    EXPECT_EQ(j["id"], 3);
    EXPECT_EQ(j["result"]["text"], "a\nb");
}

TEST(StdioTransport, InterruptUnblocksRead) {
    StdioPeer peer;
    auto t = peer.server_transport();

    std::thread interrupter([&t] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        t->interrupt();
    });
    EXPECT_TRUE(std::holds_alternative<EndOfStream>(t->read()));
    interrupter.join();

    // Writes still work after an interrupt.
    EXPECT_NO_THROW(t->write(JsonRpcNotification{"notifications/message", std::nullopt}));
    EXPECT_TRUE(peer.read_line().has_value());
}

TEST(StdioTransport, CloseIsIdempotentAndStopsWrites) {
    StdioPeer peer;
    auto t = peer.server_transport();

    EXPECT_TRUE(t->is_open());
    t->close();
    EXPECT_FALSE(t->is_open());
    EXPECT_NO_THROW(t->close());
    EXPECT_THROW(t->write(JsonRpcNotification{"x", std::nullopt}), TransportError);
    EXPECT_TRUE(peer.output_closed());
}

TEST(StdioTransport, StalledWriteFailsAfterInterrupt) {
    int in[2];
    int out[2];
    ASSERT_EQ(::pipe(in), 0);
    ASSERT_EQ(::pipe(out), 0);
    // Nobody reads out[0], so the pipe fills and the write hangs.
    StdioTransport t(in[0], out[1], StdioTransport::DEFAULT_MAX_MESSAGE_BYTES,
                     std::chrono::milliseconds(100));

    JsonRpcNotification big{"notifications/message",
                            nlohmann::json{{"data", std::string(512 * 1024, 'x')}}};
    auto pending = std::async(std::launch::async, [&t, &big] { t.write(big); });
    EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

    t.interrupt();
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_THROW(pending.get(), TransportError);

    t.close();
    ::close(in[1]);
    ::close(out[0]);
}
