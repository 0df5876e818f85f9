#include <gtest/gtest.h>
#include "server/server.h"
#include <chrono>
#include <future>
#include <thread>

namespace {

class PingServer : public Server {
public:
    explicit PingServer(const Config& config) : Server(config, "ping") {}

    // Last resort so a failing test does not hang the run
    void force_stop() { tcp_server.stop(); }

protected:
    void register_endpoints() override {
        tcp_server.Get("/ping", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("pong", "text/plain");
        });
    }
};

} // namespace

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.host = "127.0.0.1";
        config.port = 0;  // any free port
    }

    Config config;
};

TEST_F(ServerTest, ShutdownBeforeRunReturnsImmediately) {
    PingServer server(config);
    server.shutdown();

    auto result = std::async(std::launch::async, [&server] { return server.run(); });
    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(result.get(), 0);
    EXPECT_FALSE(server.is_running());
}

TEST_F(ServerTest, ShutdownDuringStartupStopsListen) {
    for (int i = 0; i < 20; i++) {
        PingServer server(config);
        auto result = std::async(std::launch::async, [&server] { return server.run(); });

        // Land the stop somewhere in the bind/listen window
        std::this_thread::sleep_for(std::chrono::microseconds(i * 50));
        server.shutdown();

        bool stopped = result.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
        if (!stopped) {
            server.force_stop();
        }
        ASSERT_TRUE(stopped) << "iteration " << i;
        EXPECT_EQ(result.get(), 0);
    }
}

TEST_F(ServerTest, ShutdownIsIdempotent) {
    PingServer server(config);
    auto result = std::async(std::launch::async, [&server] { return server.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    server.shutdown();
    server.shutdown();

    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(result.get(), 0);
}
