// ============================================================
// t_agent_app.cpp -- Agent daemon startup against a bootstrap peer
// ============================================================

#include <gtest/gtest.h>

#include "testutil.hpp"
#include "../common/errors.hpp"
#include "../common/http_client.hpp"
#include "../server/agent_app.hpp"
#include "../server/http_server.hpp"
#include "../server/mesh.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <thread>

class T_AgentApp : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(dir_.file("tfc.json"),
                   R"({"type": "sqlite3", "uri": ")" + dir_.file("tfc.db") + R"("})");
    }

    static u16 free_port() {
        HttpServer s("127.0.0.1", 0, [](const HttpRequest&) { return HttpReply{}; });
        s.listen();
        u16 port = s.port();
        s.stop();
        return port;
    }

    AgentConfig config(u16 port, const std::string& bootstrap) {
        AgentConfig cfg;
        cfg.name         = "T1_JOIN";
        cfg.port         = port;
        cfg.listen_ip    = "127.0.0.1";
        cfg.url          = "http://127.0.0.1:" + std::to_string(port) + "/meshcp";
        cfg.catalog      = dir_.file("tfc.json");
        cfg.storage      = dir_.file("storage");
        cfg.register_url = bootstrap;
        cfg.workers      = 1;
        cfg.timeout_ms   = 2000;
        cfg.finalize();
        return cfg;
    }

    TempDir dir_;
};

TEST_F(T_AgentApp, NothingServedBeforeJoin) {
    u16 port = free_port();
    std::string status_url = "http://127.0.0.1:" + std::to_string(port) + "/meshcp/status";

    std::atomic<int>  registers{0};
    std::atomic<bool> got_reply{false};
    HttpServer boot("127.0.0.1", 0, [&](const HttpRequest& req) {
        if (req.path == "/boot/register") {
            ++registers;
            try {
                http_client::get(status_url, 300);
                got_reply = true;
            } catch (const HttpError&) {
                // timed out waiting in the backlog
            }
        }
        return HttpReply{500, "text/plain", "refused"};
    });
    boot.start();
    std::string boot_url = "http://127.0.0.1:" + std::to_string(boot.port()) + "/boot";

    AgentApp app(config(port, boot_url));
    EXPECT_THROW(app.run(), MeshError);
    EXPECT_EQ(1, registers.load());
    EXPECT_FALSE(got_reply.load());
    boot.stop();
}

TEST_F(T_AgentApp, ServesAfterJoin) {
    u16 port = free_port();
    std::atomic<int> registers{0};
    HttpServer boot("127.0.0.1", 0, [&](const HttpRequest& req) {
        if (req.path == "/boot/register") ++registers;
        return HttpReply{200, "application/json", "{}"};
    });
    boot.start();
    std::string boot_url = "http://127.0.0.1:" + std::to_string(boot.port()) + "/boot";

    AgentApp app(config(port, boot_url));
    std::exception_ptr failure;
    std::thread runner([&] {
        try {
            app.run();
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
    });

    std::string status_url = "http://127.0.0.1:" + std::to_string(port) + "/meshcp/status";
    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (status != 200 && std::chrono::steady_clock::now() < deadline) {
        try {
            status = http_client::get(status_url, 500).status;
        } catch (const HttpError&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
    app.stop();
    runner.join();

    EXPECT_EQ(200, status);
    EXPECT_EQ(1, registers.load());
    EXPECT_FALSE(failure);
    EXPECT_EQ(port, app.port());
    boot.stop();
}
