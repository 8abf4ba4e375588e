#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include "httplib.h"

#include "core/Errors.h"
#include "core/RepairClient.h"
#include "support/TestUtils.h"

using json = nlohmann::json;

namespace {

RepairRequest brokenRequest() {
    RepairRequest req;
    req.filePath = "src/lib.rs";
    req.source = "fn main() {\n    let x = 5\n";
    ValidationError e;
    e.message = "Missing ';' at 2:14";
    e.line = 2;
    e.column = 14;
    req.errors.push_back(e);
    return req;
}

// Local chat-completions endpoint on an ephemeral port.
class FakeEndpoint {
public:
    httplib::Server server;
    int port = 0;
    std::thread worker;

    void start() {
        port = server.bind_to_any_port("127.0.0.1");
        worker = std::thread([this] { server.listen_after_bind(); });
        testutil::waitFor([this] { return server.is_running(); }, std::chrono::milliseconds(2000));
    }

    ~FakeEndpoint() {
        server.stop();
        if (worker.joinable()) worker.join();
    }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(port) + "/v1/chat/completions";
    }
};

}  // namespace

TEST(RepairClientTest, SanitizeDropsFenceLines) {
    EXPECT_EQ(LLMRepairClient::sanitizeCode("```rust\nfn foo() {}\n```\n"), "fn foo() {}");
    EXPECT_EQ(LLMRepairClient::sanitizeCode("fn a() {}\n  ```\nfn b() {}"), "fn a() {}\nfn b() {}");
    EXPECT_EQ(LLMRepairClient::sanitizeCode("plain"), "plain");
}

TEST(RepairClientTest, EndpointParsing) {
    LLMRepairClient local;
    EXPECT_FALSE(local.usesSsl());
    EXPECT_EQ(local.getHost(), "127.0.0.1");
    EXPECT_EQ(local.getPort(), 1234);
    EXPECT_EQ(local.getPath(), "/v1/chat/completions");

    LLMRepairClient remote("https://api.example.com/v1/chat/completions");
    EXPECT_TRUE(remote.usesSsl());
    EXPECT_EQ(remote.getPort(), 443);
    EXPECT_EQ(remote.getPath(), "/v1/chat/completions");

    LLMRepairClient bare("http://localhost");
    EXPECT_EQ(bare.getPort(), 80);
    EXPECT_EQ(bare.getPath(), "/");

    EXPECT_THROW(LLMRepairClient("ftp://nowhere"), CortexError);
}

TEST(RepairClientTest, ErrorContextIsNumbered) {
    ValidationError a;
    a.message = "Missing ';' at 2:14";
    ValidationError b;
    b.message = "Unexpected '}' at 4:1";
    std::string ctx = LLMRepairClient::formatErrorContext({a, b});
    EXPECT_NE(ctx.find("1. Missing ';' at 2:14"), std::string::npos);
    EXPECT_NE(ctx.find("2. Unexpected '}' at 4:1"), std::string::npos);
    EXPECT_NE(LLMRepairClient::formatErrorContext({}).find("could not pinpoint"), std::string::npos);
}

TEST(RepairClientTest, RequestBodyShape) {
    LLMRepairClient anonymous;
    json body = anonymous.buildRequestBody(brokenRequest());
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.1);
    EXPECT_EQ(body["max_tokens"], 2000);
    EXPECT_FALSE(body.contains("model"));
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "system");
    std::string user = body["messages"][1]["content"];
    EXPECT_NE(user.find("Missing ';' at 2:14"), std::string::npos);
    EXPECT_NE(user.find("let x = 5"), std::string::npos);

    LLMRepairClient named(LLMRepairClient::kDefaultEndpoint, 10, "", "qwen2.5-coder");
    EXPECT_EQ(named.buildRequestBody(brokenRequest())["model"], "qwen2.5-coder");
}

TEST(RepairClientTest, ExtractContentVariants) {
    json plain = {{"choices", {{{"message", {{"content", "fn x() {}"}}}}}}};
    EXPECT_EQ(LLMRepairClient::extractContent(plain), "fn x() {}");

    json parts = {{"choices", {{{"message", {{"content", {{{"type", "text"}, {"text", "fn "}},
                                                          {{"type", "text"}, {"text", "y() {}"}}}}}}}}}};
    EXPECT_EQ(LLMRepairClient::extractContent(parts), "fn y() {}");

    EXPECT_THROW(LLMRepairClient::extractContent(json::object()), CortexError);
    json noContent = {{"choices", {{{"message", json::object()}}}}};
    EXPECT_THROW(LLMRepairClient::extractContent(noContent), CortexError);
}

TEST(RepairClientTest, MalformedChoicesAreIoErrors) {
    for (const char* raw : {R"({"choices":[42]})", R"({"choices":[{"message":"text"}]})", R"({"choices":["x"]})"}) {
        try {
            LLMRepairClient::extractContent(json::parse(raw));
            FAIL() << "expected IoError for " << raw;
        } catch (const CortexError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::IoError) << raw;
        }
    }
}

TEST(RepairClientTest, HealSurfacesMalformedAnswerAsIoError) {
    FakeEndpoint endpoint;
    endpoint.server.Post("/v1/chat/completions", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"choices":[42]})", "application/json");
    });
    endpoint.start();

    LLMRepairClient client(endpoint.url(), 5);
    try {
        client.heal(brokenRequest());
        FAIL() << "expected IoError";
    } catch (const CortexError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IoError);
        EXPECT_NE(std::string(e.what()).find("Malformed choice"), std::string::npos);
    }
}

TEST(RepairClientTest, HealReturnsSanitizedAnswer) {
    FakeEndpoint endpoint;
    std::string seenBody;
    std::string seenAuth;
    endpoint.server.Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
        seenBody = req.body;
        seenAuth = req.get_header_value("Authorization");
        json answer = {{"choices", {{{"message", {{"content", "```rust\nfn main() {\n    let x = 5;\n}\n```"}}}}}}};
        res.set_content(answer.dump(), "application/json");
    });
    endpoint.start();

    LLMRepairClient client(endpoint.url(), 5, "sk-test");
    EXPECT_EQ(client.heal(brokenRequest()), "fn main() {\n    let x = 5;\n}");
    EXPECT_EQ(seenAuth, "Bearer sk-test");
    EXPECT_NE(seenBody.find("let x = 5"), std::string::npos);
}

TEST(RepairClientTest, HttpErrorIsIoError) {
    FakeEndpoint endpoint;
    endpoint.server.Post("/v1/chat/completions", [](const httplib::Request&, httplib::Response& res) {
        res.status = 500;
        res.set_content("boom", "text/plain");
    });
    endpoint.start();

    LLMRepairClient client(endpoint.url(), 5);
    try {
        client.heal(brokenRequest());
        FAIL() << "expected IoError";
    } catch (const CortexError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IoError);
        EXPECT_NE(std::string(e.what()).find("500"), std::string::npos);
    }
}

TEST(RepairClientTest, SlowEndpointTimesOut) {
    FakeEndpoint endpoint;
    endpoint.server.Post("/v1/chat/completions", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(std::chrono::seconds(3));
        res.set_content("{}", "application/json");
    });
    endpoint.start();

    LLMRepairClient client(endpoint.url(), 1);
    auto begin = std::chrono::steady_clock::now();
    try {
        client.heal(brokenRequest());
        FAIL() << "expected Timeout";
    } catch (const CortexError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(2500));
}
