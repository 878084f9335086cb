#include "client/paste_client.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "http/server.hpp"
#include "paste/id_generator.hpp"
#include "paste/paste_service.hpp"
#include "runtime/config.hpp"
#include "store/sqlite_paste_store.hpp"

namespace fs = std::filesystem;
using namespace pastebin;
using namespace pastebin::client;

namespace {
constexpr int kServicePort = 9998;
constexpr int kStubPort = 9997;
constexpr int kClosedPort = 9996;
}  // namespace

//=============================================================================
// Local validation
//=============================================================================

TEST(PasteClientTrimTest, Trim) {
    EXPECT_EQ(trim("  hello \n"), "hello");
    EXPECT_EQ(trim("\t\r\n "), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(PasteClientLocalTest, EmptyInputRejectedWithoutRequest) {
    // Nothing listens on this port; a request would come back UNEXPECTED
    PasteClient client("http://127.0.0.1:" + std::to_string(kClosedPort), 1);

    auto result = client.submit("   \n\t ");

    EXPECT_EQ(result.outcome, SubmitOutcome::EMPTY_INPUT);
    EXPECT_EQ(result.message, "Content cannot be empty.");
    EXPECT_TRUE(result.url.empty());
}

TEST(PasteClientLocalTest, UnreachableServerIsUnexpected) {
    PasteClient client("http://127.0.0.1:" + std::to_string(kClosedPort), 1);

    auto result = client.submit("hello");

    EXPECT_EQ(result.outcome, SubmitOutcome::UNEXPECTED);
    EXPECT_EQ(result.message, "Unexpected error. Please try again.");
}

TEST(PasteClientLocalTest, InvalidUtf8InputDoesNotThrow) {
    PasteClient client("http://127.0.0.1:" + std::to_string(kClosedPort), 1);

    SubmitResult result;
    EXPECT_NO_THROW(result = client.submit("abc\xff"));

    EXPECT_EQ(result.outcome, SubmitOutcome::UNEXPECTED);
    EXPECT_EQ(result.message, "Unexpected error. Please try again.");
}

//=============================================================================
// Against a running service
//=============================================================================

class PasteClientServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "pastebin_client_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);

        store = store::SqlitePasteStore::open(temp_dir / "pastes.db");
        service = std::make_unique<paste::PasteService>(*store, id_generator);

        runtime::HttpConfig http_config;
        http_config.bind = "127.0.0.1";
        http_config.port = kServicePort;
        http_config.thread_pool_size = 2;
        server = std::make_unique<http::HttpServer>(http_config, *service);

        std::string error;
        ASSERT_TRUE(server->start(error)) << error;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    void TearDown() override {
        server->stop();
        server.reset();
        service.reset();
        store.reset();
        fs::remove_all(temp_dir);
    }

    fs::path temp_dir;
    paste::RandomIdGenerator id_generator;
    std::unique_ptr<store::SqlitePasteStore> store;
    std::unique_ptr<paste::PasteService> service;
    std::unique_ptr<http::HttpServer> server;
};

TEST_F(PasteClientServiceTest, SubmitCreatesTrimmedPaste) {
    PasteClient client("http://127.0.0.1:" + std::to_string(kServicePort));

    auto result = client.submit("\n  hello world  \n");

    ASSERT_EQ(result.outcome, SubmitOutcome::CREATED) << result.message;
    EXPECT_EQ(result.message, "Paste created! " + result.url);

    const std::string id = result.url.substr(result.url.rfind('/') + 1);
    auto stored = service->get_paste(id);
    ASSERT_TRUE(stored.success);
    EXPECT_EQ(stored.paste.content, "hello world");
}

TEST_F(PasteClientServiceTest, InvalidUtf8IsSentAsReplacementCharacter) {
    PasteClient client("http://127.0.0.1:" + std::to_string(kServicePort));

    auto result = client.submit("abc\xff");

    ASSERT_EQ(result.outcome, SubmitOutcome::CREATED) << result.message;
    const std::string id = result.url.substr(result.url.rfind('/') + 1);
    auto stored = service->get_paste(id);
    ASSERT_TRUE(stored.success);
    EXPECT_EQ(stored.paste.content, "abc\xEF\xBF\xBD");  // U+FFFD
}

TEST_F(PasteClientServiceTest, ServerErrorIsShown) {
    PasteClient client("http://127.0.0.1:" + std::to_string(kServicePort));

    auto result = client.submit(std::string(10001, 'a'));

    EXPECT_EQ(result.outcome, SubmitOutcome::SERVER_ERROR);
    EXPECT_EQ(result.message, "Error: Content too long. Maximum 10,000 characters allowed.");
    EXPECT_TRUE(result.url.empty());
}

//=============================================================================
// Unreadable responses
//=============================================================================

TEST(PasteClientStubTest, NonJsonResponseIsUnexpected) {
    httplib::Server stub;
    stub.Post("/api/paste", [](const httplib::Request &, httplib::Response &res) {
        res.status = 502;
        res.set_content("<html>Bad Gateway</html>", "text/html");
    });

    ASSERT_TRUE(stub.bind_to_port("127.0.0.1", kStubPort));
    std::thread stub_thread([&stub]() { stub.listen_after_bind(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    PasteClient client("http://127.0.0.1:" + std::to_string(kStubPort), 1);
    auto result = client.submit("hello");

    stub.stop();
    stub_thread.join();

    EXPECT_EQ(result.outcome, SubmitOutcome::UNEXPECTED);
    EXPECT_EQ(result.message, "Unexpected error. Please try again.");
}
