#include "chat/console_chat.hpp"
#include "chat/chat_history.hpp"
#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace test_utils;
using Chat::Role;

TEST(ChatReplyTest, ReadsAnswerAndWalletLink) {
    auto r = Chat::parseChatReply(FakeHttpTransport::ok(
        R"({"answer":"Added to your wallet.","wallet_link":"https://pay.test/pass/42"})"));
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.text, "Added to your wallet.");
    EXPECT_EQ(r.walletLink, "https://pay.test/pass/42");
}

TEST(ChatReplyTest, FallsBackToRawBody) {
    auto plain = Chat::parseChatReply(FakeHttpTransport::ok("plain text answer"));
    EXPECT_TRUE(plain.ok);
    EXPECT_EQ(plain.text, "plain text answer");

    auto odd = Chat::parseChatReply(FakeHttpTransport::ok(R"({"answer":"ok","wallet_link":5})"));
    EXPECT_EQ(odd.text, "ok");
    EXPECT_TRUE(odd.walletLink.empty());
}

TEST(ChatReplyTest, FailuresCarryReason) {
    auto down = Chat::parseChatReply(FakeHttpTransport::unreachable());
    EXPECT_FALSE(down.ok);
    EXPECT_EQ(down.text, "Could not resolve host");

    auto err = Chat::parseChatReply(FakeHttpTransport::status(502));
    EXPECT_FALSE(err.ok);
    EXPECT_EQ(err.text, "HTTP 502");
}

TEST(ChatHistoryTest, KeepsNewestEntriesUpToCap) {
    Chat::ChatHistory history;
    for (std::size_t i = 0; i < Chat::ChatHistory::kMaxHistory + 5; ++i) {
        history.push(Role::User, "msg " + std::to_string(i));
    }
    EXPECT_EQ(history.count(), Chat::ChatHistory::kMaxHistory);
    EXPECT_EQ(history.entries().front().text, "msg 5");
    EXPECT_FALSE(history.latest(Role::Assistant).has_value());

    history.push(Role::Assistant, "reply");
    history.push(Role::User, "after");
    ASSERT_TRUE(history.latest(Role::Assistant).has_value());
    EXPECT_EQ(history.latest(Role::Assistant)->text, "reply");

    history.clear();
    EXPECT_EQ(history.count(), 0u);
}

class ConsoleChatTest : public ::testing::Test {
protected:
    void SetUp() override { ErrorManager::use(bootstrap_config::defaultErrors()); }

    void TearDown() override {
        network.shutdown();
        loop.shutdown();
    }

    std::shared_ptr<FakeHttpTransport> http = std::make_shared<FakeHttpTransport>();
    Chat::ChatHistory history;
    Voice::EventLoop loop{"loop"};
    Voice::WorkerPool network{"network", 1};
};

TEST_F(ConsoleChatTest, PostsQuestionAndRecordsAnswer) {
    Chat::ConsoleChat chat(history, http, network, loop, "https://backend.test/ask");
    http->respondWith(FakeHttpTransport::ok(R"({"answer":"Milk added, 1.29 EUR."})"));

    std::vector<Chat::ChatEntry> seen;
    std::mutex seenMutex;
    chat.addEntryListener([&](const Chat::ChatEntry& e) {
        std::lock_guard<std::mutex> lock(seenMutex);
        seen.push_back(e);
    });

    chat.submit("add milk");
    ASSERT_TRUE(waitFor([&] { return chat.latestAssistantMessage().has_value(); }));
    EXPECT_EQ(*chat.latestAssistantMessage(), "Milk added, 1.29 EUR.");

    auto reqs = http->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].url, "https://backend.test/ask");
    EXPECT_EQ(nlohmann::json::parse(reqs[0].body)["question"], "add milk");

    auto entries = history.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].role, Role::User);
    EXPECT_EQ(entries[0].text, "add milk");
    EXPECT_EQ(entries[1].role, Role::Assistant);

    loop.flush();
    std::lock_guard<std::mutex> lock(seenMutex);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].role, Role::Assistant);
}

TEST_F(ConsoleChatTest, BackendFailureBecomesSystemEntry) {
    Chat::ConsoleChat chat(history, http, network, loop, "https://backend.test/ask");
    http->respondWith(FakeHttpTransport::status(500));

    chat.submit("hello");
    ASSERT_TRUE(waitFor([&] { return history.latest(Role::System).has_value(); }));

    EXPECT_NE(history.latest(Role::System)->text.find("HTTP 500"), std::string::npos);
    EXPECT_FALSE(chat.latestAssistantMessage().has_value());
}

TEST_F(ConsoleChatTest, NoBackendConfiguredIsReported) {
    Chat::ConsoleChat chat(history, http, network, loop, "");

    chat.submit("hello");
    loop.flush();

    EXPECT_EQ(http->requestCount(), 0u);
    ASSERT_TRUE(history.latest(Role::System).has_value());
    EXPECT_EQ(history.latest(Role::User)->text, "hello");
}

TEST_F(ConsoleChatTest, Latin1QuestionStillReachesBackend) {
    Chat::ConsoleChat chat(history, http, network, loop, "https://backend.test/ask");
    http->respondWith(FakeHttpTransport::ok(R"({"answer":"Coffee is 2.40 EUR."})"));

    chat.submit("caf\xe9");
    ASSERT_TRUE(waitFor([&] { return chat.latestAssistantMessage().has_value(); }));

    auto reqs = http->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(reqs[0].body)["question"], "caf\xEF\xBF\xBD");
}

TEST_F(ConsoleChatTest, ThrowingTransportBecomesSystemEntry) {
    Chat::ConsoleChat chat(history, http, network, loop, "https://backend.test/ask");
    http->failWith("connection reset by peer");

    chat.submit("hello");
    ASSERT_TRUE(waitFor([&] { return history.latest(Role::System).has_value(); }));

    EXPECT_NE(history.latest(Role::System)->text.find("connection reset by peer"), std::string::npos);
    EXPECT_FALSE(chat.latestAssistantMessage().has_value());
}
