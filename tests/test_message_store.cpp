// tests/test_message_store.cpp
#include <gtest/gtest.h>
#include "message_store.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

const std::vector<std::string> kSeed{"proj-x", "codex", "claude"};

std::vector<uint64_t> ids_of(const std::vector<Message>& messages) {
    std::vector<uint64_t> out;
    for (const auto& m : messages) out.push_back(m.id);
    return out;
}

} // namespace

// Two agents talking through a seeded channel
TEST(MessageStoreTest, SeededConversationScenario) {
    MessageStore store(kSeed);

    Message hello = store.post_message("proj-x", "claude", "hello");
    EXPECT_EQ(hello.id, 1u);
    Message ack = store.post_message("proj-x", "codex", "ack");
    EXPECT_EQ(ack.id, 2u);

    auto all = store.fetch_messages("proj-x", 0);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, 1u);
    EXPECT_EQ(all[0].sender, "claude");
    EXPECT_EQ(all[0].text, "hello");
    EXPECT_EQ(all[1].id, 2u);
    EXPECT_EQ(all[1].sender, "codex");
    EXPECT_EQ(all[1].text, "ack");

    auto newer = store.fetch_messages("proj-x", 1);
    ASSERT_EQ(newer.size(), 1u);
    EXPECT_EQ(newer[0].id, 2u);

    EXPECT_EQ(store.list_channels(), kSeed);
}

// Seeded channels can be fetched before anyone posts
TEST(MessageStoreTest, SeededChannelFetchableWhenEmpty) {
    MessageStore store(kSeed);
    EXPECT_TRUE(store.fetch_messages("codex").empty());
    EXPECT_TRUE(store.has_channel("claude"));
}

// Posting to an unknown name creates it at the end of the listing
TEST(MessageStoreTest, PostCreatesChannel) {
    MessageStore store(kSeed);
    store.post_message("review", "codex", "please look");
    EXPECT_EQ(store.list_channels(), (std::vector<std::string>{"proj-x", "codex", "claude", "review"}));
    EXPECT_EQ(store.fetch_messages("review").size(), 1u);
}

// Empty channel or sender is rejected without touching state
TEST(MessageStoreTest, ValidationErrorsLeaveNoTrace) {
    MessageStore store(kSeed);
    EXPECT_THROW(store.post_message("", "claude", "x"), ValidationError);
    EXPECT_THROW(store.post_message("fresh", "", "x"), ValidationError);

    EXPECT_FALSE(store.has_channel("fresh"));
    EXPECT_EQ(store.list_channels(), kSeed);
    // no id was consumed by the failed posts
    EXPECT_EQ(store.post_message("proj-x", "claude", "first").id, 1u);
}

// Error kind travels with the exception
TEST(MessageStoreTest, ErrorKinds) {
    MessageStore store;
    try {
        store.post_message("", "s", "t");
        FAIL() << "expected ValidationError";
    } catch (const StoreError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::Validation);
        EXPECT_STREQ(ex.kind_name(), "validation_error");
    }
    try {
        store.fetch_messages("nope");
        FAIL() << "expected NotFoundError";
    } catch (const StoreError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::NotFound);
        EXPECT_STREQ(ex.kind_name(), "not_found");
    }
}

// Empty text is a valid message
TEST(MessageStoreTest, EmptyTextAccepted) {
    MessageStore store;
    Message m = store.post_message("c", "s", "");
    EXPECT_EQ(m.text, "");
    EXPECT_EQ(store.fetch_messages("c").size(), 1u);
}

// Reads never create channels
TEST(MessageStoreTest, FetchOnUnknownChannelDoesNotCreate) {
    MessageStore store(kSeed);
    EXPECT_THROW(store.fetch_messages("ghost"), NotFoundError);
    EXPECT_THROW(store.recent_messages("ghost", 10), NotFoundError);
    EXPECT_FALSE(store.has_channel("ghost"));
    EXPECT_EQ(store.list_channels(), kSeed);
}

// Listing twice without writes gives the same answer
TEST(MessageStoreTest, ListingIsIdempotent) {
    MessageStore store(kSeed);
    store.post_message("extra", "s", "t");
    auto first = store.list_channels();
    store.fetch_messages("extra");
    EXPECT_EQ(store.list_channels(), first);
}

// fetch with a limit returns the oldest unseen messages first; walking
// since_id forward visits every message exactly once
TEST(MessageStoreTest, LimitTruncatesNewestAndPagingVisitsAll) {
    MessageStore store;
    for (int i = 0; i < 25; ++i) store.post_message("c", "s", std::to_string(i));

    auto page = store.fetch_messages("c", 0, 10);
    EXPECT_EQ(page.front().id, 1u);
    EXPECT_EQ(page.back().id, 10u);

    std::vector<uint64_t> walked;
    uint64_t since = 0;
    for (;;) {
        auto batch = store.fetch_messages("c", since, 7);
        if (batch.empty()) break;
        for (const auto& m : batch) walked.push_back(m.id);
        since = batch.back().id;
    }
    std::vector<uint64_t> expected(25);
    for (size_t i = 0; i < expected.size(); ++i) expected[i] = i + 1;
    EXPECT_EQ(walked, expected);
}

// recent_messages returns the tail in ascending order
TEST(MessageStoreTest, RecentMessagesReturnsTail) {
    MessageStore store;
    for (int i = 0; i < 5; ++i) store.post_message("c", "s", std::to_string(i));
    EXPECT_EQ(ids_of(store.recent_messages("c", 2)), (std::vector<uint64_t>{4, 5}));
}

// Every successful post reaches the observer once; failed posts never do
TEST(MessageStoreTest, ObserverSeesSuccessfulPosts) {
    MessageStore store;
    std::vector<uint64_t> observed;
    store.set_post_observer([&observed](const Message& m) { observed.push_back(m.id); });

    store.post_message("c", "s", "a");
    EXPECT_THROW(store.post_message("c", "", "b"), ValidationError);
    store.post_message("d", "s", "c");
    EXPECT_EQ(observed, (std::vector<uint64_t>{1, 2}));
}

// A throwing observer does not fail the post
TEST(MessageStoreTest, FailingObserverDoesNotFailPost) {
    MessageStore store;
    store.set_post_observer([](const Message&) { throw std::runtime_error("sink down"); });

    Message m;
    EXPECT_NO_THROW(m = store.post_message("c", "s", "still stored"));
    EXPECT_EQ(m.id, 1u);
    EXPECT_EQ(store.fetch_messages("c").size(), 1u);
}

// Retention cap applies per channel
TEST(MessageStoreTest, RetentionCapPerChannel) {
    MessageStore store(kSeed, 2);
    for (int i = 0; i < 4; ++i) store.post_message("proj-x", "s", std::to_string(i));
    store.post_message("codex", "s", "other");

    EXPECT_EQ(ids_of(store.fetch_messages("proj-x")), (std::vector<uint64_t>{3, 4}));
    EXPECT_EQ(ids_of(store.fetch_messages("codex")), (std::vector<uint64_t>{5}));
}

// N concurrent posts to one unseen channel: one channel, N messages,
// distinct ids in strictly increasing order
TEST(MessageStoreTest, ConcurrentPostsToUnseenChannel) {
    MessageStore store(kSeed);
    constexpr int kThreads = 16;
    constexpr int kPerThread = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < kPerThread; ++i)
                store.post_message("hot", "agent-" + std::to_string(t), std::to_string(i));
        });
    }
    for (auto& th : threads) th.join();

    auto names = store.list_channels();
    EXPECT_EQ(std::count(names.begin(), names.end(), "hot"), 1);
    EXPECT_EQ(names.size(), kSeed.size() + 1);

    auto all = store.fetch_messages("hot");
    ASSERT_EQ(all.size(), static_cast<size_t>(kThreads * kPerThread));
    for (size_t i = 1; i < all.size(); ++i) EXPECT_LT(all[i - 1].id, all[i].id);

    // per sender, messages appear in the order that sender posted them
    std::map<std::string, int> next_index;
    for (const auto& m : all) {
        EXPECT_EQ(std::stoi(m.text), next_index[m.sender]);
        ++next_index[m.sender];
    }
}

// Posts across channels draw from one id sequence with no duplicates
TEST(MessageStoreTest, IdsUniqueAcrossChannels) {
    MessageStore store;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < kPerThread; ++i) store.post_message("ch-" + std::to_string(i % 4), "s" + std::to_string(t), "m");
        });
    }
    for (auto& th : threads) th.join();

    std::set<uint64_t> ids;
    size_t total = 0;
    for (const auto& name : store.list_channels()) {
        auto messages = store.fetch_messages(name);
        total += messages.size();
        for (const auto& m : messages) ids.insert(m.id);
        EXPECT_TRUE(std::is_sorted(messages.begin(), messages.end(),
                                   [](const Message& a, const Message& b) { return a.id < b.id; }));
    }
    EXPECT_EQ(total, static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(ids.size(), total);
}

// A poller running during concurrent posts never misses or repeats a message
TEST(MessageStoreTest, IncrementalPollingUnderLoad) {
    MessageStore store(kSeed);
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 1000;

    std::atomic<bool> done{false};
    std::vector<uint64_t> received;
    std::thread poller([&]() {
        uint64_t since = 0;
        bool drained_after_done = false;
        while (!drained_after_done) {
            bool finished = done.load();
            for (;;) {
                auto batch = store.fetch_messages("proj-x", since, 50);
                if (batch.empty()) break;
                for (const auto& m : batch) received.push_back(m.id);
                since = batch.back().id;
            }
            drained_after_done = finished;
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&store]() {
            for (int i = 0; i < kPerWriter; ++i) store.post_message("proj-x", "w", "m");
        });
    }
    for (auto& th : writers) th.join();
    done.store(true);
    poller.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(kWriters * kPerWriter));
    for (size_t i = 0; i < received.size(); ++i) EXPECT_EQ(received[i], i + 1);
}
