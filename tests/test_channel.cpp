// tests/test_channel.cpp
#include <gtest/gtest.h>
#include "channel.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

std::vector<uint64_t> ids_of(const std::vector<Message>& messages) {
    std::vector<uint64_t> out;
    for (const auto& m : messages) out.push_back(m.id);
    return out;
}

} // namespace

// append returns the stored message with id, channel, sender and text filled in
TEST(ChannelTest, AppendReturnsStoredMessage) {
    IdentityAllocator ids;
    Channel channel("proj-x", ids);

    Message m = channel.append("claude", "hello\n```cpp\nint x;\n```");
    EXPECT_EQ(m.id, 1u);
    EXPECT_EQ(m.channel, "proj-x");
    EXPECT_EQ(m.sender, "claude");
    EXPECT_EQ(m.text, "hello\n```cpp\nint x;\n```");
    EXPECT_EQ(channel.size(), 1u);
    EXPECT_EQ(channel.name(), "proj-x");
}

// Channels sharing an allocator interleave ids but each stays increasing
TEST(ChannelTest, IdsAreSharedAcrossChannels) {
    IdentityAllocator ids;
    Channel a("a", ids);
    Channel b("b", ids);

    EXPECT_EQ(a.append("s", "1").id, 1u);
    EXPECT_EQ(b.append("s", "2").id, 2u);
    EXPECT_EQ(a.append("s", "3").id, 3u);

    EXPECT_EQ(ids_of(a.messages_since(0)), (std::vector<uint64_t>{1, 3}));
    EXPECT_EQ(ids_of(b.messages_since(0)), (std::vector<uint64_t>{2}));
}

// since_id is an exclusive lower bound
TEST(ChannelTest, MessagesSinceIsExclusive) {
    IdentityAllocator ids;
    Channel channel("c", ids);
    for (int i = 0; i < 5; ++i) channel.append("s", std::to_string(i));

    EXPECT_EQ(ids_of(channel.messages_since(0)), (std::vector<uint64_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(ids_of(channel.messages_since(3)), (std::vector<uint64_t>{4, 5}));
    EXPECT_TRUE(channel.messages_since(5).empty());
}

// A since_id beyond anything the channel holds yields an empty result
TEST(ChannelTest, FutureSinceIdReturnsEmpty) {
    IdentityAllocator ids;
    Channel channel("c", ids);
    channel.append("s", "x");
    EXPECT_TRUE(channel.messages_since(1000000).empty());
}

// Limit truncation keeps the OLDEST qualifying messages so a poller that
// advances since_id to the last id it received never skips a message.
TEST(ChannelTest, LimitKeepsOldestMessages) {
    IdentityAllocator ids;
    Channel channel("c", ids);
    for (int i = 0; i < 10; ++i) channel.append("s", std::to_string(i));

    EXPECT_EQ(ids_of(channel.messages_since(0, 3)), (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(ids_of(channel.messages_since(3, 3)), (std::vector<uint64_t>{4, 5, 6}));
    EXPECT_EQ(ids_of(channel.messages_since(9, 3)), (std::vector<uint64_t>{10}));
    EXPECT_TRUE(channel.messages_since(0, 0).empty());
}

// recent() returns the newest messages, still in ascending order
TEST(ChannelTest, RecentReturnsNewestAscending) {
    IdentityAllocator ids;
    Channel channel("c", ids);
    for (int i = 0; i < 6; ++i) channel.append("s", std::to_string(i));

    EXPECT_EQ(ids_of(channel.recent(2)), (std::vector<uint64_t>{5, 6}));
    EXPECT_EQ(ids_of(channel.recent(100)), (std::vector<uint64_t>{1, 2, 3, 4, 5, 6}));
}

// Empty text is stored as is
TEST(ChannelTest, EmptyTextAccepted) {
    IdentityAllocator ids;
    Channel channel("c", ids);
    EXPECT_EQ(channel.append("s", "").text, "");
    EXPECT_EQ(channel.size(), 1u);
}

// created_at never goes backwards inside a channel
TEST(ChannelTest, CreatedAtIsNonDecreasing) {
    IdentityAllocator ids;
    Channel channel("c", ids);
    for (int i = 0; i < 100; ++i) channel.append("s", "x");
    auto all = channel.messages_since(0);
    for (size_t i = 1; i < all.size(); ++i) EXPECT_LE(all[i - 1].created_at, all[i].created_at);
}

// With a retention cap the oldest messages are dropped and ids keep counting
TEST(ChannelTest, RetentionCapDropsOldest) {
    IdentityAllocator ids;
    Channel channel("c", ids, 3);
    for (int i = 0; i < 5; ++i) channel.append("s", std::to_string(i));

    EXPECT_EQ(channel.size(), 3u);
    EXPECT_EQ(ids_of(channel.messages_since(0)), (std::vector<uint64_t>{3, 4, 5}));
    EXPECT_EQ(ids_of(channel.messages_since(1)), (std::vector<uint64_t>{3, 4, 5}));
    EXPECT_EQ(channel.append("s", "next").id, 6u);
}

// Readers running next to writers always see a gap-free ascending prefix
TEST(ChannelTest, ConcurrentReadersSeeConsistentPrefix) {
    IdentityAllocator ids;
    Channel channel("c", ids);
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 2000;

    std::atomic<bool> done{false};
    std::atomic<int> violations{0};
    std::thread reader([&]() {
        while (!done.load()) {
            auto snapshot = channel.messages_since(0);
            for (size_t i = 0; i < snapshot.size(); ++i) {
                // single channel, single allocator: ids are exactly 1..n
                if (snapshot[i].id != i + 1) violations.fetch_add(1);
            }
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&channel, w]() {
            for (int i = 0; i < kPerWriter; ++i) channel.append("w" + std::to_string(w), "m");
        });
    }
    for (auto& th : writers) th.join();
    done.store(true);
    reader.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(channel.size(), static_cast<size_t>(kWriters * kPerWriter));
}
