// channel.hpp
#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "message.hpp"
#include "identity_allocator.hpp"

// Append-only message sequence of one named topic. Ids are allocated inside
// the channel's write lock, so id order equals append order.
class Channel {
public:
    // max_messages == 0 keeps every message
    Channel(std::string name, IdentityAllocator& ids, size_t max_messages = 0);
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    Message append(const std::string& sender, const std::string& text);

    // Messages with id > since_id in ascending order. When more than `limit`
    // qualify the oldest ones are kept, so a poller never skips a message.
    std::vector<Message> messages_since(uint64_t since_id, std::optional<size_t> limit = std::nullopt) const;

    // Newest `count` messages, ascending.
    std::vector<Message> recent(size_t count) const;

    const std::string& name() const { return name_; }
    size_t size() const;

private:
    const std::string name_;
    IdentityAllocator& ids_;
    const size_t max_messages_;

    mutable std::shared_mutex messages_mutex_;
    std::deque<Message> message_buffer_;
};
