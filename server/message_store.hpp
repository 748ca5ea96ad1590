// message_store.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "message.hpp"
#include "identity_allocator.hpp"
#include "channel_registry.hpp"
#include "store_errors.hpp"

// Entry point for every post, fetch and listing. One instance is built at
// startup and shared by all request handlers; tests build their own.
//
// post_message throws ValidationError on an empty channel or sender.
// fetch_messages/recent_messages throw NotFoundError for a channel nobody
// has posted to or seeded, and never create it.
class MessageStore {
public:
    using PostObserver = std::function<void(const Message&)>;

    explicit MessageStore(size_t max_messages_per_channel = 0);
    MessageStore(const std::vector<std::string>& seed_channels, size_t max_messages_per_channel = 0);

    Message post_message(const std::string& channel_name, const std::string& sender, const std::string& text);
    std::vector<Message> fetch_messages(const std::string& channel_name, uint64_t since_id = 0,
                                        std::optional<size_t> limit = std::nullopt) const;
    std::vector<Message> recent_messages(const std::string& channel_name, size_t count) const;
    std::vector<std::string> list_channels() const;
    bool has_channel(const std::string& channel_name) const;

    // Called after every successful post, outside the store's locks. Must be
    // set before the store is shared between threads.
    void set_post_observer(PostObserver observer);

private:
    const Channel& existing_channel(const std::string& channel_name) const;

    IdentityAllocator ids_;
    ChannelRegistry registry_;
    PostObserver post_observer_;
};

// Observer that writes the post to the process log.
void log_posted_message(const Message& m);
