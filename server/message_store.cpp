// message_store.cpp
#include "message_store.hpp"
#include <cstdio>
#include <exception>
#include <utility>
#include "logger.hpp"

MessageStore::MessageStore(size_t max_messages_per_channel)
    : registry_(ids_, max_messages_per_channel) {}

MessageStore::MessageStore(const std::vector<std::string>& seed_channels, size_t max_messages_per_channel)
    : registry_(ids_, max_messages_per_channel) {
    registry_.seed(seed_channels);
}

void MessageStore::set_post_observer(PostObserver observer) {
    post_observer_ = std::move(observer);
}

Message MessageStore::post_message(const std::string& channel_name, const std::string& sender, const std::string& text) {
    if (channel_name.empty()) throw ValidationError("channel name must not be empty");
    if (sender.empty()) throw ValidationError("sender must not be empty");

    Message posted = registry_.get_or_create(channel_name).append(sender, text);

    if (post_observer_) {
        // the post has already happened; a failing sink must not undo or fail it
        try {
            post_observer_(posted);
        } catch (const std::exception& ex) {
            std::fprintf(stderr, "post observer failed for message %llu: %s\n",
                         static_cast<unsigned long long>(posted.id), ex.what());
        }
    }
    return posted;
}

const Channel& MessageStore::existing_channel(const std::string& channel_name) const {
    const Channel* channel = registry_.find(channel_name);
    if (!channel) throw NotFoundError("unknown channel: " + channel_name);
    return *channel;
}

std::vector<Message> MessageStore::fetch_messages(const std::string& channel_name, uint64_t since_id,
                                                  std::optional<size_t> limit) const {
    return existing_channel(channel_name).messages_since(since_id, limit);
}

std::vector<Message> MessageStore::recent_messages(const std::string& channel_name, size_t count) const {
    return existing_channel(channel_name).recent(count);
}

std::vector<std::string> MessageStore::list_channels() const {
    return registry_.list_names();
}

bool MessageStore::has_channel(const std::string& channel_name) const {
    return registry_.find(channel_name) != nullptr;
}

void log_posted_message(const Message& m) {
    Logger::instance().info("post_message", {
        {"id", m.id},
        {"channel", m.channel},
        {"sender", m.sender},
        {"text_len", static_cast<uint64_t>(m.text.size())}
    });
}
