// channel.cpp
#include "channel.hpp"
#include <algorithm>
#include <iterator>
#include <utility>
#include <mutex>

Channel::Channel(std::string name, IdentityAllocator& ids, size_t max_messages)
    : name_(std::move(name)), ids_(ids), max_messages_(max_messages) {}

Message Channel::append(const std::string& sender, const std::string& text) {
    std::unique_lock<std::shared_mutex> lk(messages_mutex_);
    auto now = std::chrono::system_clock::now();
    // keep created_at non-decreasing inside a channel even if the wall clock steps back
    if (!message_buffer_.empty() && now < message_buffer_.back().created_at)
        now = message_buffer_.back().created_at;

    message_buffer_.push_back(Message{ ids_.next(), name_, sender, text, now });
    if (max_messages_ != 0 && message_buffer_.size() > max_messages_)
        message_buffer_.pop_front();
    return message_buffer_.back();
}

std::vector<Message> Channel::messages_since(uint64_t since_id, std::optional<size_t> limit) const {
    std::shared_lock<std::shared_mutex> lk(messages_mutex_);
    auto first = std::upper_bound(message_buffer_.begin(), message_buffer_.end(), since_id,
        [](uint64_t id, const Message& m) { return id < m.id; });
    size_t available = static_cast<size_t>(message_buffer_.end() - first);
    size_t n = limit ? std::min(*limit, available) : available;

    std::vector<Message> out;
    out.reserve(n);
    std::copy_n(first, n, std::back_inserter(out));
    return out;
}

std::vector<Message> Channel::recent(size_t count) const {
    std::shared_lock<std::shared_mutex> lk(messages_mutex_);
    size_t start = (message_buffer_.size() > count) ? (message_buffer_.size() - count) : 0;
    return std::vector<Message>(message_buffer_.begin() + static_cast<std::ptrdiff_t>(start), message_buffer_.end());
}

size_t Channel::size() const {
    std::shared_lock<std::shared_mutex> lk(messages_mutex_);
    return message_buffer_.size();
}
