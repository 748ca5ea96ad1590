// channel_registry.cpp
#include "channel_registry.hpp"
#include <mutex>
#include "logger.hpp"

ChannelRegistry::ChannelRegistry(IdentityAllocator& ids, size_t max_messages_per_channel)
    : ids_(ids), max_messages_per_channel_(max_messages_per_channel) {}

void ChannelRegistry::seed(const std::vector<std::string>& names) {
    std::vector<std::string> seeded;
    {
        std::unique_lock<std::shared_mutex> lk(channels_mutex_);
        for (const auto& name : names) {
            if (name.empty() || channels_by_name_.count(name)) continue;
            channels_by_name_.emplace(name, std::make_unique<Channel>(name, ids_, max_messages_per_channel_));
            channel_order_.push_back(name);
            seeded.push_back(name);
        }
    }
    Logger::instance().info("Channels seeded", { {"channels", seeded} });
}

Channel& ChannelRegistry::get_or_create(const std::string& name) {
    {
        std::shared_lock<std::shared_mutex> lk(channels_mutex_);
        auto it = channels_by_name_.find(name);
        if (it != channels_by_name_.end()) return *it->second;
    }

    Channel* created = nullptr;
    uint64_t channel_count = 0;
    {
        std::unique_lock<std::shared_mutex> lk(channels_mutex_);
        // another writer may have created it between the two locks
        auto it = channels_by_name_.find(name);
        if (it != channels_by_name_.end()) return *it->second;

        auto inserted = channels_by_name_.emplace(name, std::make_unique<Channel>(name, ids_, max_messages_per_channel_));
        channel_order_.push_back(name);
        created = inserted.first->second.get();
        channel_count = channel_order_.size();
    }
    Logger::instance().info("Channel created", { {"channel", name}, {"channel_count", channel_count} });
    return *created;
}

Channel* ChannelRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lk(channels_mutex_);
    auto it = channels_by_name_.find(name);
    return it == channels_by_name_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ChannelRegistry::list_names() const {
    std::shared_lock<std::shared_mutex> lk(channels_mutex_);
    return channel_order_;
}

size_t ChannelRegistry::size() const {
    std::shared_lock<std::shared_mutex> lk(channels_mutex_);
    return channel_order_.size();
}
