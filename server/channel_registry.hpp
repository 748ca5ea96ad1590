// channel_registry.hpp
#pragma once
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "channel.hpp"
#include "identity_allocator.hpp"

// Owns every Channel of a store. Names are enumerated in first-seen order and
// a name is bound to one Channel for the registry's lifetime, so references
// returned here stay valid as long as the registry does.
class ChannelRegistry {
public:
    explicit ChannelRegistry(IdentityAllocator& ids, size_t max_messages_per_channel = 0);

    void seed(const std::vector<std::string>& names);
    Channel& get_or_create(const std::string& name);
    Channel* find(const std::string& name) const; // nullptr when never seen
    std::vector<std::string> list_names() const;
    size_t size() const;

private:
    IdentityAllocator& ids_;
    size_t max_messages_per_channel_;

    mutable std::shared_mutex channels_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Channel>> channels_by_name_;
    std::vector<std::string> channel_order_;
};
