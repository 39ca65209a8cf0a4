#include "kernel/provider_registry.hpp"

#include <algorithm>

namespace tk {

ProviderRegistry& ProviderRegistry::instance() {
    static ProviderRegistry inst;
    return inst;
}

void ProviderRegistry::register_erased(ProviderEntryInfo info, ErasedFactory factory) {
    if (info.capability.empty())
        throw ThumbError(ThumbErrc::InvalidParameter, "register: capability name must not be empty");
    if (info.name.empty())
        throw ThumbError(ThumbErrc::InvalidParameter, "register: provider name must not be empty");
    if (!factory)
        throw ThumbError(ThumbErrc::InvalidParameter, "register: provider '" + info.name + "' has no factory");

    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = entries_[info.capability];
    bucket.push_back({std::move(info), std::move(factory)});
}

std::vector<ProviderEntry> ProviderRegistry::snapshot(const std::string& capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(capability);
    if (it == entries_.end()) return {};
    return it->second;
}

std::vector<ProviderEntry> ProviderRegistry::snapshot_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProviderEntry> out;
    for (const auto& kv : entries_)
        out.insert(out.end(), kv.second.begin(), kv.second.end());
    return out;
}

std::vector<ProviderEntryInfo> ProviderRegistry::list(const std::string& capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProviderEntryInfo> out;
    for (const auto& kv : entries_) {
        if (!capability.empty() && kv.first != capability) continue;
        for (const auto& e : kv.second) out.push_back(e.info);
    }
    return out;
}

std::vector<std::string> ProviderRegistry::capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& kv : entries_)
        if (!kv.second.empty()) names.push_back(kv.first);
    return names;
}

std::size_t ProviderRegistry::count(const std::string& capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(capability);
    return it == entries_.end() ? 0 : it->second.size();
}

std::size_t ProviderRegistry::count_source(const std::string& capability, const std::string& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(capability);
    if (it == entries_.end()) return 0;
    return static_cast<std::size_t>(std::count_if(it->second.begin(), it->second.end(),
        [&](const ProviderEntry& e) { return e.info.source == source; }));
}

int ProviderRegistry::unregister_provider(const std::string& capability, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(capability);
    if (it == entries_.end()) return 0;
    auto& bucket = it->second;
    const auto before = bucket.size();
    bucket.erase(std::remove_if(bucket.begin(), bucket.end(),
                                [&](const ProviderEntry& e) { return e.info.name == name; }),
                 bucket.end());
    return static_cast<int>(before - bucket.size());
}

int ProviderRegistry::unregister_source(const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    int removed = 0;
    for (auto& kv : entries_) {
        auto& bucket = kv.second;
        const auto before = bucket.size();
        bucket.erase(std::remove_if(bucket.begin(), bucket.end(),
                                    [&](const ProviderEntry& e) { return e.info.source == source; }),
                     bucket.end());
        removed += static_cast<int>(before - bucket.size());
    }
    return removed;
}

void ProviderRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace tk
