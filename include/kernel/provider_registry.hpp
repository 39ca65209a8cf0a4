// Thumbkit kernel: ProviderRegistry interface
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "kernel/provider_sequence.hpp"
#include "tk_types.hpp"

namespace tk {

// Maps a capability interface to its identifier. The default reads
// Capability::capability_name(); specialize for interfaces you cannot edit.
template <typename Capability>
struct CapabilityTraits {
    static std::string name() { return Capability::capability_name(); }
};

inline constexpr const char* kBuiltinSource = "built-in";

// Catalog of provider entries, grouped by capability, in registration order.
// Entries are factories, not instances: nothing is constructed until a
// ProviderSequence realizes it.
class THUMBKIT_API ProviderRegistry {
public:
    ProviderRegistry() = default;
    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    static ProviderRegistry& instance();

    // Fn: callable returning something convertible to std::shared_ptr<Capability>.
    template <typename Capability, typename Fn>
    void register_provider(const std::string& name, Fn factory,
                           const std::string& source = kBuiltinSource) {
        ErasedFactory erased = [fn = std::move(factory)]() -> std::shared_ptr<void> {
            std::shared_ptr<Capability> instance = fn();
            return instance;
        };
        register_erased({CapabilityTraits<Capability>::name(), name, source}, std::move(erased));
    }

    template <typename Capability, typename Impl>
    void register_type(const std::string& name, const std::string& source = kBuiltinSource) {
        register_provider<Capability>(name, [] { return std::make_shared<Impl>(); }, source);
    }

    // Low-level hook used by plugin and manifest loaders. The factory must
    // produce a pointer to the capability named in info.capability.
    void register_erased(ProviderEntryInfo info, ErasedFactory factory);

    // Fresh lazy pass over the providers of Capability.
    template <typename Capability>
    ProviderSequence<Capability> load() const {
        return ProviderSequence<Capability>(snapshot(CapabilityTraits<Capability>::name()));
    }

    std::vector<ProviderEntry> snapshot(const std::string& capability) const;
    // Every entry of every capability, capabilities in name order.
    std::vector<ProviderEntry> snapshot_all() const;

    // Metadata only; an empty capability lists all.
    std::vector<ProviderEntryInfo> list(const std::string& capability = "") const;
    std::vector<std::string> capabilities() const;
    std::size_t count(const std::string& capability) const;
    std::size_t count_source(const std::string& capability, const std::string& source) const;

    // Returns number of entries removed.
    int unregister_provider(const std::string& capability, const std::string& name);
    int unregister_source(const std::string& source);
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<ProviderEntry>> entries_;
};

} // namespace tk
