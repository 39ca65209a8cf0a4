// Thumbkit kernel: lazy, fault-isolated sequence of providers
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "tk_types.hpp"

namespace tk {

// Type-erased factory. The pointer it returns always points at the
// capability interface the entry was registered under.
using ErasedFactory = std::function<std::shared_ptr<void>()>;

struct ProviderEntry {
    ProviderEntryInfo info;
    ErasedFactory factory;
};

/**
 * @brief One pass over the providers registered for a capability.
 *
 * The sequence owns a snapshot of the registry entries taken at load() time,
 * in registration order. Providers are constructed only when next() reaches
 * them; a failing entry throws ProviderConfigurationError but still advances
 * the cursor, so callers can catch, log and keep iterating.
 *
 * A sequence is consumed once. Call ProviderRegistry::load() again for a
 * fresh pass.
 */
template <typename Capability>
class ProviderSequence {
public:
    ProviderSequence() = default;
    explicit ProviderSequence(std::vector<ProviderEntry> entries)
        : entries_(std::move(entries)) {}

    bool has_next() const { return cursor_ < entries_.size(); }
    std::size_t position() const { return cursor_; }
    std::size_t size() const { return entries_.size(); }

    // Metadata of the entry next() would realize.
    const ProviderEntryInfo& peek_info() const {
        if (!has_next()) throw std::out_of_range("ProviderSequence: no entry left to peek");
        return entries_[cursor_].info;
    }

    std::shared_ptr<Capability> next() {
        if (!has_next()) throw std::out_of_range("ProviderSequence: sequence exhausted");
        const std::size_t index = cursor_++;
        const ProviderEntry& entry = entries_[index];

        std::shared_ptr<void> raw;
        try {
            if (!entry.factory) throw ThumbError(ThumbErrc::InvalidParameter, "entry has no factory");
            raw = entry.factory();
        } catch (const ProviderConfigurationError& e) {
            throw ProviderConfigurationError(index, entry.info, e.cause());
        } catch (const std::exception& e) {
            throw ProviderConfigurationError(index, entry.info, e.what());
        } catch (...) {
            throw ProviderConfigurationError(index, entry.info, "non-standard exception during construction");
        }
        if (!raw) throw ProviderConfigurationError(index, entry.info, "factory returned no instance");
        return std::static_pointer_cast<Capability>(raw);
    }

private:
    std::vector<ProviderEntry> entries_;
    std::size_t cursor_ = 0;
};

} // namespace tk
