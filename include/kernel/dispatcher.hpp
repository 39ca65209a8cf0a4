// Thumbkit kernel: first-match dispatch over a capability's providers
#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "kernel/provider_registry.hpp"

namespace tk {

// What happened during one find_provider() scan (no console I/O in kernel;
// frontends decide whether to print skipped entries).
struct DiscoveryReport {
    int examined = 0;   // entries the scan tried to realize
    int rejected = 0;   // realized providers whose accepts() returned false
    std::vector<ProviderConfigurationError> skipped;
    std::string selected;  // provider name; empty when nothing accepted
};

/**
 * @brief Selects the first provider, in registry order, that accepts an input.
 *
 * Capability must expose `bool accepts(const Input&) const` and
 * `Output process(const Input&)`. Every call re-scans the registry; the
 * selection is never cached.
 */
template <typename Capability>
class Dispatcher {
public:
    explicit Dispatcher(const ProviderRegistry& registry) : registry_(registry) {}

    template <typename Input>
    std::shared_ptr<Capability> find_provider(const Input& input, DiscoveryReport* report = nullptr) const {
        DiscoveryReport local;
        DiscoveryReport& rep = report ? *report : local;

        auto sequence = registry_.template load<Capability>();
        while (sequence.has_next()) {
            const std::string name = sequence.peek_info().name;
            std::shared_ptr<Capability> provider;
            ++rep.examined;
            try {
                provider = sequence.next();
            } catch (const ProviderConfigurationError& e) {
                rep.skipped.push_back(e);
                continue;
            }
            if (provider->accepts(input)) {
                rep.selected = name;
                return provider;
            }
            ++rep.rejected;
        }
        return nullptr;
    }

    // Same result as find_provider(), but accepts() runs concurrently on every
    // realized provider. Construction stays sequential and in order.
    template <typename Input>
    std::shared_ptr<Capability> find_provider_parallel(const Input& input, DiscoveryReport* report = nullptr) const {
        DiscoveryReport local;
        DiscoveryReport& rep = report ? *report : local;

        struct Candidate {
            std::string name;
            std::shared_ptr<Capability> provider;
            std::future<bool> verdict;
        };
        std::vector<Candidate> candidates;

        auto sequence = registry_.template load<Capability>();
        while (sequence.has_next()) {
            const std::string name = sequence.peek_info().name;
            ++rep.examined;
            try {
                candidates.push_back({name, sequence.next(), {}});
            } catch (const ProviderConfigurationError& e) {
                rep.skipped.push_back(e);
            }
        }

        for (auto& c : candidates) {
            const Capability* p = c.provider.get();
            c.verdict = std::async(std::launch::async, [p, &input] { return p->accepts(input); });
        }

        // Lowest index wins. get() rethrows an exception from accepts().
        std::shared_ptr<Capability> chosen;
        for (auto& c : candidates) {
            if (chosen) {
                c.verdict.wait();  // a sequential scan would never have asked this one
                continue;
            }
            if (c.verdict.get()) {
                chosen = c.provider;
                rep.selected = c.name;
            } else {
                ++rep.rejected;
            }
        }
        return chosen;
    }

    // Invokes the selected provider. Its errors reach the caller unchanged.
    template <typename Input>
    auto dispatch(Capability& provider, const Input& input) const -> decltype(provider.process(input)) {
        return provider.process(input);
    }

    template <typename Input>
    using OutputOf = std::decay_t<decltype(std::declval<Capability&>().process(std::declval<const Input&>()))>;

    // find_provider() + dispatch(). std::nullopt means no provider accepted the input.
    template <typename Input>
    std::optional<OutputOf<Input>> handle(const Input& input, DiscoveryReport* report = nullptr,
                                          bool parallel = false) const {
        std::shared_ptr<Capability> provider =
            parallel ? find_provider_parallel(input, report) : find_provider(input, report);
        if (!provider) return std::nullopt;
        return dispatch(*provider, input);
    }

private:
    const ProviderRegistry& registry_;
};

} // namespace tk
