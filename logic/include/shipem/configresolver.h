#pragma once

#include "shipem/exceptions.h"
#include "shipem/matchconfig.h"

#include "infra/span.h"
#include "infra/string.h"

#include <algorithm>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace shipem {

template <typename TValue>
using ResolvedValues = std::map<std::string, TValue, std::less<>>;

/* Decides if a matching rule may supply the given key, receives the values collected so far
 * (including the ones already taken from this rule for keys listed earlier in the needed keys) */
template <typename TValue>
using ResolveFilter = std::function<bool(const MatchConfig<TValue>& config, std::string_view key, const ResolvedValues<TValue>& collected)>;

/* Scans the rules in order and collects for every needed key the value of the first
 * matching rule that supplies it. Later matches never override an earlier value.
 * Stops as soon as all the keys are collected, the result misses the keys for which no rule matched. */
template <typename TValue>
ResolvedValues<TValue> resolve(std::span<const MatchConfig<TValue>> configs,
                               const Attributes& context,
                               std::span<const std::string_view> neededKeys,
                               const ResolveFilter<TValue>& filter = nullptr)
{
    ResolvedValues<TValue> result;
    if (neededKeys.empty()) {
        return result;
    }

    for (const auto& config : configs) {
        if (!config.matches(context)) {
            continue;
        }

        for (auto key : neededKeys) {
            if (result.find(key) != result.end()) {
                continue;
            }

            if (const auto* value = config.find(key); value != nullptr) {
                if (filter && !filter(config, key, result)) {
                    continue;
                }

                result.emplace(std::string(key), *value);
            }
        }

        if (std::all_of(neededKeys.begin(), neededKeys.end(), [&result](std::string_view key) { return result.find(key) != result.end(); })) {
            break;
        }
    }

    return result;
}

template <typename TValue>
ResolvedValues<TValue> resolve(const MatchConfigs<TValue>& configs,
                               const Attributes& context,
                               std::initializer_list<std::string_view> neededKeys,
                               const ResolveFilter<TValue>& filter = nullptr)
{
    return resolve<TValue>(std::span<const MatchConfig<TValue>>(configs), context, std::span<const std::string_view>(neededKeys.begin(), neededKeys.size()), filter);
}

// Same as resolve, but throws a ConfigurationError naming the keys that could not be resolved
template <typename TValue>
ResolvedValues<TValue> resolve_required(std::span<const MatchConfig<TValue>> configs,
                                        const Attributes& context,
                                        std::span<const std::string_view> neededKeys,
                                        std::string_view configName,
                                        const ResolveFilter<TValue>& filter = nullptr)
{
    auto result = resolve<TValue>(configs, context, neededKeys, filter);
    if (result.size() != neededKeys.size()) {
        std::vector<std::string_view> missing;
        for (auto key : neededKeys) {
            if (result.find(key) == result.end()) {
                missing.push_back(key);
            }
        }

        throw ConfigurationError("No value for {} could be resolved from '{}' for {}", inf::str::join(missing, ", "), configName, to_string(context));
    }

    return result;
}

template <typename TValue>
ResolvedValues<TValue> resolve_required(const MatchConfigs<TValue>& configs,
                                        const Attributes& context,
                                        std::initializer_list<std::string_view> neededKeys,
                                        std::string_view configName)
{
    return resolve_required<TValue>(std::span<const MatchConfig<TValue>>(configs), context, std::span<const std::string_view>(neededKeys.begin(), neededKeys.size()), configName);
}

// The first rule that matches the context and supplies the key, nullptr if there is none
template <typename TValue>
const MatchConfig<TValue>* resolve_entry(std::span<const MatchConfig<TValue>> configs, const Attributes& context, std::string_view key) noexcept
{
    for (const auto& config : configs) {
        if (config.contains(key) && config.matches(context)) {
            return &config;
        }
    }

    return nullptr;
}

}
