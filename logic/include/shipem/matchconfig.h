#pragma once

#include "shipem/attributes.h"
#include "shipem/criterion.h"

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shipem {

/* The named criteria of a rule, all of them have to match
 * An attribute that is absent from the context never matches
 * Empty criteria always match (fallback rule) */
class MatchCriteria
{
public:
    using value_type     = std::pair<std::string, Criterion>;
    using const_iterator = std::vector<value_type>::const_iterator;

    // Throws a ValidationError when a criterion for the name is already present
    void add(std::string_view name, Criterion criterion);

    bool matches(const Attributes& context) const noexcept;

    const Criterion* find(std::string_view name) const noexcept;
    bool contains(std::string_view name) const noexcept;

    // True if the only criterion present is the one for the given name
    bool has_only(std::string_view name) const noexcept;

    bool empty() const noexcept;
    size_t size() const noexcept;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

private:
    std::vector<value_type> _criteria;
};

// A conditional rule: the data is relevant for every context the criteria match
template <typename TValue>
struct MatchConfig
{
    using Data = std::map<std::string, TValue, std::less<>>;

    MatchConfig() = default;
    MatchConfig(MatchCriteria crit, Data d)
    : criteria(std::move(crit))
    , data(std::move(d))
    {
    }

    bool matches(const Attributes& context) const noexcept
    {
        return criteria.matches(context);
    }

    const TValue* find(std::string_view key) const noexcept
    {
        if (auto iter = data.find(key); iter != data.end()) {
            return &iter->second;
        }

        return nullptr;
    }

    bool contains(std::string_view key) const noexcept
    {
        return data.find(key) != data.end();
    }

    MatchCriteria criteria;
    Data data;
};

// Ordered rule list, the order is significant: first listed, first served
template <typename TValue>
using MatchConfigs = std::vector<MatchConfig<TValue>>;

using AttributeMatchConfig  = MatchConfig<AttributeValue>;
using AttributeMatchConfigs = MatchConfigs<AttributeValue>;

}
