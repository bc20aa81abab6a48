#include "shipem/matchconfig.h"
#include "shipem/exceptions.h"

#include "infra/algo.h"

#include <algorithm>

namespace shipem {

using namespace inf;

void MatchCriteria::add(std::string_view name, Criterion criterion)
{
    if (contains(name)) {
        throw ValidationError("Duplicate match criterion for '{}'", name);
    }

    _criteria.emplace_back(std::string(name), std::move(criterion));
}

bool MatchCriteria::matches(const Attributes& context) const noexcept
{
    return std::all_of(_criteria.begin(), _criteria.end(), [&context](const value_type& namedCriterion) {
        auto iter = context.find(namedCriterion.first);
        if (iter == context.end()) {
            return false;
        }

        return namedCriterion.second.matches(iter->second);
    });
}

const Criterion* MatchCriteria::find(std::string_view name) const noexcept
{
    const auto* namedCriterion = find_in_container(_criteria, [name](const value_type& entry) {
        return entry.first == name;
    });

    return namedCriterion ? &namedCriterion->second : nullptr;
}

bool MatchCriteria::contains(std::string_view name) const noexcept
{
    return find(name) != nullptr;
}

bool MatchCriteria::has_only(std::string_view name) const noexcept
{
    return _criteria.size() == 1 && _criteria.front().first == name;
}

bool MatchCriteria::empty() const noexcept
{
    return _criteria.empty();
}

size_t MatchCriteria::size() const noexcept
{
    return _criteria.size();
}

MatchCriteria::const_iterator MatchCriteria::begin() const noexcept
{
    return _criteria.begin();
}

MatchCriteria::const_iterator MatchCriteria::end() const noexcept
{
    return _criteria.end();
}

}
