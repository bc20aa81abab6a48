#include "shipem/criterion.h"
#include "shipem/exceptions.h"

#include <algorithm>
#include <cmath>

namespace shipem {

using namespace inf;

static bool member_matches(const Criterion::Member& member, const AttributeValue& value) noexcept
{
    if (const auto* range = std::get_if<Range>(&member)) {
        const auto number = as_number(value);
        return number.has_value() && range->contains(*number);
    }

    return attribute_equals(std::get<AttributeValue>(member), value);
}

Range make_range(double ge, double lt)
{
    if (std::isnan(ge) || std::isnan(lt) || !(ge < lt)) {
        throw ValidationError("Invalid range criterion: ge ({}) must be smaller than lt ({})", ge, lt);
    }

    return Range{ge, lt};
}

Criterion::Criterion(Type type, std::vector<Member> members)
: _type(type)
, _members(std::move(members))
{
}

Criterion Criterion::equal_to(AttributeValue value)
{
    return Criterion(Type::Const, {Member(std::move(value))});
}

Criterion Criterion::in_range(double ge, double lt)
{
    return Criterion(Type::Range, {Member(make_range(ge, lt))});
}

Criterion Criterion::any_of(std::vector<Member> members)
{
    if (members.empty()) {
        throw ValidationError("An any_of criterion needs at least one member");
    }

    for (const auto& member : members) {
        if (const auto* range = std::get_if<Range>(&member)) {
            make_range(range->ge, range->lt);
        }
    }

    return Criterion(Type::AnyOf, std::move(members));
}

Criterion::Type Criterion::type() const noexcept
{
    return _type;
}

bool Criterion::matches(const AttributeValue& value) const noexcept
{
    return std::any_of(_members.begin(), _members.end(), [&value](const Member& member) {
        return member_matches(member, value);
    });
}

std::span<const Criterion::Member> Criterion::members() const noexcept
{
    return _members;
}

bool Criterion::constants_satisfy(const std::function<bool(const AttributeValue&)>& pred) const
{
    return std::all_of(_members.begin(), _members.end(), [&pred](const Member& member) {
        if (const auto* value = std::get_if<AttributeValue>(&member)) {
            return pred(*value);
        }

        return true;
    });
}

}
