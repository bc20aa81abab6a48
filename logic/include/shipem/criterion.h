#pragma once

#include "shipem/attributes.h"
#include "infra/span.h"

#include <fmt/core.h>
#include <functional>
#include <variant>
#include <vector>

namespace shipem {

// Half-open numeric interval: ge <= value < lt
struct Range
{
    double ge = 0.0;
    double lt = 0.0;

    constexpr bool contains(double value) const noexcept
    {
        return ge <= value && value < lt;
    }

    constexpr bool operator==(const Range& other) const noexcept
    {
        return ge == other.ge && lt == other.lt;
    }
};

// Throws a ValidationError when ge >= lt
Range make_range(double ge, double lt);

/* Atomic predicate over the value of one attribute
 * Const: the value equals the constant
 * Range: the value is a number inside the range
 * AnyOf: the value matches any of the members (constants or ranges) */
class Criterion
{
public:
    enum class Type
    {
        Const,
        Range,
        AnyOf,
    };

    using Member = std::variant<AttributeValue, Range>;

    static Criterion equal_to(AttributeValue value);
    static Criterion in_range(double ge, double lt);
    static Criterion any_of(std::vector<Member> members);

    Type type() const noexcept;
    bool matches(const AttributeValue& value) const noexcept;

    std::span<const Member> members() const noexcept;

    // True when every constant in this criterion satisfies the predicate, ranges are not checked
    bool constants_satisfy(const std::function<bool(const AttributeValue&)>& pred) const;

private:
    Criterion(Type type, std::vector<Member> members);

    Type _type;
    std::vector<Member> _members;
};

}

template <>
struct fmt::formatter<shipem::Criterion>
{
    FMT_CONSTEXPR20 auto parse(format_parse_context& ctx) -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(const shipem::Criterion& val, format_context& ctx) const -> format_context::iterator
    {
        auto out = ctx.out();
        if (val.type() == shipem::Criterion::Type::AnyOf) {
            out = fmt::format_to(out, "any_of[");
        }

        bool first = true;
        for (const auto& member : val.members()) {
            if (!first) {
                out = fmt::format_to(out, ", ");
            }
            first = false;

            if (const auto* range = std::get_if<shipem::Range>(&member)) {
                out = fmt::format_to(out, "[{}, {})", range->ge, range->lt);
            } else {
                out = fmt::format_to(out, "{}", std::get<shipem::AttributeValue>(member));
            }
        }

        if (val.type() == shipem::Criterion::Type::AnyOf) {
            out = fmt::format_to(out, "]");
        }

        return out;
    }
};
