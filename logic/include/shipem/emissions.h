#pragma once

#include <fmt/core.h>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace shipem {

// Factor per pollutant (e.g. emission factors in g/kWh or low-load adjustment factors)
using PollutantFactors = std::map<std::string, double, std::less<>>;

// Emitted mass in grams per pollutant, the pollutant names are defined by the configuration
class Emissions
{
public:
    using const_iterator = PollutantFactors::const_iterator;

    Emissions() noexcept = default;
    explicit Emissions(PollutantFactors grams)
    : _grams(std::move(grams))
    {
    }

    void add(std::string_view pollutant, double grams)
    {
        if (auto iter = _grams.find(pollutant); iter != _grams.end()) {
            iter->second += grams;
        } else {
            _grams.emplace(std::string(pollutant), grams);
        }
    }

    std::optional<double> grams(std::string_view pollutant) const noexcept
    {
        if (auto iter = _grams.find(pollutant); iter != _grams.end()) {
            return iter->second;
        }

        return {};
    }

    bool contains(std::string_view pollutant) const noexcept
    {
        return _grams.find(pollutant) != _grams.end();
    }

    // Pollutants without a factor remain unchanged, factors without a pollutant are ignored
    Emissions scaled(const PollutantFactors& factors) const
    {
        Emissions result = *this;
        for (auto& [pollutant, grams] : result._grams) {
            if (auto iter = factors.find(pollutant); iter != factors.end()) {
                grams *= iter->second;
            }
        }

        return result;
    }

    Emissions& operator+=(const Emissions& other)
    {
        for (const auto& [pollutant, grams] : other._grams) {
            add(pollutant, grams);
        }

        return *this;
    }

    Emissions operator+(const Emissions& other) const
    {
        Emissions result = *this;
        result += other;
        return result;
    }

    bool empty() const noexcept
    {
        return _grams.empty();
    }

    size_t size() const noexcept
    {
        return _grams.size();
    }

    const_iterator begin() const noexcept
    {
        return _grams.begin();
    }

    const_iterator end() const noexcept
    {
        return _grams.end();
    }

    bool operator==(const Emissions& other) const noexcept
    {
        return _grams == other._grams;
    }

private:
    PollutantFactors _grams;
};

}

template <>
struct fmt::formatter<shipem::Emissions>
{
    FMT_CONSTEXPR20 auto parse(format_parse_context& ctx) -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(const shipem::Emissions& val, format_context& ctx) const -> format_context::iterator
    {
        auto out   = fmt::format_to(ctx.out(), "{{");
        bool first = true;
        for (const auto& [pollutant, grams] : val) {
            out   = fmt::format_to(out, "{}{}: {:.2f}g", first ? "" : ", ", pollutant, grams);
            first = false;
        }

        return fmt::format_to(out, "}}");
    }
};
