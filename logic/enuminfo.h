#pragma once

#include <algorithm>
#include <cassert>
#include <optional>
#include <string_view>
#include <vector>

namespace shipem {

template <typename TEnum>
struct EnumInfo
{
    constexpr bool is_serialized_name(std::string_view name) const noexcept
    {
        return serializedName == name;
    }

    TEnum id;
    std::string_view serializedName;
    std::string_view description;
};

template <typename TEnum>
struct MultiEnumInfo
{
    std::string_view serialized_name() const noexcept
    {
        assert(!serializedNames.empty());
        return serializedNames.front();
    }

    bool is_serialized_name(std::string_view name) const noexcept
    {
        return std::any_of(serializedNames.begin(), serializedNames.end(), [=](std::string_view serialized) {
            return serialized == name;
        });
    }

    TEnum id;
    std::vector<std::string_view> serializedNames; // Multiple possible names, the first entry is the serialized one
    std::string_view description;
};

template <typename TEnum, typename TContainer>
std::optional<TEnum> enum_from_serialized_name(const TContainer& infos, std::string_view name) noexcept
{
    auto iter = std::find_if(infos.begin(), infos.end(), [name](const auto& info) {
        return info.is_serialized_name(name);
    });

    if (iter == infos.end()) {
        return {};
    }

    return iter->id;
}

}
