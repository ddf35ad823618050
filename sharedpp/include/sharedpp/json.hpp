#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

using json = nlohmann::json;

namespace nlohmann
{
    template <class T>
    void to_json(nlohmann::json& j, const std::optional<T>& v)
    {
        if (v.has_value())
            j = *v;
        else
            j = nullptr;
    }

    template <class T>
    void from_json(const nlohmann::json& j, std::optional<T>& v)
    {
        if (j.is_null())
            v = std::nullopt;
        else
            v = j.get<T>();
    }
} // namespace nlohmann

namespace ChannelKey
{
    /**
     * Reads an optional member. Absent and null members leave the target empty,
     * members of the wrong type throw nlohmann::json::type_error.
     */
    template <typename T>
    void readOptionalMember(json const& object, std::string const& key, std::optional<T>& target)
    {
        const auto iter = object.find(key);
        if (iter == std::end(object))
        {
            target = std::nullopt;
            return;
        }
        target = iter->template get<std::optional<T>>();
    }
} // namespace ChannelKey
