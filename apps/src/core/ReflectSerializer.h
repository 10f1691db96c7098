#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <reflect>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>

/**
 * Generic reflection-based JSON serialization for aggregate types.
 *
 * Uses qlibs/reflect for compile-time introspection and nlohmann/json
 * for JSON generation. Enums are written by enumerator name, empty optionals
 * are omitted, and fields missing from the input keep their defaults. A key that
 * names no member is an error, so a misspelled config field is never silently ignored.
 *
 * Example:
 *   struct WheelLimits { double minRadius = 0.2; double maxRadius = 1.5; };
 *   auto j = ReflectSerializer::to_json(WheelLimits{});
 *   auto limits = ReflectSerializer::from_json<WheelLimits>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename EnumType>
EnumType enumFromName(const std::string& str)
{
    for (const auto& [enumValue, enumName] : reflect::enumerators<EnumType>) {
        if (enumName == str) {
            return static_cast<EnumType>(enumValue);
        }
    }
    throw std::runtime_error("Invalid enum value: " + str);
}

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);

            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                if (value.has_value()) {
                    using InnerType = typename MemberType::value_type;
                    if constexpr (std::is_enum_v<InnerType>) {
                        j[name] = std::string(reflect::enum_name(*value));
                    }
                    else {
                        j[name] = *value;
                    }
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                j[name] = std::string(reflect::enum_name(value));
            }
            else {
                j[name] = value;
            }
        },
        obj);

    return j;
}

template <typename T>
T from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        throw std::runtime_error("Expected a JSON object");
    }

    T obj{};

    std::unordered_set<std::string> known;
    reflect::for_each(
        [&](auto I) { known.emplace(std::string(reflect::member_name<I>(obj))); }, obj);
    for (const auto& item : j.items()) {
        if (!known.contains(item.key())) {
            throw std::runtime_error("Unknown field '" + item.key() + "'");
        }
    }

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name) || j[name].is_null()) {
                return;
            }

            using MemberType = std::remove_reference_t<decltype(reflect::get<I>(obj))>;

            if constexpr (is_optional_v<MemberType>) {
                using InnerType = typename MemberType::value_type;
                if constexpr (std::is_enum_v<InnerType>) {
                    reflect::get<I>(obj) = enumFromName<InnerType>(j[name].get<std::string>());
                }
                else {
                    reflect::get<I>(obj) = j[name].get<InnerType>();
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                reflect::get<I>(obj) = enumFromName<MemberType>(j[name].get<std::string>());
            }
            else {
                reflect::get<I>(obj) = j[name].get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer
