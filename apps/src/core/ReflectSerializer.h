#pragma once

#include <reflect>

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * Generic reflection-based JSON serialization for aggregate config types.
 *
 * Uses qlibs/reflect for compile-time introspection and nlohmann/json
 * for JSON generation. Enums are written by enumerator name. Missing keys
 * keep the member's default value, so config files only need the fields
 * they override.
 *
 * Example:
 *   struct MutationConfig { double rate = 0.1; double volume = 0.05; };
 *   auto j = ReflectSerializer::to_json(MutationConfig{});
 *   auto config = ReflectSerializer::from_json<MutationConfig>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename EnumType>
EnumType enumFromString(const std::string& str)
{
    for (const auto& [enumValue, enumName] : reflect::enumerators<EnumType>) {
        if (enumName == str) {
            return static_cast<EnumType>(enumValue);
        }
    }
    throw std::runtime_error("Invalid enum value: " + str);
}

/**
 * Serialize any aggregate type to nlohmann::json.
 * Empty optionals are omitted.
 */
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
                    if constexpr (std::is_enum_v<typename MemberType::value_type>) {
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

/**
 * Deserialize nlohmann::json to any aggregate type.
 * Throws on type mismatches and unknown enum names.
 */
template <typename T>
T from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        throw std::runtime_error("expected a JSON object");
    }

    T obj{};

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name)) {
                return;
            }

            auto& member = reflect::get<I>(obj);
            using MemberType = std::remove_cvref_t<decltype(member)>;

            if constexpr (is_optional_v<MemberType>) {
                if (j[name].is_null()) {
                    member = std::nullopt;
                    return;
                }
                using InnerType = typename MemberType::value_type;
                if constexpr (std::is_enum_v<InnerType>) {
                    member = enumFromString<InnerType>(j[name].get<std::string>());
                }
                else {
                    member = j[name].get<InnerType>();
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                member = enumFromString<MemberType>(j[name].get<std::string>());
            }
            else {
                member = j[name].get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer
