#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <reflect>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace EvoScope {

namespace ReflectSerializerAdl {

struct JsonAdapter {
    nlohmann::json& json;
    operator nlohmann::json&() const { return json; }
};

struct ConstJsonAdapter {
    const nlohmann::json& json;
    operator const nlohmann::json&() const { return json; }
};

template <typename T>
auto test_to_json(int)
    -> decltype(to_json(JsonAdapter{ std::declval<nlohmann::json&>() }, std::declval<const T&>()), std::true_type{});

template <typename T>
std::false_type test_to_json(...);

template <typename T>
inline constexpr bool has_adl_to_json_v = decltype(test_to_json<T>(0))::value;

template <typename T>
auto test_from_json(int)
    -> decltype(from_json(ConstJsonAdapter{ std::declval<const nlohmann::json&>() }, std::declval<T&>()), std::true_type{});

template <typename T>
std::false_type test_from_json(...);

template <typename T>
inline constexpr bool has_adl_from_json_v = decltype(test_from_json<T>(0))::value;

template <typename T>
void call_to_json(nlohmann::json& j, const T& value)
{
    to_json(JsonAdapter{ j }, value);
}

template <typename T>
void call_from_json(const nlohmann::json& j, T& value)
{
    from_json(ConstJsonAdapter{ j }, value);
}

} // namespace ReflectSerializerAdl

/**
 * Reflection-based JSON serialization for aggregate types.
 *
 * Member names become JSON keys. Empty optionals are omitted on write and left
 * unset on read. Enums use an ADL to_json/from_json pair when one exists,
 * otherwise their enumerator name.
 *
 * Example:
 *   struct Point { double x = 0.0; double y = 0.0; };
 *   auto j = ReflectSerializer::to_json(Point{ 1.5, 2.5 });
 *   auto p = ReflectSerializer::from_json<Point>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

namespace detail {

template <typename EnumType>
nlohmann::json writeEnum(const EnumType& value)
{
    if constexpr (ReflectSerializerAdl::has_adl_to_json_v<EnumType>) {
        nlohmann::json enumJson;
        ReflectSerializerAdl::call_to_json(enumJson, value);
        return enumJson;
    }
    else {
        return std::string(reflect::enum_name(value));
    }
}

template <typename EnumType>
void readEnum(const nlohmann::json& j, EnumType& value)
{
    if constexpr (ReflectSerializerAdl::has_adl_from_json_v<EnumType>) {
        ReflectSerializerAdl::call_from_json(j, value);
    }
    else {
        const auto str = j.get<std::string>();
        for (const auto& [enumValue, enumName] : reflect::enumerators<EnumType>) {
            if (enumName == str) {
                value = static_cast<EnumType>(enumValue);
                return;
            }
        }
        throw std::runtime_error("Invalid enum value: " + str);
    }
}

} // namespace detail

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
                        j[name] = detail::writeEnum(*value);
                    }
                    else {
                        j[name] = *value;
                    }
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                j[name] = detail::writeEnum(value);
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
    T obj{};

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name) || j.at(name).is_null()) {
                return;
            }

            auto& member = reflect::get<I>(obj);
            using MemberType = std::remove_reference_t<decltype(member)>;

            if constexpr (is_optional_v<MemberType>) {
                using InnerType = typename MemberType::value_type;
                if constexpr (std::is_enum_v<InnerType>) {
                    InnerType enumValue{};
                    detail::readEnum(j.at(name), enumValue);
                    member = enumValue;
                }
                else {
                    member = j.at(name).template get<InnerType>();
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                detail::readEnum(j.at(name), member);
            }
            else {
                member = j.at(name).template get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer

} // namespace EvoScope
