//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Decoder.h
// Purpose: Typed decoding of JSONValue trees with coding-path tracking and classified errors
//==========================================================================================================

#pragma once

#include <cmath>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include <boost/core/demangle.hpp>

#include "courier/JSONValue.h"
#include "courier/codec/Codec.h"

namespace courier {
namespace codec {

class Decoder;

//==========================================================================================================
// Decodable
// Purpose: A user type decodes itself through a static factory:
//            struct User {
//                static constexpr const char* kTypeName = "User";   // optional, used in error reports
//                std::string name; int age;
//                static User FromJSON(const codec::Decoder& d) {
//                    return User{d.Decode<std::string>("name"), d.Decode<int>("age")};
//                }
//            };
//==========================================================================================================
template <typename T>
concept Decodable = requires(const Decoder& d) {
    { T::FromJSON(d) } -> std::convertible_to<T>;
};

template <typename T> struct IsOptional : std::false_type {};
template <typename T> struct IsOptional<std::optional<T>> : std::true_type {};
template <typename T> struct IsVector : std::false_type {};
template <typename T, typename A> struct IsVector<std::vector<T, A>> : std::true_type {};

// Name used when reporting decoding failures: T::kTypeName when declared, else the demangled C++ name.
template <typename T>
std::string TypeName() {
    if constexpr (requires { T::kTypeName; }) {
        return std::string(T::kTypeName);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return "std::string";
    } else if constexpr (IsVector<T>::value) {
        return "std::vector<" + TypeName<typename T::value_type>() + ">";
    } else if constexpr (IsOptional<T>::value) {
        return "std::optional<" + TypeName<typename T::value_type>() + ">";
    } else {
        return boost::core::demangle(typeid(T).name());
    }
}

namespace detail {
[[noreturn]] void ThrowTypeMismatch(const std::vector<std::string>& path, const std::string& expected,
                                    const JSONValue& found);
[[noreturn]] void ThrowValueNotFound(const std::vector<std::string>& path, const std::string& expected);
[[noreturn]] void ThrowNumberDoesNotFit(const std::vector<std::string>& path, const JSONValue& number,
                                        const std::string& target);
std::vector<std::string> ChildPath(const std::vector<std::string>& path, std::string component);
bool IsNull(const JSONValue& v);
} // namespace detail

template <typename T>
T DecodeJSON(const JSONValue& value, const std::vector<std::string>& path = {});

//==========================================================================================================
// Decoder
// Purpose: View of one JSON node plus the coding path leading to it. Non-owning; valid while the tree is.
// Methods:
//   Decode<T>(key): Required member. Throws KeyNotFound, ValueNotFound, TypeMismatch or DataCorrupted.
//   DecodeIfPresent<T>(key): Optional member; absent or null yields std::nullopt.
//   DecodeValue<T>(): Decodes the node itself (single-value containers, enums backed by strings).
//   Contains(key): True when the node is an object holding key (null values count as present).
//   DataCorruptedError(...): Builds an error for values that parse but are rejected by the type.
//==========================================================================================================
class Decoder {
public:
    explicit Decoder(const JSONValue& value, std::vector<std::string> codingPath = {})
        : value_(&value), path_(std::move(codingPath)) {}

    const JSONValue& Value() const { return *value_; }
    const std::vector<std::string>& CodingPath() const { return path_; }
    bool IsNull() const { return detail::IsNull(*value_); }
    bool Contains(const std::string& key) const;

    template <typename T>
    T Decode(const std::string& key) const {
        const JSONValue& member = requireMember(key);
        return DecodeJSON<T>(member, detail::ChildPath(path_, key));
    }

    template <typename T>
    std::optional<T> DecodeIfPresent(const std::string& key) const {
        const JSONValue* member = findMember(key);
        if (member == nullptr || detail::IsNull(*member)) {
            return std::nullopt;
        }
        return DecodeJSON<T>(*member, detail::ChildPath(path_, key));
    }

    template <typename T>
    T DecodeValue() const {
        return DecodeJSON<T>(*value_, path_);
    }

    DecodeError DataCorruptedError(const std::string& description) const;
    DecodeError DataCorruptedError(const std::string& key, const std::string& description) const;

private:
    const JSONValue::Object& requireObject() const;
    const JSONValue& requireMember(const std::string& key) const;
    const JSONValue* findMember(const std::string& key) const;

    const JSONValue* value_;
    std::vector<std::string> path_;
};

//==========================================================================================================
// DecodeJSON<T>
// Purpose: Decodes value into T. Supported: JSONValue, bool, integral and floating types, std::string,
//          std::optional<U>, std::vector<U> and Decodable types. path prefixes every reported coding path.
//==========================================================================================================
template <typename T>
T DecodeJSON(const JSONValue& value, const std::vector<std::string>& path) {
    if constexpr (std::is_same_v<T, JSONValue>) {
        return value;
    } else if constexpr (IsOptional<T>::value) {
        if (detail::IsNull(value)) {
            return T{};
        }
        return T{DecodeJSON<typename T::value_type>(value, path)};
    } else {
        if (detail::IsNull(value)) {
            detail::ThrowValueNotFound(path, TypeName<T>());
        }
        if constexpr (std::is_same_v<T, bool>) {
            if (const auto* b = std::get_if<bool>(&value.value)) {
                return *b;
            }
            detail::ThrowTypeMismatch(path, "bool", value);
        } else if constexpr (std::is_integral_v<T>) {
            int64_t n = 0;
            if (const auto* i = std::get_if<int64_t>(&value.value)) {
                n = *i;
            } else if (const auto* d = std::get_if<double>(&value.value)) {
                if (std::trunc(*d) != *d || *d < -9223372036854775808.0 || *d >= 9223372036854775808.0) {
                    detail::ThrowNumberDoesNotFit(path, value, TypeName<T>());
                }
                n = static_cast<int64_t>(*d);
            } else {
                detail::ThrowTypeMismatch(path, TypeName<T>(), value);
            }
            if (!std::in_range<T>(n)) {
                detail::ThrowNumberDoesNotFit(path, value, TypeName<T>());
            }
            return static_cast<T>(n);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (const auto* i = std::get_if<int64_t>(&value.value)) {
                return static_cast<T>(*i);
            }
            if (const auto* d = std::get_if<double>(&value.value)) {
                return static_cast<T>(*d);
            }
            detail::ThrowTypeMismatch(path, TypeName<T>(), value);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (const auto* s = std::get_if<std::string>(&value.value)) {
                return *s;
            }
            detail::ThrowTypeMismatch(path, "std::string", value);
        } else if constexpr (IsVector<T>::value) {
            const auto* arr = std::get_if<JSONValue::Array>(&value.value);
            if (arr == nullptr) {
                detail::ThrowTypeMismatch(path, "array", value);
            }
            T out;
            out.reserve(arr->size());
            for (std::size_t i = 0; i < arr->size(); ++i) {
                const JSONValue null;
                const JSONValue& element = (*arr)[i] ? *(*arr)[i] : null;
                out.push_back(DecodeJSON<typename T::value_type>(element, detail::ChildPath(path, std::to_string(i))));
            }
            return out;
        } else if constexpr (Decodable<T>) {
            return T::FromJSON(Decoder(value, path));
        } else {
            static_assert(sizeof(T) == 0, "Type is not decodable: provide static T FromJSON(const codec::Decoder&)");
        }
    }
}

// True when bytes form valid UTF-8 (no overlongs, surrogates or code points above U+10FFFF).
bool IsValidUtf8(const std::string& bytes);

} // namespace codec
} // namespace courier
