//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Convert.h
// Purpose: Header-only conversions between C++ values and JSONValue used for params, results and Join
//==========================================================================================================

#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "jsonrpc/JSONRPCTypes.h"
#include "jsonrpc/errors/Errors.h"

namespace jsonrpc {
namespace typed {

//==========================================================================================================
// Codec<T>
// Purpose: Describes how a C++ type maps onto JSON.
// Members:
//   kind:     ValueKind advertised in handler descriptors.
//   optional: true when an absent or null JSON value is a legal input (std::optional<T>).
//   Encode(v): C++ -> JSONValue.
//   Decode(j): JSONValue -> C++; throws errors::RpcError of kind Decode on mismatch.
// Notes:
//   Applications add their own types by specializing Codec in namespace jsonrpc::typed.
//==========================================================================================================
template <typename T, typename Enable = void>
struct Codec;

namespace detail {
inline errors::RpcError mismatch(ValueKind want, const JSONValue& got) {
    return errors::Decode(fmt::format("expected {}, got {}", ValueKindName(want), ValueKindName(KindOf(got))));
}
} // namespace detail

template <>
struct Codec<JSONValue> {
    static constexpr ValueKind kind = ValueKind::Any;
    static constexpr bool optional = false;
    static JSONValue Encode(const JSONValue& v) { return v; }
    static JSONValue Decode(const JSONValue& j) { return j; }
};

template <>
struct Codec<std::nullptr_t> {
    static constexpr ValueKind kind = ValueKind::Null;
    static constexpr bool optional = false;
    static JSONValue Encode(std::nullptr_t) { return JSONValue(nullptr); }
    static std::nullptr_t Decode(const JSONValue& j) {
        if (!j.IsNull()) throw detail::mismatch(kind, j);
        return nullptr;
    }
};

template <>
struct Codec<bool> {
    static constexpr ValueKind kind = ValueKind::Bool;
    static constexpr bool optional = false;
    static JSONValue Encode(bool v) { return JSONValue(v); }
    static bool Decode(const JSONValue& j) {
        if (!std::holds_alternative<bool>(j.value)) throw detail::mismatch(kind, j);
        return std::get<bool>(j.value);
    }
};

// Integral types other than bool; values outside the target range (or, when encoding, outside int64) are rejected.
template <typename T>
struct Codec<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static constexpr ValueKind kind = ValueKind::Integer;
    static constexpr bool optional = false;
    static JSONValue Encode(T v) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
            if (v > static_cast<T>(std::numeric_limits<int64_t>::max())) {
                throw errors::Decode(fmt::format("integer {} out of range", v));
            }
        }
        return JSONValue(static_cast<int64_t>(v));
    }
    static T Decode(const JSONValue& j) {
        if (!std::holds_alternative<int64_t>(j.value)) throw detail::mismatch(kind, j);
        const int64_t v = std::get<int64_t>(j.value);
        if constexpr (std::is_unsigned_v<T>) {
            if (v < 0 || static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                throw errors::Decode(fmt::format("integer {} out of range", v));
            }
        } else {
            if (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                v > static_cast<int64_t>(std::numeric_limits<T>::max())) {
                throw errors::Decode(fmt::format("integer {} out of range", v));
            }
        }
        return static_cast<T>(v);
    }
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static constexpr ValueKind kind = ValueKind::Number;
    static constexpr bool optional = false;
    static JSONValue Encode(T v) { return JSONValue(static_cast<double>(v)); }
    static T Decode(const JSONValue& j) {
        if (std::holds_alternative<double>(j.value)) return static_cast<T>(std::get<double>(j.value));
        if (std::holds_alternative<int64_t>(j.value)) return static_cast<T>(std::get<int64_t>(j.value));
        throw detail::mismatch(kind, j);
    }
};

template <>
struct Codec<std::string> {
    static constexpr ValueKind kind = ValueKind::String;
    static constexpr bool optional = false;
    static JSONValue Encode(const std::string& v) { return JSONValue(v); }
    static std::string Decode(const JSONValue& j) {
        if (!std::holds_alternative<std::string>(j.value)) throw detail::mismatch(kind, j);
        return std::get<std::string>(j.value);
    }
};

// Encode-only: string literals passed as call arguments.
template <>
struct Codec<const char*> {
    static constexpr ValueKind kind = ValueKind::String;
    static constexpr bool optional = false;
    static JSONValue Encode(const char* v) { return JSONValue(v); }
};

template <>
struct Codec<char*> {
    static constexpr ValueKind kind = ValueKind::String;
    static constexpr bool optional = false;
    static JSONValue Encode(const char* v) { return JSONValue(v); }
};

template <typename T>
struct Codec<std::optional<T>> {
    static constexpr ValueKind kind = Codec<T>::kind;
    static constexpr bool optional = true;
    static JSONValue Encode(const std::optional<T>& v) {
        return v.has_value() ? Codec<T>::Encode(*v) : JSONValue(nullptr);
    }
    static std::optional<T> Decode(const JSONValue& j) {
        if (j.IsNull()) return std::nullopt;
        return Codec<T>::Decode(j);
    }
};

template <typename T>
struct Codec<std::vector<T>> {
    static constexpr ValueKind kind = ValueKind::Array;
    static constexpr bool optional = false;
    static JSONValue Encode(const std::vector<T>& v) {
        JSONValue::Array arr;
        arr.reserve(v.size());
        for (const auto& item : v) {
            arr.push_back(std::make_shared<JSONValue>(Codec<T>::Encode(item)));
        }
        return JSONValue(std::move(arr));
    }
    static std::vector<T> Decode(const JSONValue& j) {
        if (!j.IsArray()) throw detail::mismatch(kind, j);
        const auto& arr = std::get<JSONValue::Array>(j.value);
        std::vector<T> out;
        out.reserve(arr.size());
        for (std::size_t i = 0; i < arr.size(); ++i) {
            try {
                out.push_back(Codec<T>::Decode(arr[i] ? *arr[i] : JSONValue(nullptr)));
            } catch (const errors::RpcError& e) {
                throw errors::Decode(fmt::format("element {}: {}", i, e.what()));
            }
        }
        return out;
    }
};

template <typename T>
struct Codec<std::map<std::string, T>> {
    static constexpr ValueKind kind = ValueKind::Object;
    static constexpr bool optional = false;
    static JSONValue Encode(const std::map<std::string, T>& v) {
        JSONValue::Object obj;
        for (const auto& [key, item] : v) {
            obj[key] = std::make_shared<JSONValue>(Codec<T>::Encode(item));
        }
        return JSONValue(std::move(obj));
    }
    static std::map<std::string, T> Decode(const JSONValue& j) {
        if (!j.IsObject()) throw detail::mismatch(kind, j);
        std::map<std::string, T> out;
        for (const auto& [key, item] : std::get<JSONValue::Object>(j.value)) {
            try {
                out.emplace(key, Codec<T>::Decode(item ? *item : JSONValue(nullptr)));
            } catch (const errors::RpcError& e) {
                throw errors::Decode(fmt::format("member '{}': {}", key, e.what()));
            }
        }
        return out;
    }
};

// Fixed-size heterogeneous arrays; this is also how multi-value results read back.
template <typename... T>
struct Codec<std::tuple<T...>> {
    static constexpr ValueKind kind = ValueKind::Array;
    static constexpr bool optional = false;

    static JSONValue Encode(const std::tuple<T...>& v) {
        return encodeAll(v, std::index_sequence_for<T...>{});
    }
    static std::tuple<T...> Decode(const JSONValue& j) {
        if (!j.IsArray()) throw detail::mismatch(kind, j);
        const auto& arr = std::get<JSONValue::Array>(j.value);
        if (arr.size() != sizeof...(T)) {
            throw errors::Decode(fmt::format("expected {} elements, got {}", sizeof...(T), arr.size()));
        }
        return decodeAll(arr, std::index_sequence_for<T...>{});
    }

private:
    template <std::size_t... I>
    static JSONValue encodeAll(const std::tuple<T...>& v, std::index_sequence<I...>) {
        JSONValue::Array arr;
        (arr.push_back(std::make_shared<JSONValue>(Codec<T>::Encode(std::get<I>(v)))), ...);
        return JSONValue(std::move(arr));
    }
    template <std::size_t I, typename E>
    static E decodeAt(const JSONValue::Array& arr) {
        try {
            return Codec<E>::Decode(arr[I] ? *arr[I] : JSONValue(nullptr));
        } catch (const errors::RpcError& e) {
            throw errors::Decode(fmt::format("element {}: {}", I, e.what()));
        }
    }
    template <std::size_t... I>
    static std::tuple<T...> decodeAll(const JSONValue::Array& arr, std::index_sequence<I...>) {
        return std::tuple<T...>{decodeAt<I, T>(arr)...};
    }
};

//==========================================================================================================
// ToJSON / FromJSON
// Purpose: Free-function entry points over Codec<T>.
//==========================================================================================================
template <typename T>
JSONValue ToJSON(const T& v) {
    return Codec<std::decay_t<T>>::Encode(v);
}

template <typename T>
T FromJSON(const JSONValue& j) {
    return Codec<T>::Decode(j);
}

// Builds a positional params array from call arguments.
template <typename... Args>
JSONValue MakeParams(const Args&... args) {
    JSONValue::Array arr;
    arr.reserve(sizeof...(Args));
    (arr.push_back(std::make_shared<JSONValue>(ToJSON(args))), ...);
    return JSONValue(std::move(arr));
}

} // namespace typed
} // namespace jsonrpc
