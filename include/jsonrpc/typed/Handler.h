//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Handler.h
// Purpose: Derives MethodDescriptor values from typed C++ handlers at compile time
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "jsonrpc/MethodDescriptor.h"
#include "jsonrpc/typed/Convert.h"

namespace jsonrpc {
namespace typed {

namespace detail {

//------------------------------ Signature introspection ------------------------------
template <typename F>
struct CallableTraits : CallableTraits<decltype(&F::operator())> {};

template <typename R, typename... A>
struct CallableTraits<R (*)(A...)> {
    using Return = R;
    using Args = std::tuple<A...>;
};

template <typename R, typename C, typename... A>
struct CallableTraits<R (C::*)(A...)> {
    using Return = R;
    using Args = std::tuple<A...>;
};

template <typename R, typename C, typename... A>
struct CallableTraits<R (C::*)(A...) const> {
    using Return = R;
    using Args = std::tuple<A...>;
};

template <typename R, typename... A>
struct CallableTraits<R (*)(A...) noexcept> : CallableTraits<R (*)(A...)> {};
template <typename R, typename C, typename... A>
struct CallableTraits<R (C::*)(A...) noexcept> : CallableTraits<R (C::*)(A...)> {};
template <typename R, typename C, typename... A>
struct CallableTraits<R (C::*)(A...) const noexcept> : CallableTraits<R (C::*)(A...) const> {};

// Splits an optional leading `const CallContext&` off the argument list.
template <typename Args>
struct SplitContext {
    static constexpr bool takesContext = false;
    using Params = Args;
};

template <typename... Rest>
struct SplitContext<std::tuple<const CallContext&, Rest...>> {
    static constexpr bool takesContext = true;
    using Params = std::tuple<Rest...>;
};

//------------------------------ Error-shaped returns ------------------------------
template <typename... T>
struct LastIsStatus : std::false_type {};
template <typename T>
struct LastIsStatus<T> : std::is_same<T, Status> {};
template <typename T, typename U, typename... Rest>
struct LastIsStatus<T, U, Rest...> : LastIsStatus<U, Rest...> {};

template <typename R>
struct ReturnShape {
    static constexpr bool errorShaped = false;
};

template <>
struct ReturnShape<Status> {
    static constexpr bool errorShaped = true;
    static std::vector<ValueKind> Outputs() { return {ValueKind::Error}; }
    static HandlerResult Collect(Status&& s) { return HandlerResult{std::move(s), {}}; }
};

template <typename... T>
struct ReturnShape<std::tuple<T...>> {
    static constexpr bool errorShaped = LastIsStatus<T...>::value;
    static constexpr std::size_t valueCount = sizeof...(T) - 1;

    static std::vector<ValueKind> Outputs() {
        return outputs(std::make_index_sequence<valueCount>{});
    }

    static HandlerResult Collect(std::tuple<T...>&& r) {
        HandlerResult out;
        out.status = std::move(std::get<valueCount>(r));
        if (out.status.IsOk()) {
            encode(r, out.outputs, std::make_index_sequence<valueCount>{});
        }
        return out;
    }

private:
    using Types = std::tuple<T...>;

    template <std::size_t... I>
    static std::vector<ValueKind> outputs(std::index_sequence<I...>) {
        return {Codec<std::decay_t<std::tuple_element_t<I, Types>>>::kind..., ValueKind::Error};
    }

    template <std::size_t... I>
    static void encode(const Types& r, std::vector<JSONValue>& out, std::index_sequence<I...>) {
        (out.push_back(ToJSON(std::get<I>(r))), ...);
    }
};

//------------------------------ Argument binding ------------------------------
template <typename T>
T decodeArg(const std::vector<const JSONValue*>& args, std::size_t index) {
    const JSONValue* v = args[index];
    if (v == nullptr) {
        if constexpr (Codec<T>::optional) {
            return T{};
        } else {
            throw ArgumentError(index, "missing value");
        }
    }
    try {
        return Codec<T>::Decode(*v);
    } catch (const errors::RpcError& e) {
        throw ArgumentError(index, e.what());
    }
}

template <typename Params>
struct ParamList;

template <typename... P>
struct ParamList<std::tuple<P...>> {
    using Decoded = std::tuple<std::decay_t<P>...>;

    static std::vector<ParamDescriptor> Describe() {
        return {ParamDescriptor{Codec<std::decay_t<P>>::kind, Codec<std::decay_t<P>>::optional}...};
    }

    static Decoded Bind(const std::vector<const JSONValue*>& args) {
        return bind(args, std::index_sequence_for<P...>{});
    }

private:
    template <std::size_t... I>
    static Decoded bind(const std::vector<const JSONValue*>& args, std::index_sequence<I...>) {
        // Braced init evaluates left to right, so the first bad element is the one reported
        return Decoded{decodeArg<std::decay_t<P>>(args, I)...};
    }
};

template <typename Traits>
struct HandlerSignature {
    using Return = std::decay_t<typename Traits::Return>;
    using Split = SplitContext<typename Traits::Args>;
    using Params = ParamList<typename Split::Params>;

    static_assert(ReturnShape<Return>::errorShaped,
                  "RPC handlers must return jsonrpc::Status or std::tuple<T..., jsonrpc::Status>");
};

// Calls fn with (ctx?, decoded params...) and collects the result.
template <typename Sig, typename Call>
HandlerResult invoke(Call&& call, const CallContext& ctx, const std::vector<const JSONValue*>& args) {
    auto bound = Sig::Params::Bind(args);
    if constexpr (Sig::Split::takesContext) {
        return ReturnShape<typename Sig::Return>::Collect(
            std::apply([&](auto&... p) { return call(ctx, p...); }, bound));
    } else {
        return ReturnShape<typename Sig::Return>::Collect(
            std::apply([&](auto&... p) { return call(p...); }, bound));
    }
}

} // namespace detail

//==========================================================================================================
// MakeDescriptor
// Purpose: Builds a descriptor for a callable (lambda, functor or free function).
// Args:
//   name: RPC method name.
//   fn:   handler; parameters are `[const CallContext&,] P...`, return is Status or tuple<T..., Status>.
// Returns:
//   MethodDescriptor whose invoker owns a copy of fn.
// Notes:
//   Handlers whose last return value is not a Status fail to compile.
//==========================================================================================================
template <typename Fn>
MethodDescriptor MakeDescriptor(std::string name, Fn fn) {
    using Sig = detail::HandlerSignature<detail::CallableTraits<std::decay_t<Fn>>>;
    MethodDescriptor d;
    d.name = std::move(name);
    d.params = Sig::Params::Describe();
    d.outputs = detail::ReturnShape<typename Sig::Return>::Outputs();
    d.invoker = [fn = std::move(fn)](const CallContext& ctx, const std::vector<const JSONValue*>& args) mutable {
        return detail::invoke<Sig>(fn, ctx, args);
    };
    return d;
}

//==========================================================================================================
// MakeDescriptor (bound receiver)
// Purpose: Builds a descriptor for a member function bound to a receiver object.
// Args:
//   name:     RPC method name.
//   receiver: object the method is called on; shared ownership keeps it alive while registered.
//   method:   pointer to member function.
//==========================================================================================================
template <typename C, typename M>
MethodDescriptor MakeDescriptor(std::string name, std::shared_ptr<C> receiver, M method) {
    static_assert(std::is_member_function_pointer_v<M>, "method must be a pointer to member function");
    using Sig = detail::HandlerSignature<detail::CallableTraits<M>>;
    MethodDescriptor d;
    d.name = std::move(name);
    d.params = Sig::Params::Describe();
    d.outputs = detail::ReturnShape<typename Sig::Return>::Outputs();
    d.invoker = [receiver = std::move(receiver), method](const CallContext& ctx,
                                                          const std::vector<const JSONValue*>& args) {
        auto call = [&](auto&... p) { return std::invoke(method, *receiver, p...); };
        return detail::invoke<Sig>(call, ctx, args);
    };
    return d;
}

} // namespace typed
} // namespace jsonrpc
