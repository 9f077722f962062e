//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Method registry with lazily built call sites and JSON-RPC request/notification dispatch
//==========================================================================================================

#include "jsonrpc/Dispatcher.h"

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

#include <fmt/format.h>

#include "jsonrpc/errors/Errors.h"
#include "logging/Logger.h"

namespace jsonrpc {

namespace {

//==========================================================================================================
// CallSite
// Purpose: Immutable, resolved binding for one method name.
//==========================================================================================================
struct CallSite {
    std::string name;
    std::vector<ParamDescriptor> params;
    std::size_t resultCount{0};
    MethodDescriptor::Invoker invoker;
};

struct Outcome {
    std::optional<JSONValue> result;
    std::optional<JSONRPCError> error;
};

Outcome failWith(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    Outcome o;
    o.error = JSONRPCError{code, std::move(message), std::move(data)};
    return o;
}

bool kindAccepts(ValueKind want, const JSONValue& v) {
    const ValueKind got = KindOf(v);
    switch (want) {
        case ValueKind::Any:    return true;
        case ValueKind::Number: return got == ValueKind::Number || got == ValueKind::Integer;
        default:                return got == want;
    }
}

std::string serializeOutcome(const JSONRPCId& id, Outcome&& outcome) {
    if (outcome.error.has_value()) {
        auto resp = CreateErrorResponse(id, outcome.error->code, outcome.error->message, outcome.error->data);
        return resp->Serialize();
    }
    JSONRPCResponse resp(id, outcome.result.value_or(JSONValue(nullptr)));
    return resp.Serialize();
}

std::string invalidRequest(const JSONRPCId& id, const std::string& message) {
    return CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, message)->Serialize();
}

} // namespace

class Dispatcher::Impl {
public:
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, MethodDescriptor> descriptors;
    std::unordered_map<std::string, std::shared_ptr<const CallSite>> callSites;

    //==========================================================================================================
    // Returns the call site for name, building it on first use. Double-checked: the shared lock serves the
    // common path; creation re-checks under the exclusive lock so concurrent first callers build it once.
    //==========================================================================================================
    std::shared_ptr<const CallSite> resolve(const std::string& name) {
        {
            std::shared_lock<std::shared_mutex> rlock(mutex);
            auto it = callSites.find(name);
            if (it != callSites.end()) {
                return it->second;
            }
            if (descriptors.find(name) == descriptors.end()) {
                return nullptr;
            }
        }
        std::unique_lock<std::shared_mutex> wlock(mutex);
        auto it = callSites.find(name);
        if (it != callSites.end()) {
            return it->second;
        }
        auto dit = descriptors.find(name);
        if (dit == descriptors.end()) {
            return nullptr;
        }
        auto site = std::make_shared<CallSite>();
        site->name = dit->second.name;
        site->params = dit->second.params;
        site->resultCount = dit->second.outputs.size() - 1;
        site->invoker = dit->second.invoker;
        callSites.emplace(name, site);
        LOG_DEBUG("Dispatcher: call site built for '{}' ({} params, {} results)", name, site->params.size(), site->resultCount);
        return site;
    }

    //==========================================================================================================
    // Binds positional params against the call site and invokes it.
    //==========================================================================================================
    Outcome call(const CallSite& site, const JSONValue* params, const CallContext& ctx) {
        FUNC_SCOPE();
        static const JSONValue kNull;
        const JSONValue::Array empty;
        const JSONValue::Array* arr = &empty;
        if (params != nullptr && !params->IsNull()) {
            if (!params->IsArray()) {
                return failWith(JSONRPCErrorCodes::InvalidParams, "non-array args");
            }
            arr = &std::get<JSONValue::Array>(params->value);
        }

        const std::size_t declared = site.params.size();
        if (arr->size() > declared) {
            return failWith(JSONRPCErrorCodes::InvalidParams,
                            fmt::format("too many arguments, want at most {}", declared));
        }

        std::vector<const JSONValue*> args(declared, nullptr);
        for (std::size_t i = 0; i < declared; ++i) {
            const ParamDescriptor& pd = site.params[i];
            const JSONValue* v = nullptr;
            if (i < arr->size()) {
                v = (*arr)[i] ? (*arr)[i].get() : &kNull;
            }
            const bool absent = (v == nullptr) ||
                                (v->IsNull() && pd.kind != ValueKind::Null && pd.kind != ValueKind::Any);
            if (absent) {
                if (!pd.optional) {
                    return failWith(JSONRPCErrorCodes::InvalidParams,
                                    fmt::format("missing value for required argument {}", i));
                }
                continue;
            }
            if (!kindAccepts(pd.kind, *v)) {
                return failWith(JSONRPCErrorCodes::InvalidParams,
                                fmt::format("invalid argument {}: expected {}, got {}", i,
                                            ValueKindName(pd.kind), ValueKindName(KindOf(*v))));
            }
            args[i] = v;
        }

        HandlerResult hr;
        try {
            hr = site.invoker(ctx, args);
        } catch (const ArgumentError& e) {
            return failWith(JSONRPCErrorCodes::InvalidParams, fmt::format("invalid argument {}: {}", e.Index(), e.what()));
        } catch (const errors::RpcError& e) {
            LOG_WARN("Dispatcher: handler '{}' raised {} error: {}", site.name, errors::errorKindName(e.Kind()), e.what());
            Outcome o;
            o.error = errors::toWireError(e);
            return o;
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatcher: handler '{}' threw: {}", site.name, e.what());
            return failWith(JSONRPCErrorCodes::InternalError, e.what());
        }

        if (!hr.status.IsOk()) {
            return failWith(JSONRPCErrorCodes::ServerError, hr.status.Message(), hr.status.Data());
        }

        Outcome out;
        if (hr.outputs.empty()) {
            out.result = JSONValue(nullptr);
        } else if (hr.outputs.size() == 1) {
            out.result = std::move(hr.outputs.front());
        } else {
            JSONValue::Array list;
            list.reserve(hr.outputs.size());
            for (auto& v : hr.outputs) {
                list.push_back(std::make_shared<JSONValue>(std::move(v)));
            }
            out.result = JSONValue(std::move(list));
        }
        return out;
    }

    std::optional<std::string> handleRequest(const JSONValue& doc, const CallContext& ctx) {
        JSONRPCRequest request;
        if (!request.FromJSON(doc)) {
            JSONRPCId id = nullptr;
            const JSONValue* idv = doc.Find("id");
            if (std::holds_alternative<int64_t>(idv->value)) {
                id = std::get<int64_t>(idv->value);
            } else if (std::holds_alternative<std::string>(idv->value)) {
                id = std::get<std::string>(idv->value);
            }
            LOG_WARN("Dispatcher: invalid request envelope (id={})", IdToString(id));
            return invalidRequest(id, "invalid request");
        }

        auto site = resolve(request.method);
        if (!site) {
            LOG_WARN("Dispatcher: method '{}' not found (id={})", request.method, IdToString(request.id));
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                       fmt::format("method not found: {}", request.method))->Serialize();
        }

        const JSONValue* params = request.params.has_value() ? &request.params.value() : nullptr;
        Outcome outcome = call(*site, params, ctx);
        if (outcome.error.has_value()) {
            LOG_DEBUG("Dispatcher: '{}' (id={}) failed: code={} message={}", request.method,
                      IdToString(request.id), outcome.error->code, outcome.error->message);
        }
        return serializeOutcome(request.id, std::move(outcome));
    }

    void handleNotification(const JSONValue& doc, const CallContext& ctx) {
        JSONRPCNotification notification;
        if (!notification.FromJSON(doc)) {
            LOG_WARN("Dispatcher: dropping frame without id that is not a valid notification");
            return;
        }
        auto site = resolve(notification.method);
        if (!site) {
            LOG_WARN("Dispatcher: notification for unknown method '{}' dropped", notification.method);
            return;
        }
        const JSONValue* params = notification.params.has_value() ? &notification.params.value() : nullptr;
        Outcome outcome = call(*site, params, ctx);
        if (outcome.error.has_value()) {
            LOG_WARN("Dispatcher: notification '{}' failed: code={} message={}", notification.method,
                     outcome.error->code, outcome.error->message);
        }
    }
};

Dispatcher::Dispatcher() : pImpl(std::make_unique<Impl>()) {}

Dispatcher::~Dispatcher() = default;

void Dispatcher::RegisterDescriptor(MethodDescriptor descriptor) {
    FUNC_SCOPE();
    if (descriptor.name.empty()) {
        throw errors::Registration("method name must not be empty");
    }
    if (!descriptor.invoker) {
        throw errors::Registration(fmt::format("method '{}' has no invoker", descriptor.name));
    }
    if (descriptor.outputs.empty() || descriptor.outputs.back() != ValueKind::Error) {
        throw errors::Registration(fmt::format("method '{}': last return value must be an error", descriptor.name));
    }
    if (std::count(descriptor.outputs.begin(), descriptor.outputs.end(), ValueKind::Error) != 1) {
        throw errors::Registration(fmt::format("method '{}': only the last return value may be an error", descriptor.name));
    }
    bool seenOptional = false;
    for (std::size_t i = 0; i < descriptor.params.size(); ++i) {
        const ParamDescriptor& pd = descriptor.params[i];
        if (pd.kind == ValueKind::Error) {
            throw errors::Registration(fmt::format("method '{}': argument {} cannot be an error", descriptor.name, i));
        }
        if (pd.optional) {
            seenOptional = true;
        } else if (seenOptional) {
            throw errors::Registration(fmt::format(
                "method '{}': required argument {} follows an optional one", descriptor.name, i));
        }
    }

    std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
    const std::string name = descriptor.name;
    if (pImpl->descriptors.find(name) != pImpl->descriptors.end()) {
        throw errors::Registration(fmt::format("method '{}' is already registered", name));
    }
    LOG_INFO("Dispatcher: registered method '{}' ({} params)", name, descriptor.params.size());
    pImpl->descriptors.emplace(name, std::move(descriptor));
}

bool Dispatcher::HasMethod(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->descriptors.find(name) != pImpl->descriptors.end();
}

std::vector<std::string> Dispatcher::MethodNames() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    std::vector<std::string> names;
    names.reserve(pImpl->descriptors.size());
    for (const auto& [name, d] : pImpl->descriptors) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t Dispatcher::CallSiteCount() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->callSites.size();
}

std::optional<std::string> Dispatcher::Dispatch(const std::string& frame, const CallContext& ctx) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(frame);
    } catch (const std::exception& e) {
        LOG_WARN("Dispatcher: parse error: {}", e.what());
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "parse error")->Serialize();
    }

    if (doc.IsArray()) {
        LOG_WARN("Dispatcher: batch requests are not supported");
        return invalidRequest(nullptr, "batch requests are not supported");
    }
    if (!doc.IsObject()) {
        LOG_WARN("Dispatcher: frame is not a JSON object");
        return invalidRequest(nullptr, "invalid request");
    }

    if (doc.Find("id") == nullptr) {
        pImpl->handleNotification(doc, ctx);
        return std::nullopt;
    }
    if (doc.Find("method") == nullptr && (doc.Find("result") != nullptr || doc.Find("error") != nullptr)) {
        LOG_WARN("Dispatcher: dropping response frame received on the server side");
        return std::nullopt;
    }
    return pImpl->handleRequest(doc, ctx);
}

} // namespace jsonrpc
