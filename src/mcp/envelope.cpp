#include <devscope/mcp/envelope.h>

#include <spdlog/spdlog.h>

namespace devscope::mcp {

namespace {

bool isValidId(const json& id) {
    return id.is_number_integer() || id.is_string();
}

Decoded reject(const json& id, int code, std::string_view message) {
    Decoded d;
    d.rejection = EnvelopeCodec::makeError(id, code, message);
    return d;
}

} // namespace

const char* envelopeKindName(EnvelopeKind kind) noexcept {
    switch (kind) {
        case EnvelopeKind::Request:
            return "request";
        case EnvelopeKind::Notification:
            return "notification";
        case EnvelopeKind::Response:
            return "response";
        case EnvelopeKind::ErrorResponse:
            return "error";
    }
    return "unknown";
}

Envelope Envelope::request(json id, std::string method, json params) {
    Envelope e;
    e.kind = EnvelopeKind::Request;
    e.id = std::move(id);
    e.method = std::move(method);
    e.params = std::move(params);
    return e;
}

Envelope Envelope::notification(std::string method, json params) {
    Envelope e;
    e.kind = EnvelopeKind::Notification;
    e.method = std::move(method);
    e.params = std::move(params);
    return e;
}

Envelope Envelope::response(json id, json result) {
    Envelope e;
    e.kind = EnvelopeKind::Response;
    e.id = std::move(id);
    e.result = std::move(result);
    return e;
}

Envelope Envelope::errorResponse(json id, int code, std::string message) {
    Envelope e;
    e.kind = EnvelopeKind::ErrorResponse;
    e.id = std::move(id);
    e.error = RpcError{code, std::move(message), nullptr};
    return e;
}

bool Envelope::operator==(const Envelope& other) const {
    return kind == other.kind && id == other.id && method == other.method &&
           params == other.params && result == other.result && error == other.error;
}

JsonParseResult EnvelopeCodec::parse(std::string_view raw) {
    return json_utils::parse_json(raw);
}

Decoded EnvelopeCodec::decode(const json& message) {
    if (!message.is_object()) {
        return reject(nullptr, protocol::INVALID_REQUEST, "Invalid Request: expected an object");
    }

    const bool hasId = message.contains("id");
    json id = hasId ? message["id"] : json(nullptr);
    if (hasId && !isValidId(id)) {
        return reject(nullptr, protocol::INVALID_REQUEST,
                      "Invalid Request: id must be an integer or a string");
    }

    auto version = message.find("jsonrpc");
    const bool versionOk = version != message.end() && version->is_string() &&
                           version->get<std::string>() == protocol::JSONRPC_VERSION;

    auto method = message.find("method");
    if (method == message.end()) {
        // Inbound responses: accepted structurally, never answered
        if (versionOk && hasId && message.contains("result")) {
            Decoded d;
            d.envelope = Envelope::response(id, message["result"]);
            return d;
        }
        if (versionOk && message.contains("error") && message["error"].is_object()) {
            const auto& err = message["error"];
            Envelope e;
            e.kind = EnvelopeKind::ErrorResponse;
            e.id = id;
            e.error = RpcError{err.value("code", protocol::SERVER_ERROR),
                               err.value("message", std::string{}),
                               err.contains("data") ? err["data"] : json(nullptr)};
            Decoded d;
            d.envelope = std::move(e);
            return d;
        }
        return reject(id, protocol::INVALID_REQUEST, "Invalid Request: missing method");
    }

    if (!versionOk) {
        if (!hasId) {
            spdlog::debug("EnvelopeCodec: dropping notification with bad jsonrpc version");
            return {};
        }
        return reject(id, protocol::INVALID_REQUEST,
                      "Invalid Request: jsonrpc must be \"2.0\"");
    }
    if (!method->is_string()) {
        if (!hasId) {
            return {};
        }
        return reject(id, protocol::INVALID_REQUEST, "Invalid Request: method must be a string");
    }

    json params = nullptr;
    if (auto p = message.find("params"); p != message.end() && !p->is_null()) {
        if (!p->is_object() && !p->is_array()) {
            if (!hasId) {
                return {};
            }
            return reject(id, protocol::INVALID_REQUEST,
                          "Invalid Request: params must be an object or an array");
        }
        params = *p;
    }

    Decoded d;
    d.envelope = hasId ? Envelope::request(id, method->get<std::string>(), std::move(params))
                       : Envelope::notification(method->get<std::string>(), std::move(params));
    return d;
}

std::vector<Decoded> EnvelopeCodec::decodeAll(const json& value) {
    std::vector<Decoded> out;
    if (!value.is_array()) {
        out.push_back(decode(value));
        return out;
    }
    if (value.empty()) {
        out.push_back(
            reject(nullptr, protocol::INVALID_REQUEST, "Invalid Request: empty batch"));
        return out;
    }
    out.reserve(value.size());
    for (const auto& entry : value) {
        out.push_back(decode(entry));
    }
    return out;
}

json EnvelopeCodec::encode(const Envelope& envelope) {
    json out;
    out["jsonrpc"] = protocol::JSONRPC_VERSION;
    switch (envelope.kind) {
        case EnvelopeKind::Request:
            out["id"] = envelope.id;
            out["method"] = envelope.method;
            if (!envelope.params.is_null()) {
                out["params"] = envelope.params;
            }
            break;
        case EnvelopeKind::Notification:
            out["method"] = envelope.method;
            if (!envelope.params.is_null()) {
                out["params"] = envelope.params;
            }
            break;
        case EnvelopeKind::Response:
            out["id"] = envelope.id;
            out["result"] = envelope.result;
            break;
        case EnvelopeKind::ErrorResponse: {
            out["id"] = envelope.id;
            json err{{"code", protocol::SERVER_ERROR}, {"message", ""}};
            if (envelope.error) {
                err["code"] = envelope.error->code;
                err["message"] = envelope.error->message;
                if (!envelope.error->data.is_null()) {
                    err["data"] = envelope.error->data;
                }
            }
            out["error"] = std::move(err);
            break;
        }
    }
    return out;
}

std::string EnvelopeCodec::idKey(const json& id) {
    return id.dump();
}

json EnvelopeCodec::makeResponse(const json& id, json result) {
    return json{{"jsonrpc", protocol::JSONRPC_VERSION}, {"id", id}, {"result", std::move(result)}};
}

json EnvelopeCodec::makeError(const json& id, int code, std::string_view message) {
    return json{{"jsonrpc", protocol::JSONRPC_VERSION},
                {"id", id},
                {"error", {{"code", code}, {"message", std::string(message)}}}};
}

json EnvelopeCodec::makeParseError(std::string_view detail) {
    return makeError(nullptr, protocol::PARSE_ERROR, "Parse error: " + std::string(detail));
}

} // namespace devscope::mcp
