#pragma once

#include <devscope/mcp/error_handling.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devscope::mcp {

enum class EnvelopeKind { Request, Notification, Response, ErrorResponse };

const char* envelopeKindName(EnvelopeKind kind) noexcept;

struct RpcError {
    int code = protocol::SERVER_ERROR;
    std::string message;
    json data; // null when absent

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message && data == other.data;
    }
};

/**
 * A decoded JSON-RPC 2.0 message. Exactly one of params (inbound), result or error (outbound)
 * carries the body; `id` is null for notifications and otherwise an integer or a string.
 */
struct Envelope {
    EnvelopeKind kind = EnvelopeKind::Notification;
    json id;
    std::string method;
    json params; // null when the message carries none
    json result;
    std::optional<RpcError> error;

    static Envelope request(json id, std::string method, json params = nullptr);
    static Envelope notification(std::string method, json params = nullptr);
    static Envelope response(json id, json result);
    static Envelope errorResponse(json id, int code, std::string message);

    bool isRequest() const noexcept { return kind == EnvelopeKind::Request; }
    bool isNotification() const noexcept { return kind == EnvelopeKind::Notification; }
    bool expectsResponse() const noexcept { return kind == EnvelopeKind::Request; }

    bool operator==(const Envelope& other) const;
};

// Outcome of decoding one JSON value: an envelope, or the error response to send instead
// (`rejection` stays null when nothing may be sent, e.g. a malformed notification).
struct Decoded {
    std::optional<Envelope> envelope;
    json rejection;
};

class EnvelopeCodec {
public:
    // Raw bytes to JSON; failure carries the parser's description.
    static JsonParseResult parse(std::string_view raw);

    static Decoded decode(const json& message);

    // Splits a batch into its members; a single message yields one entry.
    static std::vector<Decoded> decodeAll(const json& value);

    static json encode(const Envelope& envelope);
    static std::string serialize(const Envelope& envelope) { return encode(envelope).dump(); }

    // Stable key for an id, usable in maps (strings as-is, numbers as their JSON text)
    static std::string idKey(const json& id);

    static json makeResponse(const json& id, json result);
    static json makeError(const json& id, int code, std::string_view message);
    static json makeParseError(std::string_view detail);
};

} // namespace devscope::mcp
