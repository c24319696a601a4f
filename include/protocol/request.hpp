#pragma once

#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "protocol/file_meta.hpp"

namespace protocol {

// Response tokens. Only some of them carry a trailing newline.
namespace token {
constexpr const char* PONG = "PONG\n";
constexpr const char* ACK_HELLO = "ACK_HELLO\n";
constexpr const char* ACK_DATA = "ACK_DATA\n";
constexpr const char* ACK = "ACK";
constexpr const char* EOF_OK = "EOF_OK";
constexpr const char* ERR_CHECKSUM = "ERR_CHECKSUM\n";
constexpr const char* ERR_INVALID_HEADER = "ERR_INVALID_HEADER\n";
constexpr const char* ERR_INCOMPLETE_HEADER = "ERR_INCOMPLETE_HEADER\n";
constexpr const char* ERR_UNKNOWN_ACTION = "ERR_UNKNOWN_ACTION\n";
} // namespace token

constexpr const char* UNKNOWN_FIELD = "UNKNOWN";
constexpr std::size_t MAX_HEADER_BYTES = 64 * 1024;

struct PingRequest {
    bool plain_text; // legacy "ping" line rather than a JSON object
};

struct HelloRequest {
    std::string serial;
    std::string device_type;
};

struct DataRequest {
    std::string serial;
    nlohmann::json payload;
};

struct SendFileRequest {
    FileInfo file;
    std::string serial;
    bool implicit_action; // legacy header without an "action" key
};

// A known action with missing or malformed fields
struct IncompleteRequest {
    std::string action;
    std::string reason;
};

// Decodable JSON that names no supported action
struct UnknownRequest {
    std::string action;
};

// Header text that is not JSON at all
struct InvalidHeader {
    std::string error;
};

// Visitor built from lambdas, for std::visit over Request
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

using Request = std::variant<PingRequest, HelloRequest, DataRequest, SendFileRequest,
                             IncompleteRequest, UnknownRequest, InvalidHeader>;

// Strips surrounding whitespace, including any CR/LF terminator
std::string normalize_header(const std::string& raw);

// Case-insensitive match of the legacy plain-text ping
bool is_text_ping(const std::string& normalized);

// Never throws on malformed input; every failure becomes a variant alternative.
Request decode_request(const std::string& raw_header);

// Token a request is answered with when it is rejected before dispatch,
// or nullptr if the request is routable.
const char* rejection_token(const Request& request);

const char* request_kind(const Request& request);

} // namespace protocol
