#include "protocol/request.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <optional>

namespace protocol {

namespace {

// Missing or null -> fallback. Non-string scalars are accepted in their JSON spelling.
std::string string_or(const nlohmann::json& header, const char* key, const std::string& fallback) {
    auto it = header.find(key);
    if (it == header.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::optional<uint64_t> parse_size(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        // Signed representation only survives for negatives
        int64_t v = value.get<int64_t>();
        if (v < 0) return std::nullopt;
        return static_cast<uint64_t>(v);
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (d < 0 || std::floor(d) != d || d > static_cast<double>(std::numeric_limits<uint64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(d);
    }
    if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        if (s.empty() || s.size() > 20 ||
            !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        try {
            return static_cast<uint64_t>(std::stoull(s));
        } catch (std::out_of_range&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

Request decode_file_request(const nlohmann::json& header, bool implicit_action) {
    const char* action = "send_file";
    for (const char* key : {"filename", "size", "checksum"}) {
        if (!header.contains(key)) {
            return IncompleteRequest{action, std::string("missing '") + key + "'"};
        }
    }

    const auto& filename = header["filename"];
    if (!filename.is_string() || filename.get_ref<const std::string&>().empty()) {
        return IncompleteRequest{action, "'filename' must be a non-empty string"};
    }
    auto size = parse_size(header["size"]);
    if (!size) {
        return IncompleteRequest{action, "'size' must be a non-negative integer"};
    }
    const auto& checksum = header["checksum"];
    if (!checksum.is_string() || checksum.get_ref<const std::string&>().empty()) {
        return IncompleteRequest{action, "'checksum' must be a hex digest string"};
    }

    SendFileRequest request;
    request.file.filename = filename.get<std::string>();
    request.file.size = *size;
    request.file.checksum = checksum.get<std::string>();
    request.serial = string_or(header, "serial", UNKNOWN_FIELD);
    request.implicit_action = implicit_action;
    return request;
}

} // namespace

std::string normalize_header(const std::string& raw) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(raw.begin(), raw.end(), is_space);
    auto end = std::find_if_not(raw.rbegin(), raw.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

bool is_text_ping(const std::string& normalized) {
    if (normalized.size() != 4) {
        return false;
    }
    std::string lower(normalized);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "ping";
}

Request decode_request(const std::string& raw_header) {
    std::string text = normalize_header(raw_header);
    if (is_text_ping(text)) {
        return PingRequest{true};
    }

    nlohmann::json header;
    try {
        header = nlohmann::json::parse(text);
    } catch (nlohmann::json::parse_error& e) {
        return InvalidHeader{e.what()};
    }

    if (!header.is_object()) {
        return UnknownRequest{""};
    }

    auto action_it = header.find("action");
    if (action_it == header.end()) {
        // Legacy uploaders omit the action but always send all three file fields
        if (header.contains("filename") && header.contains("size") && header.contains("checksum")) {
            return decode_file_request(header, true);
        }
        return UnknownRequest{""};
    }

    // An explicit action always wins over the implicit file shape
    if (!action_it->is_string()) {
        return UnknownRequest{action_it->dump()};
    }
    const std::string action = action_it->get<std::string>();

    if (action == "ping") {
        return PingRequest{false};
    }
    if (action == "hello") {
        return HelloRequest{string_or(header, "serial", UNKNOWN_FIELD),
                            string_or(header, "device_type", UNKNOWN_FIELD)};
    }
    if (action == "data") {
        if (!header.contains("payload")) {
            return IncompleteRequest{action, "missing 'payload'"};
        }
        return DataRequest{string_or(header, "serial", UNKNOWN_FIELD), header["payload"]};
    }
    if (action == "send_file") {
        return decode_file_request(header, false);
    }
    return UnknownRequest{action};
}

const char* rejection_token(const Request& request) {
    return std::visit(overloaded{
        [](const IncompleteRequest&) -> const char* { return token::ERR_INCOMPLETE_HEADER; },
        [](const UnknownRequest&) -> const char* { return token::ERR_UNKNOWN_ACTION; },
        [](const InvalidHeader&) -> const char* { return token::ERR_INVALID_HEADER; },
        [](const auto&) -> const char* { return nullptr; }
    }, request);
}

const char* request_kind(const Request& request) {
    return std::visit(overloaded{
        [](const PingRequest&) { return "ping"; },
        [](const HelloRequest&) { return "hello"; },
        [](const DataRequest&) { return "data"; },
        [](const SendFileRequest&) { return "send_file"; },
        [](const IncompleteRequest&) { return "incomplete"; },
        [](const UnknownRequest&) { return "unknown"; },
        [](const InvalidHeader&) { return "invalid"; }
    }, request);
}

} // namespace protocol
