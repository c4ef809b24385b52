#pragma once

// Record keys and the on-backend record encoding.
//
// A record is one format byte followed by the payload:
//   0x00  payload is the record's compact JSON text
//   0x01  payload is that text, raw-DEFLATE compressed
//
// Internal header, not installed.

#include <jsonverse-cpp/backend.hpp>
#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/json.hpp>
#include <jsonverse-cpp/types.hpp>
#include "compression.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace jsonverse_cpp::storage {

enum class RecordFormat : std::uint8_t {
    json = 0x00,
    deflate_json = 0x01,
};

inline auto document_key(const DocumentId& id) -> std::string {
    return "doc/" + id.value;
}

inline constexpr std::string_view document_prefix = "doc/";

inline auto version_prefix(const DocumentId& doc) -> std::string {
    return "ver/" + doc.value + "/";
}

inline auto version_key(const DocumentId& doc, const VersionId& id) -> std::string {
    return version_prefix(doc) + id.value;
}

// Ids are embedded in keys unescaped, so they must be a single segment.
inline auto is_key_segment(std::string_view id) -> bool {
    return !id.empty() && id.find('/') == std::string_view::npos;
}

inline void require_key_segment(std::string_view id, std::string_view what) {
    if (!is_key_segment(id)) {
        throw Exception{ErrorKind::storage_error,
                        "generated " + std::string{what} + " id \"" + std::string{id} +
                            "\" is not a valid key segment"};
    }
}

// True if `key` names a record directly under `prefix`, not a nested one.
inline auto is_direct_child(std::string_view key, std::string_view prefix) -> bool {
    return key.starts_with(prefix) && is_key_segment(key.substr(prefix.size()));
}

// Serialize a record. Text at or above `threshold` bytes is deflated,
// unless that fails or does not shrink it.
// Throws Exception(invalid_content) for strings that are not valid UTF-8.
template <typename Record>
auto encode_record(const Record& record, std::size_t threshold) -> Bytes {
    auto text = std::string{};
    try {
        text = Json(record).dump(-1);
    } catch (const Json::type_error& e) {
        throw Exception{ErrorKind::invalid_content, e.what()};
    }
    const auto raw = std::span{reinterpret_cast<const std::byte*>(text.data()), text.size()};

    if (text.size() >= threshold) {
        if (auto packed = deflate_bytes(raw); packed && packed->size() < raw.size()) {
            auto out = Bytes{};
            out.reserve(packed->size() + 1);
            out.push_back(static_cast<std::byte>(RecordFormat::deflate_json));
            out.insert(out.end(), packed->begin(), packed->end());
            return out;
        }
    }

    auto out = Bytes{};
    out.reserve(raw.size() + 1);
    out.push_back(static_cast<std::byte>(RecordFormat::json));
    out.insert(out.end(), raw.begin(), raw.end());
    return out;
}

// Parse a record written by encode_record.
// Throws Exception(storage_error) on any damage.
template <typename Record>
auto decode_record(std::span<const std::byte> bytes, std::string_view key) -> Record {
    auto fail = [&](std::string_view what) -> Exception {
        return Exception{ErrorKind::storage_error,
                         std::string{what} + " in record \"" + std::string{key} + "\""};
    };

    if (bytes.empty()) throw fail("empty payload");
    const auto format = static_cast<RecordFormat>(bytes.front());
    const auto payload = bytes.subspan(1);

    auto text = std::string{};
    switch (format) {
        case RecordFormat::json:
            text.assign(reinterpret_cast<const char*>(payload.data()), payload.size());
            break;
        case RecordFormat::deflate_json: {
            auto inflated = inflate_bytes(payload);
            if (!inflated) throw fail("corrupt compressed payload");
            text.assign(reinterpret_cast<const char*>(inflated->data()), inflated->size());
            break;
        }
        default:
            throw fail("unknown record format");
    }

    try {
        return Json::parse(text).get<Record>();
    } catch (const Json::exception& e) {
        throw fail(e.what());
    } catch (const Exception& e) {
        throw fail(e.what());
    }
}

}  // namespace jsonverse_cpp::storage
