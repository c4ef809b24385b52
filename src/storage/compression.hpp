#pragma once

// Raw DEFLATE for persisted records.
//
// Records at or above the configured threshold are stored deflated
// (no zlib/gzip header). Failure to compress is not an error: callers
// fall back to storing the record as-is.
//
// Internal header, not installed.

#include <jsonverse-cpp/backend.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>

#include <zlib.h>

namespace jsonverse_cpp::storage {

// Upper bound for an inflated record.
inline constexpr std::size_t max_record_size = std::size_t{256} * 1024 * 1024;

// Compress using raw DEFLATE. Returns nullopt if zlib refuses.
inline auto deflate_bytes(std::span<const std::byte> input) -> std::optional<Bytes> {
    if (input.empty()) return Bytes{};

    auto stream = z_stream{};
    // windowBits = -15 selects raw deflate
    if (::deflateInit2(&stream, Z_BEST_SPEED, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    auto output = Bytes(::deflateBound(&stream, static_cast<uLong>(input.size())));
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    const auto ret = ::deflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(produced);
    return output;
}

// Inflate raw DEFLATE data. Returns nullopt on corrupt input or when the
// output would exceed max_output.
inline auto inflate_bytes(std::span<const std::byte> input,
                          std::size_t max_output = max_record_size)
    -> std::optional<Bytes> {
    if (input.empty()) return Bytes{};

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    if (::inflateInit2(&stream, -15) != Z_OK) return std::nullopt;

    auto output = Bytes(std::min(input.size() * 4, max_output));
    auto ret = Z_OK;
    while (true) {
        const auto written = static_cast<std::size_t>(stream.total_out);
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + written);
        stream.avail_out = static_cast<uInt>(output.size() - written);
        ret = ::inflate(&stream, Z_FINISH);
        if (ret == Z_STREAM_END) break;
        if ((ret != Z_BUF_ERROR && ret != Z_OK) || output.size() >= max_output) break;
        if (stream.avail_out != 0 && stream.avail_in == 0) break;  // truncated input
        output.resize(std::min(output.size() * 2, max_output));
    }
    const auto produced = static_cast<std::size_t>(stream.total_out);
    ::inflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(produced);
    return output;
}

}  // namespace jsonverse_cpp::storage
