// Fuzz target for stored record decoding: damaged bytes must surface as
// Exception(storage_error), never as a crash. Decoded records re-encode
// to records that decode to the same value.

#include "../src/storage/records.hpp"

#include <jsonverse-cpp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace jv = jsonverse_cpp;
    const auto bytes = std::span<const std::byte>(reinterpret_cast<const std::byte*>(data), size);

    try {
        const auto version = jv::storage::decode_record<jv::Version>(bytes, "fuzz");
        const auto encoded = jv::storage::encode_record(version, 64);
        if (!(jv::storage::decode_record<jv::Version>(encoded, "fuzz") == version)) std::abort();
    } catch (const jv::Exception& e) {
        if (e.kind() != jv::ErrorKind::storage_error) std::abort();
    }
    return 0;
}
