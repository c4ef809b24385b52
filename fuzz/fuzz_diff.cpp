// Fuzz target for diff()/apply()/invert(). The input holds two JSON
// documents separated by a NUL byte; the patch between them must replay
// forwards and backwards exactly.

#include <jsonverse-cpp/diff.hpp>
#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/json.hpp>
#include <jsonverse-cpp/patch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace jv = jsonverse_cpp;
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    if (split == std::string_view::npos) return 0;

    auto before = jv::Tree{};
    auto after = jv::Tree{};
    try {
        before = jv::parse(input.substr(0, split));
        after = jv::parse(input.substr(split + 1));
    } catch (const jv::Exception&) {
        return 0;
    }

    const auto patch = jv::diff(before, after);
    if (!(jv::apply(before, patch) == after)) std::abort();
    if (!(jv::apply(after, jv::invert(patch)) == before)) std::abort();
    if (!jv::diff(after, after).empty()) std::abort();
    return 0;
}
