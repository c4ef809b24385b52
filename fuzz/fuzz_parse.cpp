// Fuzz target for parse(): any accepted text must serialize and re-parse
// to an equal Tree.

#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace jv = jsonverse_cpp;
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto tree = jv::Tree{};
    try {
        tree = jv::parse(text);
    } catch (const jv::Exception&) {
        return 0;
    }

    const auto again = jv::parse(jv::serialize(tree, -1));
    if (!(again == tree)) std::abort();
    return 0;
}
