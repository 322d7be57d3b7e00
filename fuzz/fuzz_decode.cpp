// Fuzz target for decode(): exercises the full wire decoder and, for any
// stream that decodes, the encoder, the registry and the JSON exporter.

#include <marshal-cpp/marshal.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    try {
        auto doc = marshal_cpp::decode(span, marshal_cpp::DecodeOptions{.max_depth = 256});

        // Anything that decodes must re-encode and decode again.
        auto bytes = marshal_cpp::encode(doc);
        auto again = marshal_cpp::decode(bytes);
        (void)again;

        auto json = marshal_cpp::export_json(doc);
        (void)json;

        auto record = marshal_cpp::Registry::instance().decode(doc.graph, doc.root);
        (void)record;
    } catch (const marshal_cpp::Exception&) {
        // Rejected input is the expected outcome for most mutations.
    }
    return 0;
}
