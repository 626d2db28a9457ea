// Fuzz target for request_from_json() -- exercises the request decoder.
// Any request that decodes is re-encoded and decoded again; the two must match.

#include <collab-cpp/error.hpp>
#include <collab-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto parsed = nlohmann::json::parse(data, data + size, nullptr, false);
    if (parsed.is_discarded()) return 0;

    try {
        auto request = collab_cpp::request_from_json(parsed);
        auto again = collab_cpp::request_from_json(nlohmann::json(request));
        if (!(again == request)) std::abort();
    } catch (const nlohmann::json::exception&) {
        // Missing or mistyped field: rejected input.
    } catch (const collab_cpp::Exception&) {
        // Unknown name or malformed id: rejected input.
    }
    return 0;
}
