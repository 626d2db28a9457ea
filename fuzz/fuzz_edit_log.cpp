// Fuzz target for ReplicatedDocument -- applies arbitrary edit sequences.
// Positions and lengths come straight from the input so most of them are out
// of range. The replica must stay equal to a replay of its own history.

#include <collab-cpp/replicated_document.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    using namespace collab_cpp;

    std::size_t i = 0;
    auto next = [&]() -> std::uint8_t { return i < size ? data[i++] : 0; };

    const auto initial = std::string(next() % 64, 'a');
    auto doc = ReplicatedDocument{initial};

    while (i < size) {
        const auto kind = next() % 3;
        const auto position = static_cast<std::size_t>(next()) * 2;
        const auto length = static_cast<std::size_t>(next() % 16);
        auto content = std::string{};
        for (std::size_t k = 0; k < length && i < size; ++k) {
            content.push_back(static_cast<char>(next()));
        }
        doc.apply_operation(EditOperation{
            .type = static_cast<EditType>(kind),
            .position = position,
            .content = std::move(content),
            .timestamp = Timestamp{},
            .user_id = Uuid{},
        });
    }

    auto replay = initial;
    for (const auto& item : doc.history()) {
        apply_to(replay, item.operation);
    }
    if (replay != doc.content()) std::abort();
    return 0;
}
