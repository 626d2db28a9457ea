// collab-cpp benchmarks -- measures throughput of edits, events and JSON codec.

#include <collab-cpp/collab.hpp>
#include <collab-cpp/json.hpp>

#include <benchmark/benchmark.h>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace collab_cpp;

static auto make_user(const char* name) -> CollaborationUser {
    return CollaborationUser{.id = Uuid::random(), .name = name, .email = {},
                             .avatar_url = std::nullopt};
}

static auto make_insert(std::size_t position, const UserId& user) -> EditOperation {
    return EditOperation{.type = EditType::insert, .position = position, .content = "x",
                         .timestamp = Timestamp::now(), .user_id = user};
}

// Keeps the per-edit debug logging out of the measurements.
static const auto g_quiet = [] {
    spdlog::set_level(spdlog::level::warn);
    return 0;
}();

// =============================================================================
// Replica
// =============================================================================

static void bm_replica_append(benchmark::State& state) {
    auto doc = ReplicatedDocument{};
    const auto user = Uuid::random();
    std::size_t i = 0;
    for (auto _ : state) {
        doc.apply_operation(make_insert(i++, user), "bench");
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_replica_append);

static void bm_replica_insert_at_front(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto user = Uuid::random();
    for (auto _ : state) {
        auto doc = ReplicatedDocument{std::string(n, 'a')};
        for (int k = 0; k < 100; ++k) {
            doc.apply_operation(make_insert(0, user));
        }
        benchmark::DoNotOptimize(doc.content().size());
    }
    state.SetItemsProcessed(state.iterations() * 100);
}
BENCHMARK(bm_replica_insert_at_front)->Arg(1'000)->Arg(100'000);

// =============================================================================
// Document store
// =============================================================================

static void bm_store_apply_edit(benchmark::State& state) {
    auto collab = Collaboration{};
    const auto alice = make_user("Alice");
    collab.sessions().create_session("bench", alice);
    const auto doc = collab.documents().create_shared_document("doc", "", alice);

    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            collab.documents().apply_edit(doc.id, alice.id, make_insert(i++, alice.id)));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_store_apply_edit);

static void bm_store_denied_edit(benchmark::State& state) {
    auto collab = Collaboration{};
    const auto alice = make_user("Alice");
    const auto mallory = make_user("Mallory");
    collab.sessions().create_session("bench", alice);
    const auto doc = collab.documents().create_shared_document("doc", "", alice);
    spdlog::set_level(spdlog::level::off);

    for (auto _ : state) {
        benchmark::DoNotOptimize(
            collab.documents().apply_edit(doc.id, mallory.id, make_insert(0, mallory.id)));
    }
    spdlog::set_level(spdlog::level::warn);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_store_denied_edit);

// =============================================================================
// Event fan-out
// =============================================================================

static void bm_publish_fan_out(benchmark::State& state) {
    const auto subscribers = static_cast<int>(state.range(0));
    auto bus = EventBus{};
    std::uint64_t delivered = 0;
    for (int s = 0; s < subscribers; ++s) {
        bus.subscribe([&](const DocumentUpdate&) { ++delivered; });
    }
    const auto update = DocumentUpdate{
        .document_id = Uuid::random(),
        .user_id = Uuid::random(),
        .payload = DocumentEdited{.title = "doc", .user_name = "Alice",
                                  .description = "Inserted \"x\" at position 0",
                                  .version = 2},
    };
    for (auto _ : state) {
        bus.publish(update);
    }
    benchmark::DoNotOptimize(delivered);
    state.SetItemsProcessed(state.iterations() * subscribers);
}
BENCHMARK(bm_publish_fan_out)->Arg(1)->Arg(8)->Arg(64);

// =============================================================================
// JSON
// =============================================================================

static void bm_request_decode(benchmark::State& state) {
    const auto user = Uuid::random();
    const auto text = nlohmann::json(Request{EditRequest{
        .document_id = Uuid::random(),
        .user_id = user,
        .operation = make_insert(10, user),
        .timestamp = Timestamp::now(),
    }}).dump();

    for (auto _ : state) {
        auto request = request_from_json(nlohmann::json::parse(text));
        benchmark::DoNotOptimize(request);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(text.size()));
}
BENCHMARK(bm_request_decode);
