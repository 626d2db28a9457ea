#include <collab-cpp/replicated_document.hpp>

#include <algorithm>
#include <ranges>
#include <string_view>
#include <utility>

namespace collab_cpp {

namespace {

auto is_continuation(char c) -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Byte offset reached by stepping `count` code points forward from `from`,
// stopping at the end of the text. Never lands inside a multi-byte sequence.
auto advance_code_points(std::string_view text, std::size_t from, std::size_t count)
    -> std::size_t {
    auto pos = from;
    while (count > 0 && pos < text.size()) {
        ++pos;
        while (pos < text.size() && is_continuation(text[pos])) ++pos;
        --count;
    }
    return pos;
}

}  // anonymous namespace

auto code_point_count(std::string_view text) -> std::size_t {
    return static_cast<std::size_t>(
        std::ranges::count_if(text, [](char c) { return !is_continuation(c); }));
}

void apply_to(std::string& content, const EditOperation& op) {
    const auto begin = advance_code_points(content, 0, op.position);
    // del/replace run length comes from the recorded content, cut at the end
    const auto end = advance_code_points(content, begin, code_point_count(op.content));

    switch (op.type) {
        case EditType::insert:
            content.insert(begin, op.content);
            break;
        case EditType::del:
            content.erase(begin, end - begin);
            break;
        case EditType::replace:
            content.replace(begin, end - begin, op.content);
            break;
    }
}

auto describe(const EditOperation& op) -> std::string {
    const auto quoted = "\"" + op.content + "\" at position " + std::to_string(op.position);
    switch (op.type) {
        case EditType::insert:  return "Inserted " + quoted;
        case EditType::del:     return "Deleted " + quoted;
        case EditType::replace: return "Replaced with " + quoted;
    }
    return "Unknown edit " + quoted;
}

ReplicatedDocument::ReplicatedDocument(std::string initial_content)
    : content_{std::move(initial_content)} {}

void ReplicatedDocument::apply_operation(const EditOperation& op, std::string user_name) {
    apply_to(content_, op);
    history_.push_back(EditHistoryItem{.operation = op, .user_name = std::move(user_name)});
}

void ReplicatedDocument::add_annotation(DocumentAnnotation annotation) {
    annotations_.push_back(std::move(annotation));
}

auto ReplicatedDocument::add_reply(const AnnotationId& annotation_id, AnnotationReply reply)
    -> bool {
    auto it = std::ranges::find(annotations_, annotation_id, &DocumentAnnotation::id);
    if (it == annotations_.end()) return false;
    it->replies.push_back(std::move(reply));
    return true;
}

}  // namespace collab_cpp
