/// @file replicated_document.hpp
/// @brief The in-memory replica of one shared document.

#pragma once

#include <collab-cpp/annotation.hpp>
#include <collab-cpp/edit.hpp>
#include <collab-cpp/types.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace collab_cpp {

/// Content, operation log and annotations of a single shared document.
///
/// ReplicatedDocument is a single-writer, strictly ordered operation log,
/// not a commutative merge type. Operations take effect in the order
/// apply_operation() is called, and that call order is the document's
/// total order. All edits to a document must pass through one instance
/// (the ordering authority) for participants to see the same text;
/// two diverging replicas cannot be merged.
///
/// Positions count code points and are clamped into
/// [0, code_point_count(content())]. del and replace affect as many code
/// points as op.content holds (cut short at the end of the content)
/// without checking that they still equal op.content, so an edit computed
/// against an older version can remove different text. Edits never split a
/// multi-byte UTF-8 sequence.
///
/// No access checks happen here; DocumentStore gates every call. Not
/// thread-safe.
///
/// @code
/// auto doc = ReplicatedDocument{"Hello"};
/// doc.apply_operation(EditOperation{.type = EditType::insert,
///                                   .position = 5,
///                                   .content = " World"});
/// // doc.content() == "Hello World"
/// @endcode
class ReplicatedDocument {
public:
    ReplicatedDocument() = default;

    /// Create a replica holding `initial_content` and an empty log.
    explicit ReplicatedDocument(std::string initial_content);

    // -- Mutation -------------------------------------------------------------

    /// Apply an operation to the content and append it to the log.
    /// @param op The operation. Its position is clamped, never rejected.
    /// @param user_name Author name recorded in the history.
    void apply_operation(const EditOperation& op, std::string user_name = {});

    /// Append an annotation. Its position is kept as given.
    void add_annotation(DocumentAnnotation annotation);

    /// Append a reply to an existing annotation.
    /// @return false if no annotation has the given id.
    auto add_reply(const AnnotationId& annotation_id, AnnotationReply reply) -> bool;

    // -- Reading --------------------------------------------------------------

    auto content() const -> const std::string& { return content_; }

    /// Applied operations in application order, with author names.
    auto history() const -> const std::vector<EditHistoryItem>& { return history_; }

    /// Annotations in the order they were added.
    auto annotations() const -> const std::vector<DocumentAnnotation>& {
        return annotations_;
    }

    auto operation_count() const -> std::size_t { return history_.size(); }

private:
    std::string content_;
    std::vector<EditHistoryItem> history_;
    std::vector<DocumentAnnotation> annotations_;
};

/// Number of code points in UTF-8 `text` (bytes that are not continuation
/// bytes).
auto code_point_count(std::string_view text) -> std::size_t;

/// Apply one operation to `content` exactly as ReplicatedDocument does.
///
/// Exposed for callers that want to preview an edit, and as the fold step
/// for replaying a log: replaying the history over the initial content
/// reproduces content().
void apply_to(std::string& content, const EditOperation& op);

}  // namespace collab_cpp
