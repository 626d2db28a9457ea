/// @file annotation.hpp
/// @brief Annotations anchored at a position in a shared document.

#pragma once

#include <collab-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace collab_cpp {

/// The kinds of annotation a participant can attach to a document.
enum class AnnotationType : std::uint8_t {
    comment,
    highlight,
    suggestion,
    drawing,
};

/// Convert an AnnotationType to its string representation.
constexpr auto to_string_view(AnnotationType type) noexcept -> std::string_view {
    switch (type) {
        case AnnotationType::comment:    return "comment";
        case AnnotationType::highlight:  return "highlight";
        case AnnotationType::suggestion: return "suggestion";
        case AnnotationType::drawing:    return "drawing";
    }
    return "unknown";
}

/// Parse an annotation type name produced by to_string_view().
constexpr auto annotation_type_from_string(std::string_view name) noexcept
    -> std::optional<AnnotationType> {
    if (name == "comment") return AnnotationType::comment;
    if (name == "highlight") return AnnotationType::highlight;
    if (name == "suggestion") return AnnotationType::suggestion;
    if (name == "drawing") return AnnotationType::drawing;
    return std::nullopt;
}

/// A reply in an annotation thread.
struct AnnotationReply {
    AnnotationId id;
    UserId user_id;
    Timestamp created_at;
    std::string content;

    auto operator==(const AnnotationReply&) const -> bool = default;
};

/// An annotation attached to a shared document.
///
/// The position is the code point index at creation time. It is stored verbatim
/// and never shifted by later inserts or deletes, so it can drift away from
/// the text it was attached to. Use it as a hint, not an anchor.
struct DocumentAnnotation {
    AnnotationId id;                       ///< Unique annotation id.
    UserId user_id;                        ///< The author.
    Timestamp created_at;                  ///< Creation time.
    AnnotationType type;                   ///< What kind of annotation this is.
    std::size_t position{0};               ///< Code point index at creation time.
    std::string content;                   ///< Annotation body.
    std::vector<AnnotationReply> replies;  ///< Append-only reply thread.

    auto operator==(const DocumentAnnotation&) const -> bool = default;
};

}  // namespace collab_cpp
