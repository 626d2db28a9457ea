/// @file edit.hpp
/// @brief Edit operations for the replicated document log.

#pragma once

#include <collab-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace collab_cpp {

/// The kind of mutation an edit operation represents.
enum class EditType : std::uint8_t {
    insert,   ///< Splice content in at the position.
    del,      ///< Remove as many code points as content holds.
    replace,  ///< Overwrite as many code points as content holds.
};

/// Convert an EditType to its string representation.
constexpr auto to_string_view(EditType type) noexcept -> std::string_view {
    switch (type) {
        case EditType::insert:  return "insert";
        case EditType::del:     return "delete";
        case EditType::replace: return "replace";
    }
    return "unknown";
}

/// Parse an edit type name produced by to_string_view().
constexpr auto edit_type_from_string(std::string_view name) noexcept
    -> std::optional<EditType> {
    if (name == "insert") return EditType::insert;
    if (name == "delete") return EditType::del;
    if (name == "replace") return EditType::replace;
    return std::nullopt;
}

/// A single edit in a document's operation log.
///
/// Plain data with no handles, so it can cross a process boundary as is.
/// Positions count Unicode code points of the UTF-8 content; out-of-range
/// positions are clamped when the operation is applied, not rejected.
///
/// For del and replace, the number of code points affected is the code
/// point count of content. The recorded content is not compared against
/// the live text.
struct EditOperation {
    EditType type;            ///< The type of mutation.
    std::size_t position{0};  ///< Code point index the edit starts at.
    std::string content;      ///< Inserted, removed, or replacement text.
    Timestamp timestamp;      ///< When the author made the edit.
    UserId user_id;           ///< The author.

    auto operator==(const EditOperation&) const -> bool = default;
};

/// One-line human readable description, e.g. `Inserted "x" at position 3`.
auto describe(const EditOperation& op) -> std::string;

/// An applied operation together with the author's display name.
struct EditHistoryItem {
    EditOperation operation;  ///< The operation as applied.
    std::string user_name;    ///< Author name resolved when it was applied.

    auto operator==(const EditHistoryItem&) const -> bool = default;
};

}  // namespace collab_cpp
