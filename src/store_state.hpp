#pragma once

// Internal header -- not installed. Implementation detail of DocumentStore.

#include <collab-cpp/access.hpp>
#include <collab-cpp/document_store.hpp>
#include <collab-cpp/replicated_document.hpp>
#include <collab-cpp/types.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace collab_cpp::detail {

// Everything the store keeps for one document.
struct DocumentEntry {
    SharedDocument meta;
    AccessControlTable acl;
    ReplicatedDocument replica;
};

// The complete internal state of a DocumentStore.
struct StoreState {
    std::map<DocumentId, DocumentEntry> entries;
    std::vector<DocumentId> creation_order;

    auto find(const DocumentId& id) -> DocumentEntry* {
        auto it = entries.find(id);
        return it != entries.end() ? &it->second : nullptr;
    }

    auto find(const DocumentId& id) const -> const DocumentEntry* {
        auto it = entries.find(id);
        return it != entries.end() ? &it->second : nullptr;
    }

    auto insert(DocumentEntry entry) -> DocumentEntry& {
        auto id = entry.meta.id;
        creation_order.push_back(id);
        return entries.emplace(id, std::move(entry)).first->second;
    }
};

}  // namespace collab_cpp::detail
