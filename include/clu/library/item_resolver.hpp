#pragma once

#include "clu/core/result.hpp"
#include "clu/library/content_library_api.hpp"
#include "clu/library/types.hpp"

#include <string>

namespace clu::library {

/**
 * @brief How the caller names a library item
 *
 * library empty: item is an item id.
 * library set:   library is a library name (or id) and item an item name.
 */
struct ItemRef {
    std::string library;
    std::string item;

    static ItemRef by_id(std::string item_id) { return ItemRef{{}, std::move(item_id)}; }
    static ItemRef by_name(std::string library, std::string item_name) {
        return ItemRef{std::move(library), std::move(item_name)};
    }
};

/**
 * @brief Resolve an ItemRef to a typed handle with one set of lookups
 *
 * Errors: NotFound when nothing matches, InvalidArgument when a name is
 * ambiguous or the reference is empty.
 */
Result<ItemHandle> resolve_item(ContentLibraryApi& api, const ItemRef& ref);

} // namespace clu::library
