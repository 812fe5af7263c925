#include "clu/library/item_resolver.hpp"

#include <spdlog/spdlog.h>

namespace clu::library {
namespace {

Result<std::string> resolve_library_id(ContentLibraryApi& api, const std::string& library) {
    auto matches = api.find_libraries(library);
    if (matches.is_error()) {
        return Err<std::string>(matches.error());
    }
    if (matches.value().size() > 1) {
        return Err<std::string>(ErrorCode::InvalidArgument,
                                "Library name '" + library + "' is ambiguous (" +
                                std::to_string(matches.value().size()) + " matches)");
    }
    if (matches.value().size() == 1) {
        return Ok(matches.value().front());
    }

    // Not a name; accept a library id as well
    auto by_id = api.get_library(library);
    if (by_id.is_error()) {
        if (by_id.error().is(ErrorCode::NotFound)) {
            return Err<std::string>(ErrorCode::NotFound, "Library not found: " + library);
        }
        return Err<std::string>(by_id.error());
    }
    return Ok(by_id.value().id);
}

ItemHandle to_handle(const ItemInfo& info) {
    return ItemHandle{info.id, info.library_id, info.name, info.content_version};
}

} // namespace

Result<ItemHandle> resolve_item(ContentLibraryApi& api, const ItemRef& ref) {
    if (ref.item.empty()) {
        return Err<ItemHandle>(ErrorCode::InvalidArgument, "Item reference is empty");
    }

    std::string item_id = ref.item;
    if (!ref.library.empty()) {
        auto library_id = resolve_library_id(api, ref.library);
        if (library_id.is_error()) {
            return Err<ItemHandle>(library_id.error());
        }

        auto matches = api.find_items(library_id.value(), ref.item);
        if (matches.is_error()) {
            return Err<ItemHandle>(matches.error());
        }
        if (matches.value().empty()) {
            return Err<ItemHandle>(ErrorCode::NotFound,
                                   "Item '" + ref.item + "' not found in library " + ref.library);
        }
        if (matches.value().size() > 1) {
            return Err<ItemHandle>(ErrorCode::InvalidArgument,
                                   "Item name '" + ref.item + "' is ambiguous in library " + ref.library);
        }
        item_id = matches.value().front();
    }

    auto info = api.get_item(item_id);
    if (info.is_error()) {
        return Err<ItemHandle>(info.error());
    }
    spdlog::debug("Resolved item {} (library={}, content_version={})",
                  info.value().id, info.value().library_id, info.value().content_version);
    return Ok(to_handle(info.value()));
}

} // namespace clu::library
