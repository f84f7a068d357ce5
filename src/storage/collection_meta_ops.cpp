#include <colmeta/storage/collection_meta_ops.h>

#include <type_traits>

namespace colmeta::storage {

const char* distanceName(Distance distance) noexcept {
    switch (distance) {
        case Distance::Cosine:
            return "Cosine";
        case Distance::Euclid:
            return "Euclid";
        case Distance::Dot:
            return "Dot";
        case Distance::Manhattan:
            return "Manhattan";
    }
    return "Unknown";
}

const char* operationName(const CollectionMetaOperation& op) noexcept {
    return std::visit(
        [](const auto& arg) -> const char* {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, CreateCollectionOperation>)
                return "create_collection";
            else if constexpr (std::is_same_v<T, UpdateCollectionOperation>)
                return "update_collection";
            else if constexpr (std::is_same_v<T, DeleteCollectionOperation>)
                return "delete_collection";
            else
                return "change_aliases";
        },
        op);
}

} // namespace colmeta::storage
