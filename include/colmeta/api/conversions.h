#pragma once

#include <concepts>
#include <cstdint>
#include <utility>

#include <colmeta/api/collections_protocol.h>
#include <colmeta/api/status.h>
#include <colmeta/storage/collection_meta_ops.h>

namespace colmeta::api {

// Wire request -> coordinator operation. Pure; every failure is an
// InvalidArgument status naming the offending field.
ServiceResult<storage::CollectionMetaOperation> toCollectionMetaOperation(CreateCollection&& req);
ServiceResult<storage::CollectionMetaOperation> toCollectionMetaOperation(UpdateCollection&& req);
ServiceResult<storage::CollectionMetaOperation> toCollectionMetaOperation(DeleteCollection&& req);
ServiceResult<storage::CollectionMetaOperation> toCollectionMetaOperation(ChangeAliases&& req);

template <typename T>
concept ConvertibleToMetaOperation = requires(T&& req) {
    {
        toCollectionMetaOperation(std::move(req))
        } -> std::same_as<ServiceResult<storage::CollectionMetaOperation>>;
};

ServiceResult<storage::Distance> toDistance(int32_t wireDistance);

// Coordinator records -> wire descriptions
AliasDescription toAliasDescription(storage::AliasRecord&& record);
CollectionDescription toCollectionDescription(storage::CollectionSummary&& summary);

} // namespace colmeta::api
