#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <colmeta/core/types.h>
#include <colmeta/storage/collection_meta_ops.h>

namespace colmeta::storage {

// Backing coordinator that owns consensus, storage and the collection
// lifecycle. Implementations must be safe for concurrent use; callers share a
// single instance and never lock around it.
class ICollectionCoordinator {
public:
    virtual ~ICollectionCoordinator() = default;

    // Apply a collection meta operation. A present timeout bounds how long the
    // coordinator waits for the operation to be committed.
    virtual boost::asio::awaitable<Result<bool>>
    submit(CollectionMetaOperation operation, std::optional<WaitTimeout> timeout) = 0;

    virtual boost::asio::awaitable<Result<std::vector<CollectionSummary>>> listCollections() = 0;

    virtual boost::asio::awaitable<Result<std::vector<AliasRecord>>> listAliases() = 0;

    virtual boost::asio::awaitable<Result<std::vector<std::string>>>
    collectionAliases(std::string collectionName) = 0;

    virtual boost::asio::awaitable<Result<CollectionInfo>>
    getCollectionInfo(std::string collectionName) = 0;
};

} // namespace colmeta::storage
