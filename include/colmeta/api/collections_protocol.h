#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <colmeta/storage/collection_meta_ops.h>

namespace colmeta::api {

// ============================================================================
// Transport envelope
// ============================================================================

// Typed request as handed over by the transport layer. The payload is moved
// out exactly once by the handler.
template <typename T> struct Envelope {
    uint64_t requestId{0};
    T payload;

    T intoInner() && { return std::move(payload); }
};

template <typename T> Envelope<T> makeEnvelope(T payload, uint64_t requestId = 0) {
    return Envelope<T>{requestId, std::move(payload)};
}

// ============================================================================
// Wire-level parameter types
// ============================================================================

// Integer-coded on the wire; values outside the known set are rejected at
// conversion time.
enum class WireDistance : int32_t {
    UnknownDistance = 0,
    Cosine = 1,
    Euclid = 2,
    Dot = 3,
    Manhattan = 4
};

struct WireVectorParams {
    uint64_t size{0};
    int32_t distance{0};
    std::optional<bool> onDisk;
};

// Exactly one of `params` and `paramsMap` is expected to be set.
struct WireVectorsConfig {
    std::optional<WireVectorParams> params;
    std::optional<std::map<std::string, WireVectorParams>> paramsMap;
};

struct WireVectorParamsDiff {
    std::optional<bool> onDisk;
};

struct WireVectorsConfigDiff {
    std::optional<WireVectorParamsDiff> params;
    std::optional<std::map<std::string, WireVectorParamsDiff>> paramsMap;
};

struct WireHnswConfigDiff {
    std::optional<uint64_t> m;
    std::optional<uint64_t> efConstruct;
    std::optional<uint64_t> fullScanThreshold;
    std::optional<bool> onDisk;
};

struct WireOptimizersConfigDiff {
    std::optional<double> deletedThreshold;
    std::optional<uint64_t> vacuumMinVectorNumber;
    std::optional<uint64_t> defaultSegmentNumber;
    std::optional<uint64_t> indexingThreshold;
    std::optional<uint64_t> flushIntervalSec;
};

struct WireCollectionParamsDiff {
    std::optional<uint32_t> replicationFactor;
    std::optional<uint32_t> writeConsistencyFactor;
    std::optional<bool> onDiskPayload;
};

// ============================================================================
// Mutating requests
// ============================================================================

struct CreateCollection {
    std::string collectionName;
    std::optional<WireVectorsConfig> vectorsConfig;
    std::optional<uint32_t> shardNumber;
    std::optional<uint32_t> replicationFactor;
    std::optional<uint32_t> writeConsistencyFactor;
    std::optional<bool> onDiskPayload;
    std::optional<WireHnswConfigDiff> hnswConfig;
    std::optional<WireOptimizersConfigDiff> optimizersConfig;
    std::optional<std::string> initFromCollection;
    std::optional<nlohmann::json> metadata;
    std::optional<uint64_t> timeout; // seconds
};

struct UpdateCollection {
    std::string collectionName;
    std::optional<WireOptimizersConfigDiff> optimizersConfig;
    std::optional<WireCollectionParamsDiff> params;
    std::optional<WireHnswConfigDiff> hnswConfig;
    std::optional<WireVectorsConfigDiff> vectorsConfig;
    std::optional<nlohmann::json> metadata;
    std::optional<uint64_t> timeout; // seconds
};

struct DeleteCollection {
    std::string collectionName;
    std::optional<uint64_t> timeout; // seconds
};

struct CreateAlias {
    std::string collectionName;
    std::string aliasName;
};

struct RenameAlias {
    std::string oldAliasName;
    std::string newAliasName;
};

struct DeleteAlias {
    std::string aliasName;
};

// Wire form of a single alias action; exactly one member is expected.
struct AliasOperations {
    std::optional<CreateAlias> createAlias;
    std::optional<RenameAlias> renameAlias;
    std::optional<DeleteAlias> deleteAlias;
};

struct ChangeAliases {
    std::vector<AliasOperations> actions;
    std::optional<uint64_t> timeout; // seconds
};

// ============================================================================
// Read-only requests
// ============================================================================

struct GetCollectionInfoRequest {
    std::string collectionName;
};

struct ListCollectionsRequest {};

struct ListAliasesRequest {};

struct ListCollectionAliasesRequest {
    std::string collectionName;
};

// ============================================================================
// Responses
// ============================================================================

struct CollectionOperationResponse {
    bool result{false};
    double time{0.0}; // seconds spent in the coordinator
};

struct CollectionDescription {
    std::string name;
};

struct ListCollectionsResponse {
    std::vector<CollectionDescription> collections;
    double time{0.0};
};

struct AliasDescription {
    std::string aliasName;
    std::string collectionName;

    bool operator==(const AliasDescription&) const = default;
};

struct ListAliasesResponse {
    std::vector<AliasDescription> aliases;
    double time{0.0};
};

struct GetCollectionInfoResponse {
    storage::CollectionInfo result;
    double time{0.0};
};

} // namespace colmeta::api
