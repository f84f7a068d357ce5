#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace colmeta::storage {

// ============================================================================
// Collection parameters (validated, coordinator-facing)
// ============================================================================

enum class Distance { Cosine, Euclid, Dot, Manhattan };

const char* distanceName(Distance distance) noexcept;

struct VectorParams {
    uint64_t size{0};
    Distance distance{Distance::Cosine};
    std::optional<bool> onDisk;
};

// A collection either has a single unnamed vector or a set of named vectors.
using VectorsConfig = std::variant<VectorParams, std::map<std::string, VectorParams>>;

struct HnswConfigDiff {
    std::optional<uint64_t> m;
    std::optional<uint64_t> efConstruct;
    std::optional<uint64_t> fullScanThreshold;
    std::optional<bool> onDisk;
};

struct OptimizersConfigDiff {
    std::optional<double> deletedThreshold;
    std::optional<uint64_t> vacuumMinVectorNumber;
    std::optional<uint64_t> defaultSegmentNumber;
    std::optional<uint64_t> indexingThreshold;
    std::optional<uint64_t> flushIntervalSec;
};

struct CollectionParamsDiff {
    std::optional<uint32_t> replicationFactor;
    std::optional<uint32_t> writeConsistencyFactor;
    std::optional<bool> onDiskPayload;
};

struct VectorParamsDiff {
    std::optional<bool> onDisk;
};

// Per-vector diffs keyed by vector name; the unnamed vector uses "".
using VectorsConfigDiff = std::map<std::string, VectorParamsDiff>;

// ============================================================================
// Collection meta operations
// ============================================================================

struct CreateCollectionOperation {
    std::string collectionName;
    VectorsConfig vectors;
    std::optional<uint32_t> shardNumber;
    std::optional<uint32_t> replicationFactor;
    std::optional<uint32_t> writeConsistencyFactor;
    std::optional<bool> onDiskPayload;
    std::optional<HnswConfigDiff> hnswConfig;
    std::optional<OptimizersConfigDiff> optimizersConfig;
    std::optional<std::string> initFrom;
    std::optional<nlohmann::json> metadata;
};

struct UpdateCollectionOperation {
    std::string collectionName;
    std::optional<OptimizersConfigDiff> optimizersConfig;
    std::optional<CollectionParamsDiff> params;
    std::optional<HnswConfigDiff> hnswConfig;
    std::optional<VectorsConfigDiff> vectors;
    std::optional<nlohmann::json> metadata;
};

struct DeleteCollectionOperation {
    std::string collectionName;
};

struct CreateAliasOperation {
    std::string collectionName;
    std::string aliasName;
};

struct DeleteAliasOperation {
    std::string aliasName;
};

struct RenameAliasOperation {
    std::string oldAliasName;
    std::string newAliasName;
};

using AliasOperation =
    std::variant<CreateAliasOperation, DeleteAliasOperation, RenameAliasOperation>;

struct ChangeAliasesOperation {
    std::vector<AliasOperation> actions;
};

// Closed set of units of work accepted by the coordinator.
using CollectionMetaOperation =
    std::variant<CreateCollectionOperation, UpdateCollectionOperation, DeleteCollectionOperation,
                 ChangeAliasesOperation>;

// Short operation label for logs ("create_collection", "change_aliases", ...).
const char* operationName(const CollectionMetaOperation& op) noexcept;

// ============================================================================
// Coordinator records returned by read paths
// ============================================================================

struct CollectionSummary {
    std::string name;
};

struct AliasRecord {
    std::string aliasName;
    std::string collectionName;
};

enum class CollectionStatus { Green, Yellow, Grey, Red };

enum class OptimizerStatus { Ok, Error };

struct CollectionConfigSnapshot {
    VectorsConfig vectors;
    uint32_t shardNumber{1};
    uint32_t replicationFactor{1};
    uint32_t writeConsistencyFactor{1};
    bool onDiskPayload{false};
    HnswConfigDiff hnswConfig;
    OptimizersConfigDiff optimizersConfig;
    nlohmann::json metadata = nlohmann::json::object();
};

struct CollectionInfo {
    CollectionStatus status{CollectionStatus::Green};
    OptimizerStatus optimizerStatus{OptimizerStatus::Ok};
    std::string optimizerError;
    std::optional<uint64_t> pointsCount;
    std::optional<uint64_t> indexedVectorsCount;
    uint64_t segmentsCount{0};
    CollectionConfigSnapshot config;
    std::map<std::string, std::string> payloadSchema;
};

} // namespace colmeta::storage
