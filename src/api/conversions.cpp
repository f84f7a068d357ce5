#include <colmeta/api/conversions.h>

#include <string>
#include <utility>

namespace colmeta::api {

namespace {

using storage::CollectionMetaOperation;

std::optional<Status> requireName(const std::string& value, const char* field) {
    if (value.empty()) {
        return Status::invalidArgument(std::string(field) + " must not be empty");
    }
    return std::nullopt;
}

std::optional<Status> requirePositive(const std::optional<uint32_t>& value, const char* field) {
    if (value && *value == 0) {
        return Status::invalidArgument(std::string(field) + " must be greater than zero");
    }
    return std::nullopt;
}

std::optional<Status> requireObject(const std::optional<nlohmann::json>& metadata) {
    if (metadata && !metadata->is_object()) {
        return Status::invalidArgument("metadata must be a JSON object");
    }
    return std::nullopt;
}

ServiceResult<storage::VectorParams> toVectorParams(const WireVectorParams& wire,
                                                    const std::string& name) {
    if (wire.size == 0) {
        std::string where = name.empty() ? std::string("vectors_config") : "vector '" + name + "'";
        return Status::invalidArgument(where + ": size must be greater than zero");
    }
    auto distance = toDistance(wire.distance);
    if (!distance) {
        return distance.error();
    }
    return storage::VectorParams{wire.size, distance.value(), wire.onDisk};
}

ServiceResult<storage::VectorsConfig> toVectorsConfig(const std::optional<WireVectorsConfig>& wire) {
    if (!wire) {
        return Status::invalidArgument("vectors_config is required");
    }
    if (wire->params.has_value() == wire->paramsMap.has_value()) {
        return Status::invalidArgument(
            "Malformed vectors_config: exactly one of params or params_map must be set");
    }
    if (wire->params) {
        auto params = toVectorParams(*wire->params, {});
        if (!params) {
            return params.error();
        }
        return storage::VectorsConfig{std::move(params).value()};
    }

    if (wire->paramsMap->empty()) {
        return Status::invalidArgument("vectors_config: params_map must not be empty");
    }
    std::map<std::string, storage::VectorParams> named;
    for (const auto& [name, wireParams] : *wire->paramsMap) {
        if (name.empty()) {
            return Status::invalidArgument("vectors_config: vector name must not be empty");
        }
        auto params = toVectorParams(wireParams, name);
        if (!params) {
            return params.error();
        }
        named.emplace(name, std::move(params).value());
    }
    return storage::VectorsConfig{std::move(named)};
}

storage::HnswConfigDiff toHnswDiff(const WireHnswConfigDiff& wire) {
    return storage::HnswConfigDiff{wire.m, wire.efConstruct, wire.fullScanThreshold, wire.onDisk};
}

ServiceResult<storage::OptimizersConfigDiff> toOptimizersDiff(const WireOptimizersConfigDiff& wire) {
    if (wire.deletedThreshold && (*wire.deletedThreshold < 0.0 || *wire.deletedThreshold > 1.0)) {
        return Status::invalidArgument("optimizers_config.deleted_threshold must be within [0, 1]");
    }
    return storage::OptimizersConfigDiff{wire.deletedThreshold, wire.vacuumMinVectorNumber,
                                         wire.defaultSegmentNumber, wire.indexingThreshold,
                                         wire.flushIntervalSec};
}

storage::VectorsConfigDiff toVectorsDiff(const WireVectorsConfigDiff& wire) {
    storage::VectorsConfigDiff diff;
    if (wire.params) {
        diff.emplace(std::string{}, storage::VectorParamsDiff{wire.params->onDisk});
    }
    if (wire.paramsMap) {
        for (const auto& [name, params] : *wire.paramsMap) {
            diff.emplace(name, storage::VectorParamsDiff{params.onDisk});
        }
    }
    return diff;
}

ServiceResult<storage::AliasOperation> toAliasOperation(AliasOperations&& action) {
    const int present = static_cast<int>(action.createAlias.has_value()) +
                        static_cast<int>(action.renameAlias.has_value()) +
                        static_cast<int>(action.deleteAlias.has_value());
    if (present != 1) {
        return Status::invalidArgument("Malformed AliasOperation type");
    }
    if (action.createAlias) {
        auto& create = *action.createAlias;
        if (auto err = requireName(create.collectionName, "create_alias.collection_name"))
            return *err;
        if (auto err = requireName(create.aliasName, "create_alias.alias_name"))
            return *err;
        return storage::AliasOperation{storage::CreateAliasOperation{
            std::move(create.collectionName), std::move(create.aliasName)}};
    }
    if (action.renameAlias) {
        auto& rename = *action.renameAlias;
        if (auto err = requireName(rename.oldAliasName, "rename_alias.old_alias_name"))
            return *err;
        if (auto err = requireName(rename.newAliasName, "rename_alias.new_alias_name"))
            return *err;
        return storage::AliasOperation{storage::RenameAliasOperation{
            std::move(rename.oldAliasName), std::move(rename.newAliasName)}};
    }
    auto& remove = *action.deleteAlias;
    if (auto err = requireName(remove.aliasName, "delete_alias.alias_name"))
        return *err;
    return storage::AliasOperation{storage::DeleteAliasOperation{std::move(remove.aliasName)}};
}

} // namespace

ServiceResult<storage::Distance> toDistance(int32_t wireDistance) {
    switch (static_cast<WireDistance>(wireDistance)) {
        case WireDistance::Cosine:
            return storage::Distance::Cosine;
        case WireDistance::Euclid:
            return storage::Distance::Euclid;
        case WireDistance::Dot:
            return storage::Distance::Dot;
        case WireDistance::Manhattan:
            return storage::Distance::Manhattan;
        case WireDistance::UnknownDistance:
            break;
    }
    return Status::invalidArgument("Unknown distance: " + std::to_string(wireDistance));
}

ServiceResult<CollectionMetaOperation> toCollectionMetaOperation(CreateCollection&& req) {
    if (auto err = requireName(req.collectionName, "collection_name"))
        return *err;
    if (auto err = requirePositive(req.shardNumber, "shard_number"))
        return *err;
    if (auto err = requirePositive(req.replicationFactor, "replication_factor"))
        return *err;
    if (auto err = requirePositive(req.writeConsistencyFactor, "write_consistency_factor"))
        return *err;
    if (auto err = requireObject(req.metadata))
        return *err;
    if (req.initFromCollection && req.initFromCollection->empty()) {
        return Status::invalidArgument("init_from_collection must not be empty when set");
    }

    auto vectors = toVectorsConfig(req.vectorsConfig);
    if (!vectors) {
        return vectors.error();
    }

    storage::CreateCollectionOperation op{
        .collectionName = std::move(req.collectionName),
        .vectors = std::move(vectors).value(),
        .shardNumber = req.shardNumber,
        .replicationFactor = req.replicationFactor,
        .writeConsistencyFactor = req.writeConsistencyFactor,
        .onDiskPayload = req.onDiskPayload,
        .hnswConfig = std::nullopt,
        .optimizersConfig = std::nullopt,
        .initFrom = std::move(req.initFromCollection),
        .metadata = std::move(req.metadata)};
    if (req.hnswConfig) {
        op.hnswConfig = toHnswDiff(*req.hnswConfig);
    }
    if (req.optimizersConfig) {
        auto optimizers = toOptimizersDiff(*req.optimizersConfig);
        if (!optimizers) {
            return optimizers.error();
        }
        op.optimizersConfig = std::move(optimizers).value();
    }
    return CollectionMetaOperation{std::move(op)};
}

ServiceResult<CollectionMetaOperation> toCollectionMetaOperation(UpdateCollection&& req) {
    if (auto err = requireName(req.collectionName, "collection_name"))
        return *err;
    if (auto err = requireObject(req.metadata))
        return *err;

    storage::UpdateCollectionOperation op;
    op.collectionName = std::move(req.collectionName);
    if (req.optimizersConfig) {
        auto optimizers = toOptimizersDiff(*req.optimizersConfig);
        if (!optimizers) {
            return optimizers.error();
        }
        op.optimizersConfig = std::move(optimizers).value();
    }
    if (req.params) {
        if (auto err = requirePositive(req.params->replicationFactor, "params.replication_factor"))
            return *err;
        if (auto err = requirePositive(req.params->writeConsistencyFactor,
                                       "params.write_consistency_factor"))
            return *err;
        op.params = storage::CollectionParamsDiff{req.params->replicationFactor,
                                                  req.params->writeConsistencyFactor,
                                                  req.params->onDiskPayload};
    }
    if (req.hnswConfig) {
        op.hnswConfig = toHnswDiff(*req.hnswConfig);
    }
    if (req.vectorsConfig) {
        if (req.vectorsConfig->params.has_value() == req.vectorsConfig->paramsMap.has_value()) {
            return Status::invalidArgument(
                "Malformed vectors_config: exactly one of params or params_map must be set");
        }
        op.vectors = toVectorsDiff(*req.vectorsConfig);
    }
    op.metadata = std::move(req.metadata);
    return CollectionMetaOperation{std::move(op)};
}

ServiceResult<CollectionMetaOperation> toCollectionMetaOperation(DeleteCollection&& req) {
    if (auto err = requireName(req.collectionName, "collection_name"))
        return *err;
    return CollectionMetaOperation{
        storage::DeleteCollectionOperation{std::move(req.collectionName)}};
}

ServiceResult<CollectionMetaOperation> toCollectionMetaOperation(ChangeAliases&& req) {
    // An empty batch is a valid no-op and still goes to the coordinator.
    storage::ChangeAliasesOperation op;
    op.actions.reserve(req.actions.size());
    for (auto& action : req.actions) {
        auto converted = toAliasOperation(std::move(action));
        if (!converted) {
            return converted.error();
        }
        op.actions.push_back(std::move(converted).value());
    }
    return CollectionMetaOperation{std::move(op)};
}

AliasDescription toAliasDescription(storage::AliasRecord&& record) {
    return AliasDescription{std::move(record.aliasName), std::move(record.collectionName)};
}

CollectionDescription toCollectionDescription(storage::CollectionSummary&& summary) {
    return CollectionDescription{std::move(summary.name)};
}

} // namespace colmeta::api
