#include <colmeta/api/collections_service.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace colmeta::api {

CollectionsService::CollectionsService(
    std::shared_ptr<storage::ICollectionCoordinator> coordinator)
    : coordinator_(std::move(coordinator)) {
    if (!coordinator_) {
        throw std::invalid_argument("CollectionsService requires a coordinator");
    }
}

boost::asio::awaitable<ServiceResult<CollectionOperationResponse>>
CollectionsService::create(Envelope<CreateCollection> request) {
    co_return co_await performOperation(std::move(request));
}

boost::asio::awaitable<ServiceResult<CollectionOperationResponse>>
CollectionsService::update(Envelope<UpdateCollection> request) {
    co_return co_await performOperation(std::move(request));
}

boost::asio::awaitable<ServiceResult<CollectionOperationResponse>>
CollectionsService::remove(Envelope<DeleteCollection> request) {
    co_return co_await performOperation(std::move(request));
}

boost::asio::awaitable<ServiceResult<CollectionOperationResponse>>
CollectionsService::updateAliases(Envelope<ChangeAliases> request) {
    co_return co_await performOperation(std::move(request));
}

boost::asio::awaitable<ServiceResult<GetCollectionInfoResponse>>
CollectionsService::get(Envelope<GetCollectionInfoRequest> request) {
    auto req = std::move(request).intoInner();
    auto timing = std::chrono::steady_clock::now();
    auto info = co_await coordinator_->getCollectionInfo(req.collectionName);
    if (!info) {
        auto status = errorToStatus(info.error());
        spdlog::debug("[CollectionsService] get '{}' failed: {}", req.collectionName,
                      status.message);
        co_return status;
    }
    co_return GetCollectionInfoResponse{std::move(info).value(), elapsedSeconds(timing)};
}

boost::asio::awaitable<ServiceResult<ListCollectionsResponse>>
CollectionsService::list([[maybe_unused]] Envelope<ListCollectionsRequest> request) {
    auto timing = std::chrono::steady_clock::now();
    auto collections = co_await coordinator_->listCollections();
    if (!collections) {
        co_return errorToStatus(collections.error());
    }

    ListCollectionsResponse response;
    auto summaries = std::move(collections).value();
    response.collections.reserve(summaries.size());
    for (auto& summary : summaries) {
        response.collections.push_back(toCollectionDescription(std::move(summary)));
    }
    response.time = elapsedSeconds(timing);
    spdlog::debug("[CollectionsService] list: {} collections", response.collections.size());
    co_return response;
}

boost::asio::awaitable<ServiceResult<ListAliasesResponse>>
CollectionsService::listAliases([[maybe_unused]] Envelope<ListAliasesRequest> request) {
    auto timing = std::chrono::steady_clock::now();
    auto aliases = co_await coordinator_->listAliases();
    if (!aliases) {
        co_return errorToStatus(aliases.error());
    }

    ListAliasesResponse response;
    auto records = std::move(aliases).value();
    response.aliases.reserve(records.size());
    for (auto& record : records) {
        response.aliases.push_back(toAliasDescription(std::move(record)));
    }
    response.time = elapsedSeconds(timing);
    co_return response;
}

boost::asio::awaitable<ServiceResult<ListAliasesResponse>>
CollectionsService::listCollectionAliases(Envelope<ListCollectionAliasesRequest> request) {
    auto req = std::move(request).intoInner();
    auto timing = std::chrono::steady_clock::now();
    auto aliases = co_await coordinator_->collectionAliases(req.collectionName);
    if (!aliases) {
        co_return errorToStatus(aliases.error());
    }

    // Every alias is attributed to the collection the caller asked about; the
    // coordinator only returns alias names here.
    // TODO: cross-check against listAliases() records once the coordinator
    // exposes the owning collection per alias in this call.
    ListAliasesResponse response;
    auto names = std::move(aliases).value();
    response.aliases.reserve(names.size());
    for (auto& alias : names) {
        response.aliases.push_back(AliasDescription{std::move(alias), req.collectionName});
    }
    response.time = elapsedSeconds(timing);
    co_return response;
}

} // namespace colmeta::api
