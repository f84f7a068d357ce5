#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include <colmeta/api/collections_protocol.h>
#include <colmeta/api/conversions.h>
#include <colmeta/api/status.h>
#include <colmeta/api/with_timeout.h>
#include <colmeta/storage/coordinator.h>

namespace colmeta::api {

// A request type that can travel through performOperation().
template <typename T>
concept MutatingRequest = HasWaitTimeout<T> && ConvertibleToMetaOperation<T>;

inline double elapsedSeconds(TimePoint start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

/**
 * @brief Collections endpoint: turns typed requests into coordinator calls.
 *
 * Mutating requests all share performOperation(); read requests forward to the
 * coordinator and decorate the result with the time spent there. The service
 * keeps no per-call state and may be used from any number of concurrent
 * coroutines.
 */
class CollectionsService {
public:
    explicit CollectionsService(std::shared_ptr<storage::ICollectionCoordinator> coordinator);

    boost::asio::awaitable<ServiceResult<CollectionOperationResponse>>
    create(Envelope<CreateCollection> request);
    boost::asio::awaitable<ServiceResult<CollectionOperationResponse>>
    update(Envelope<UpdateCollection> request);
    boost::asio::awaitable<ServiceResult<CollectionOperationResponse>>
    remove(Envelope<DeleteCollection> request);
    boost::asio::awaitable<ServiceResult<CollectionOperationResponse>>
    updateAliases(Envelope<ChangeAliases> request);

    boost::asio::awaitable<ServiceResult<GetCollectionInfoResponse>>
    get(Envelope<GetCollectionInfoRequest> request);
    boost::asio::awaitable<ServiceResult<ListCollectionsResponse>>
    list(Envelope<ListCollectionsRequest> request);
    boost::asio::awaitable<ServiceResult<ListAliasesResponse>>
    listAliases(Envelope<ListAliasesRequest> request);
    boost::asio::awaitable<ServiceResult<ListAliasesResponse>>
    listCollectionAliases(Envelope<ListCollectionAliasesRequest> request);

private:
    // Extract timeout, convert, submit, time, map errors. Identical for every
    // mutating request kind.
    template <MutatingRequest Op>
    boost::asio::awaitable<ServiceResult<CollectionOperationResponse>>
    performOperation(Envelope<Op> request) {
        const auto requestId = request.requestId;
        Op operation = std::move(request).intoInner();
        auto timeout = waitTimeout(operation);
        auto timing = std::chrono::steady_clock::now();

        auto converted = toCollectionMetaOperation(std::move(operation));
        if (!converted) {
            spdlog::warn("[CollectionsService] request {} rejected: {}", requestId,
                         converted.error().message);
            co_return converted.error();
        }
        auto metaOp = std::move(converted).value();
        const char* opName = storage::operationName(metaOp);
        spdlog::debug("[CollectionsService] request {} submitting {} (timeout={}s)", requestId,
                      opName, timeout ? std::to_string(timeout->count()) : std::string("none"));

        auto result = co_await coordinator_->submit(std::move(metaOp), timeout);
        if (!result) {
            auto status = errorToStatus(result.error());
            spdlog::warn("[CollectionsService] request {} {} failed: {} ({} -> {})", requestId,
                         opName, status.message, result.error().code,
                         statusCodeName(status.code));
            co_return status;
        }

        CollectionOperationResponse response{result.value(), elapsedSeconds(timing)};
        spdlog::debug("[CollectionsService] request {} {} done in {:.6f}s result={}", requestId,
                      opName, response.time, response.result);
        co_return response;
    }

    std::shared_ptr<storage::ICollectionCoordinator> coordinator_;
};

} // namespace colmeta::api
