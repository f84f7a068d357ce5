// SPDX-License-Identifier: Apache-2.0

#include <colmeta/app/service_host.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>

namespace colmeta::app {

namespace {

std::size_t effectiveThreads(std::size_t configured) {
    return configured == 0 ? 1 : configured;
}

} // namespace

ServiceHost::ServiceHost(const config::ServiceConfig& cfg,
                         std::shared_ptr<storage::ICollectionCoordinator> coordinator)
    : service_(std::move(coordinator)), workerThreads_(effectiveThreads(cfg.workerThreads)),
      pool_(workerThreads_) {
    spdlog::info("ServiceHost started with {} worker threads", workerThreads_);
}

ServiceHost::~ServiceHost() {
    shutdown();
}

void ServiceHost::shutdown() {
    pool_.join();
}

// Result types are not default constructible, so the spawned coroutine hands
// back a shared_ptr and the completion handler unwraps it into the promise.
template <typename R, typename Fn>
std::future<api::ServiceResult<R>> ServiceHost::spawn(const char* name, Fn&& fn) {
    using ResultType = api::ServiceResult<R>;
    auto promise = std::make_shared<std::promise<ResultType>>();
    auto future = promise->get_future();

    boost::asio::co_spawn(
        pool_,
        [fn = std::forward<Fn>(fn)]() mutable
        -> boost::asio::awaitable<std::shared_ptr<ResultType>> {
            auto result = co_await fn();
            co_return std::make_shared<ResultType>(std::move(result));
        },
        [promise, name](std::exception_ptr ep, std::shared_ptr<ResultType> result) {
            if (!ep && result) {
                promise->set_value(std::move(*result));
                return;
            }
            std::string what = "no result produced";
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    what = e.what();
                } catch (...) {
                    what = "non-standard exception";
                }
            }
            spdlog::error("ServiceHost: {} failed with exception: {}", name, what);
            promise->set_value(api::Status::internal(std::string(name) + ": " + what));
        });
    return future;
}

std::future<api::ServiceResult<api::CollectionOperationResponse>>
ServiceHost::create(api::Envelope<api::CreateCollection> request) {
    return spawn<api::CollectionOperationResponse>(
        "create", [this, req = std::move(request)]() mutable {
            return service_.create(std::move(req));
        });
}

std::future<api::ServiceResult<api::CollectionOperationResponse>>
ServiceHost::update(api::Envelope<api::UpdateCollection> request) {
    return spawn<api::CollectionOperationResponse>(
        "update", [this, req = std::move(request)]() mutable {
            return service_.update(std::move(req));
        });
}

std::future<api::ServiceResult<api::CollectionOperationResponse>>
ServiceHost::remove(api::Envelope<api::DeleteCollection> request) {
    return spawn<api::CollectionOperationResponse>(
        "delete", [this, req = std::move(request)]() mutable {
            return service_.remove(std::move(req));
        });
}

std::future<api::ServiceResult<api::CollectionOperationResponse>>
ServiceHost::updateAliases(api::Envelope<api::ChangeAliases> request) {
    return spawn<api::CollectionOperationResponse>(
        "update_aliases", [this, req = std::move(request)]() mutable {
            return service_.updateAliases(std::move(req));
        });
}

std::future<api::ServiceResult<api::GetCollectionInfoResponse>>
ServiceHost::get(api::Envelope<api::GetCollectionInfoRequest> request) {
    return spawn<api::GetCollectionInfoResponse>(
        "get", [this, req = std::move(request)]() mutable { return service_.get(std::move(req)); });
}

std::future<api::ServiceResult<api::ListCollectionsResponse>>
ServiceHost::list(api::Envelope<api::ListCollectionsRequest> request) {
    return spawn<api::ListCollectionsResponse>(
        "list", [this, req = std::move(request)]() mutable { return service_.list(std::move(req)); });
}

std::future<api::ServiceResult<api::ListAliasesResponse>>
ServiceHost::listAliases(api::Envelope<api::ListAliasesRequest> request) {
    return spawn<api::ListAliasesResponse>(
        "list_aliases", [this, req = std::move(request)]() mutable {
            return service_.listAliases(std::move(req));
        });
}

std::future<api::ServiceResult<api::ListAliasesResponse>>
ServiceHost::listCollectionAliases(api::Envelope<api::ListCollectionAliasesRequest> request) {
    return spawn<api::ListAliasesResponse>(
        "list_collection_aliases", [this, req = std::move(request)]() mutable {
            return service_.listCollectionAliases(std::move(req));
        });
}

} // namespace colmeta::app
