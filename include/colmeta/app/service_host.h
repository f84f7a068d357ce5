// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <future>
#include <memory>

#include <boost/asio/thread_pool.hpp>

#include <colmeta/api/collections_protocol.h>
#include <colmeta/api/collections_service.h>
#include <colmeta/api/status.h>
#include <colmeta/config/service_config.h>
#include <colmeta/storage/coordinator.h>

namespace colmeta::app {

/**
 * @brief Runs CollectionsService calls on a worker pool.
 *
 * Every call is spawned as its own coroutine on the pool and completes a
 * future. A coroutine suspended on the coordinator does not occupy a worker
 * thread. Exceptions escaping a call become StatusCode::Internal for that
 * call only.
 */
class ServiceHost {
public:
    ServiceHost(const config::ServiceConfig& cfg,
                std::shared_ptr<storage::ICollectionCoordinator> coordinator);
    ~ServiceHost();

    ServiceHost(const ServiceHost&) = delete;
    ServiceHost& operator=(const ServiceHost&) = delete;

    std::future<api::ServiceResult<api::CollectionOperationResponse>>
    create(api::Envelope<api::CreateCollection> request);
    std::future<api::ServiceResult<api::CollectionOperationResponse>>
    update(api::Envelope<api::UpdateCollection> request);
    std::future<api::ServiceResult<api::CollectionOperationResponse>>
    remove(api::Envelope<api::DeleteCollection> request);
    std::future<api::ServiceResult<api::CollectionOperationResponse>>
    updateAliases(api::Envelope<api::ChangeAliases> request);

    std::future<api::ServiceResult<api::GetCollectionInfoResponse>>
    get(api::Envelope<api::GetCollectionInfoRequest> request);
    std::future<api::ServiceResult<api::ListCollectionsResponse>>
    list(api::Envelope<api::ListCollectionsRequest> request);
    std::future<api::ServiceResult<api::ListAliasesResponse>>
    listAliases(api::Envelope<api::ListAliasesRequest> request);
    std::future<api::ServiceResult<api::ListAliasesResponse>>
    listCollectionAliases(api::Envelope<api::ListCollectionAliasesRequest> request);

    std::size_t workerThreads() const noexcept { return workerThreads_; }

    // Wait for in-flight calls to finish and stop the pool.
    void shutdown();

private:
    template <typename R, typename Fn>
    std::future<api::ServiceResult<R>> spawn(const char* name, Fn&& fn);

    api::CollectionsService service_;
    std::size_t workerThreads_;
    boost::asio::thread_pool pool_;
};

} // namespace colmeta::app
