#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <optional>

#include <colmeta/api/collections_protocol.h>
#include <colmeta/core/types.h>

namespace colmeta::api {

// Wire seconds -> WaitTimeout. Values beyond the signed range saturate at
// WaitTimeout::max() instead of wrapping negative.
inline WaitTimeout toWaitTimeout(uint64_t seconds) {
    constexpr auto limit = static_cast<uint64_t>(WaitTimeout::max().count());
    if (seconds > limit)
        return WaitTimeout::max();
    return WaitTimeout{static_cast<WaitTimeout::rep>(seconds)};
}

// Trait exposing the optional wait timeout carried by a mutating request.
template <typename T> struct WithTimeout;

#define COLMETA_DEFINE_WITH_TIMEOUT(RequestType)                                                   \
    template <> struct WithTimeout<RequestType> {                                                  \
        static std::optional<WaitTimeout> waitTimeout(const RequestType& req) {                    \
            if (!req.timeout)                                                                      \
                return std::nullopt;                                                               \
            return toWaitTimeout(*req.timeout);                                                    \
        }                                                                                          \
    }

COLMETA_DEFINE_WITH_TIMEOUT(CreateCollection);
COLMETA_DEFINE_WITH_TIMEOUT(UpdateCollection);
COLMETA_DEFINE_WITH_TIMEOUT(DeleteCollection);
COLMETA_DEFINE_WITH_TIMEOUT(ChangeAliases);

#undef COLMETA_DEFINE_WITH_TIMEOUT

template <typename T>
concept HasWaitTimeout = requires(const T& req) {
    { WithTimeout<T>::waitTimeout(req) } -> std::same_as<std::optional<WaitTimeout>>;
};

template <HasWaitTimeout T> std::optional<WaitTimeout> waitTimeout(const T& req) {
    return WithTimeout<T>::waitTimeout(req);
}

} // namespace colmeta::api
