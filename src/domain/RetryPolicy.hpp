/**
 * @file RetryPolicy.hpp
 * @brief Bounded retry budgets for post-creation verification.
 */

#pragma once
#include <chrono>

namespace fieldtrack::domain {

/**
 * @struct RetryPolicy
 * @brief How many times to look for a freshly created directory and how long to wait between looks.
 */
struct RetryPolicy {
    int maxAttempts = 2;
    std::chrono::milliseconds delay{500};
};

/**
 * @struct VerificationPolicy
 * @brief Retry budgets selected by the cloud-sync classification of the base path.
 */
struct VerificationPolicy {
    RetryPolicy cloudSynced{5, std::chrono::milliseconds(1000)}; ///< Absorbs sync-client replication lag.
    RetryPolicy local{2, std::chrono::milliseconds(500)};        ///< Absorbs OS scheduling noise only.

    const RetryPolicy& select(bool isCloudSynced) const {
        return isCloudSynced ? cloudSynced : local;
    }
};

} // namespace fieldtrack::domain
