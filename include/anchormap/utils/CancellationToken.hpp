#ifndef ANCHORMAP_CANCELLATION_TOKEN_HPP
#define ANCHORMAP_CANCELLATION_TOKEN_HPP

#include "macros.hpp"
#include "errors.hpp"

#include <atomic>
#include <string>

/**
 * @file CancellationToken.hpp
 *
 * @brief Cooperative cancellation of long-running pipelines.
 */

namespace anchormap {

/**
 * @brief Flag for cooperative cancellation.
 *
 * A pointer to a token can be passed to the orchestrating classes, which will check it at each stage boundary.
 * Calling `cancel()` from another thread will cause the next check to throw a `CancelledError`.
 * Stages that are already running will finish before the cancellation takes effect.
 */
class CancellationToken {
public:
    /**
     * Request cancellation.
     */
    void cancel() {
        flag.store(true);
    }

    /**
     * @return Whether cancellation has been requested.
     */
    bool cancelled() const {
        return flag.load();
    }

    /**
     * @param stage Name of the stage that is about to start.
     * A `CancelledError` is thrown if cancellation has been requested.
     */
    void check(const std::string& stage) const {
        if (cancelled()) {
            throw CancelledError(stage);
        }
    }

private:
    std::atomic<bool> flag{false};
};

/**
 * @cond
 */
inline void check_cancelled(const CancellationToken* token, const std::string& stage) {
    if (token) {
        token->check(stage);
    }
}
/**
 * @endcond
 */

}

#endif
