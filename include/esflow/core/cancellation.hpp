#pragma once

/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for long-running store and bus calls
 */

#include <atomic>
#include <memory>

namespace esflow {

/**
 * @brief Read side of a cancellation flag
 *
 * A default-constructed token can never be cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    [[nodiscard]] bool can_be_cancelled() const noexcept {
        return static_cast<bool>(flag_);
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<const std::atomic<bool>> flag_;
};

/**
 * @brief Owner of a cancellation flag; hands out tokens
 */
class CancellationSource {
public:
    CancellationSource()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] CancellationToken token() const {
        return CancellationToken(flag_);
    }

    /**
     * @brief Request cancellation; observers see it on their next check
     */
    void cancel() noexcept {
        flag_->store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace esflow
