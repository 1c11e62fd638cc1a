#pragma once

#include <cstddef>
#include <deque>
#include <memory>

#include <asio.hpp>

namespace txgate::utils
{
    /**
     * @brief FIFO mutual exclusion for coroutines.
     *
     * A waiter parks on a steady_timer that never expires on its own; unlock() hands
     * ownership to the oldest waiter by cancelling its timer. The lock is never released
     * in between, so no third coroutine can slip in during the hand-off.
     *
     * The mutex itself is not synchronized. Owners call it from their strand.
     */
    class AsyncMutex
    {
        public:
            class Guard
            {
                public:
                    Guard() = default;
                    explicit Guard(AsyncMutex & mutex);

                    Guard(const Guard&) = delete;
                    Guard& operator=(const Guard&) = delete;

                    Guard(Guard && other) noexcept;
                    Guard& operator=(Guard && other) noexcept;

                    ~Guard();

                    void release();

                private:
                    AsyncMutex * _mutex = nullptr;
            };

            explicit AsyncMutex(asio::any_io_executor executor);

            AsyncMutex(const AsyncMutex&) = delete;
            AsyncMutex& operator=(const AsyncMutex&) = delete;

            asio::awaitable<void> lock();

            asio::awaitable<Guard> scopedLock();

            void unlock();

            bool locked() const noexcept;

            std::size_t waiting() const noexcept;

        private:
            asio::any_io_executor _executor;
            bool _locked = false;
            std::deque<std::shared_ptr<asio::steady_timer>> _waiters;
    };
}
