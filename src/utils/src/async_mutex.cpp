#include "async_mutex.hpp"

#include <utility>

namespace txgate::utils
{
    AsyncMutex::Guard::Guard(AsyncMutex & mutex)
    : _mutex(&mutex)
    {
    }

    AsyncMutex::Guard::Guard(Guard && other) noexcept
    : _mutex(std::exchange(other._mutex, nullptr))
    {
    }

    AsyncMutex::Guard& AsyncMutex::Guard::operator=(Guard && other) noexcept
    {
        if(this != &other)
        {
            release();
            _mutex = std::exchange(other._mutex, nullptr);
        }
        return *this;
    }

    AsyncMutex::Guard::~Guard()
    {
        release();
    }

    void AsyncMutex::Guard::release()
    {
        if(_mutex != nullptr)
        {
            std::exchange(_mutex, nullptr)->unlock();
        }
    }

    AsyncMutex::AsyncMutex(asio::any_io_executor executor)
    : _executor(std::move(executor))
    {
    }

    asio::awaitable<void> AsyncMutex::lock()
    {
        if(!_locked)
        {
            _locked = true;
            co_return;
        }

        auto waiter = std::make_shared<asio::steady_timer>(_executor, asio::steady_timer::time_point::max());
        _waiters.push_back(waiter);

        // woken by unlock() through cancel(); ownership is already ours at that point
        asio::error_code ec;
        co_await waiter->async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }

    asio::awaitable<AsyncMutex::Guard> AsyncMutex::scopedLock()
    {
        co_await lock();
        co_return Guard(*this);
    }

    void AsyncMutex::unlock()
    {
        if(_waiters.empty())
        {
            _locked = false;
            return;
        }

        auto next = std::move(_waiters.front());
        _waiters.pop_front();
        next->cancel();
    }

    bool AsyncMutex::locked() const noexcept
    {
        return _locked;
    }

    std::size_t AsyncMutex::waiting() const noexcept
    {
        return _waiters.size();
    }
}
