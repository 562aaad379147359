//
// Mailbox.hpp — unbounded FIFO feeding an actor's worker thread
//

#ifndef CARDCLASH_MAILBOX_HPP
#define CARDCLASH_MAILBOX_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace clash::core
{
    template <typename T>
    class Mailbox
    {
    public:
        Mailbox() = default;

        Mailbox(Mailbox const&) = delete;
        auto operator=(Mailbox const&) -> Mailbox& = delete;

        // Never blocks. False once the mailbox is closed.
        auto Push(T item) -> bool
        {
            {
                std::lock_guard<std::mutex> lock(m_);
                if (closed_)
                {
                    return false;
                }
                q_.push_back(std::move(item));
            }
            cv_.notify_one();
            return true;
        }

        // Blocks until an item is available. False when closed and drained.
        auto Pop(T& out) -> bool
        {
            std::unique_lock<std::mutex> lock(m_);
            cv_.wait(lock, [&]() { return closed_ || !q_.empty(); });
            if (q_.empty())
            {
                return false;
            }
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        // Pop an item until absolute deadline; returns false on timeout or when closed and drained.
        auto PopUntil(T& out, std::chrono::steady_clock::time_point deadline) -> bool
        {
            std::unique_lock<std::mutex> lock(m_);
            if (!cv_.wait_until(lock, deadline, [&]() { return closed_ || !q_.empty(); }))
            {
                return false;
            }
            if (q_.empty())
            {
                return false;
            }
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        // Non-blocking pop (for drains / close)
        auto TryPop(T& out) -> bool
        {
            std::lock_guard<std::mutex> lock(m_);
            if (q_.empty())
            {
                return false;
            }
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        // Refuse new items; queued ones can still be popped.
        auto Close() -> void
        {
            {
                std::lock_guard<std::mutex> lock(m_);
                closed_ = true;
            }
            cv_.notify_all();
        }

    private:
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::deque<T> q_;
        bool closed_{false};
    };
}

#endif //CARDCLASH_MAILBOX_HPP
