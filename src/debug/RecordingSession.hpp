//
// RecordingSession.hpp — Session that keeps everything the store publishes to it
//

#ifndef CARDCLASH_RECORDINGSESSION_HPP
#define CARDCLASH_RECORDINGSESSION_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "../core/Messages.hpp"
#include "../core/Session.hpp"

namespace clash::core::debug
{
    class RecordingSession final : public Session
    {
    public:
        // Optional inner session still receives every message.
        explicit RecordingSession(std::shared_ptr<Session> inner = nullptr)
            : inner_{std::move(inner)}
        {
        }

        auto Publish(OutboundMessage msg) -> void override
        {
            {
                std::lock_guard<std::mutex> lock(mx_);
                received_.push_back(msg);
            }
            cv_.notify_all();
            if (inner_)
            {
                inner_->Publish(std::move(msg));
            }
        }

        auto Received() const -> std::vector<OutboundMessage>
        {
            std::lock_guard<std::mutex> lock(mx_);
            return received_;
        }

        auto Count() const -> std::size_t
        {
            std::lock_guard<std::mutex> lock(mx_);
            return received_.size();
        }

        // Blocks until at least n messages arrived or the timeout elapsed.
        auto WaitFor(std::size_t n, std::chrono::milliseconds timeout) -> bool
        {
            std::unique_lock<std::mutex> lock(mx_);
            return cv_.wait_for(lock, timeout, [&]() { return received_.size() >= n; });
        }

        // Id from the Connected message, once it arrived.
        auto AssignedId() const -> std::optional<PlayerId>
        {
            std::lock_guard<std::mutex> lock(mx_);
            for (OutboundMessage const& m : received_)
            {
                if (auto const* c = std::get_if<ConnectedMsg>(&m))
                {
                    return c->id;
                }
            }
            return std::nullopt;
        }

        template <typename T>
        auto Last() const -> std::optional<T>
        {
            std::lock_guard<std::mutex> lock(mx_);
            for (auto it = received_.rbegin(); it != received_.rend(); ++it)
            {
                if (auto const* m = std::get_if<T>(&*it))
                {
                    return *m;
                }
            }
            return std::nullopt;
        }

    private:
        std::shared_ptr<Session> inner_;
        mutable std::mutex mx_;
        std::condition_variable cv_;
        std::vector<OutboundMessage> received_;
    };
} // namespace clash::core::debug

#endif //CARDCLASH_RECORDINGSESSION_HPP
