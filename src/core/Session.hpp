//
// Session.hpp
//

#ifndef POLYBOARD_SESSION_HPP
#define POLYBOARD_SESSION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include "Actions.hpp"
#include "Match.hpp"
#include "TurnResolver.hpp"

namespace polyboard::core
{
    using Outcome = TurnResolver::Result;

    struct PendingIntent
    {
        Intent                 intent{};
        std::promise<Outcome>  promise{};
    };

    // FIFO shared by submitters and the thread that pumps the match.
    class IntentQueue
    {
    public:
        IntentQueue() = default;

        auto push(PendingIntent p) -> void;
        // Pop until absolute deadline; returns false on timeout.
        auto pop_until(std::chrono::steady_clock::time_point deadline, PendingIntent& out) -> bool;
        auto try_pop(PendingIntent& out) -> bool;
        auto drain() -> std::deque<PendingIntent>;
        auto size() const -> std::size_t;

    private:
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::deque<PendingIntent> q_;
    };

    // Owns one match and applies its intents strictly one at a time.
    class MatchSession
    {
    public:
        MatchSession() = delete;
        explicit MatchSession(std::unique_ptr<MatchState> match);
        ~MatchSession();

        MatchSession(MatchSession const&) = delete;
        auto operator=(MatchSession const&) -> MatchSession& = delete;

        // Thread safe. After Abort the future is already rejected with Match_Aborted.
        auto Submit(Intent intent) -> std::future<Outcome>;

        // Resolves everything queued so far; returns how many intents were handled.
        auto Pump() -> std::size_t;
        // Waits up to `deadline` for one intent and resolves it.
        auto PumpUntil(std::chrono::steady_clock::time_point deadline) -> bool;

        // Rejects pending intents and destroys the match between two resolutions.
        auto Abort() -> void;
        auto IsAborted() const noexcept -> bool { return aborted_.load(); }

        auto Subscribe(EventSink* sink) -> void;
        // nullptr once aborted
        auto Snapshot(PlayerIdT viewer) const -> std::shared_ptr<MatchSnapshot const>;
        auto IsOver() const -> bool;
        auto Pending() const -> std::size_t { return queue_.size(); }

    private:
        auto Resolve(PendingIntent& p) -> void;
        static auto Rejected(Intent const& intent) -> Outcome;

    private:
        mutable std::mutex            resolve_mx_;
        std::unique_ptr<MatchState>   match_;
        std::unique_ptr<TurnResolver> resolver_;
        IntentQueue                   queue_;
        std::atomic<bool>             aborted_{false};
    };
}

#endif //POLYBOARD_SESSION_HPP
