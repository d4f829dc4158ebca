//
// Session.cpp
//

#include "Session.hpp"

#include <print>
#include "Exception.hpp"

namespace polyboard::core
{
    auto IntentQueue::push(PendingIntent p) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        q_.push_back(std::move(p));
        cv_.notify_one();
    }

    auto IntentQueue::pop_until(std::chrono::steady_clock::time_point deadline, PendingIntent& out) -> bool
    {
        std::unique_lock<std::mutex> lock(m_);
        while (q_.empty())
        {
            if (cv_.wait_until(lock, deadline) == std::cv_status::timeout)
            {
                if (q_.empty()) return false;
                break;
            }
        }
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    auto IntentQueue::try_pop(PendingIntent& out) -> bool
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

    auto IntentQueue::drain() -> std::deque<PendingIntent>
    {
        std::lock_guard<std::mutex> lock(m_);
        std::deque<PendingIntent> out;
        out.swap(q_);
        return out;
    }

    auto IntentQueue::size() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(m_);
        return q_.size();
    }

    MatchSession::MatchSession(std::unique_ptr<MatchState> match) :
        match_(std::move(match))
    {
        if (!match_)
            PBD_THROW(error::Code::State, "Session needs a match");
        resolver_ = std::make_unique<TurnResolver>(*match_);
        std::print("[Session] Match started | archetype={} | players={} | seed={}\n",
                   to_string(match_->Kind()), match_->PlayerCount(), match_->Seed());
    }

    MatchSession::~MatchSession()
    {
        // never leave a submitter waiting on a broken promise
        for (PendingIntent& p : queue_.drain())
        {
            p.promise.set_value(Rejected(p.intent));
        }
    }

    auto MatchSession::Rejected(Intent const& intent) -> Outcome
    {
        return std::unexpected(error::RuleViolation{ .code = error::RuleViolationCode::Match_Aborted }
                               .with_actor(intent.player));
    }

    auto MatchSession::Submit(Intent intent) -> std::future<Outcome>
    {
        PendingIntent p{ .intent = intent };
        std::future<Outcome> fut = p.promise.get_future();

        if (aborted_.load())
        {
            p.promise.set_value(Rejected(intent));
            return fut;
        }

        queue_.push(std::move(p));
        return fut;
    }

    auto MatchSession::Resolve(PendingIntent& p) -> void
    {
        std::lock_guard<std::mutex> lock(resolve_mx_);
        if (aborted_.load() || !resolver_)
        {
            p.promise.set_value(Rejected(p.intent));
            return;
        }

        try
        {
            p.promise.set_value(resolver_->ResolveIntent(p.intent));
        }
        catch (OmegaException<error::Code> const& e)
        {
            // engine misuse surfaces on the submitter's future, not the pump thread
            std::print("[Session] Resolution failed: {}\n", e.what());
            p.promise.set_exception(std::current_exception());
        }
    }

    auto MatchSession::Pump() -> std::size_t
    {
        std::size_t handled{};
        PendingIntent p{};
        while (queue_.try_pop(p))
        {
            Resolve(p);
            ++handled;
        }
        return handled;
    }

    auto MatchSession::PumpUntil(std::chrono::steady_clock::time_point deadline) -> bool
    {
        PendingIntent p{};
        if (!queue_.pop_until(deadline, p)) return false;
        Resolve(p);
        return true;
    }

    auto MatchSession::Abort() -> void
    {
        bool const was_aborted = aborted_.exchange(true);

        // waits for an in-flight resolution to finish
        std::lock_guard<std::mutex> lock(resolve_mx_);
        for (PendingIntent& p : queue_.drain())
        {
            p.promise.set_value(Rejected(p.intent));
        }

        if (!was_aborted)
        {
            resolver_.reset();
            match_.reset();
            std::print("[Session] Match aborted\n");
        }
    }

    auto MatchSession::Subscribe(EventSink* sink) -> void
    {
        std::lock_guard<std::mutex> lock(resolve_mx_);
        if (resolver_) resolver_->Subscribe(sink);
    }

    auto MatchSession::Snapshot(PlayerIdT const viewer) const -> std::shared_ptr<MatchSnapshot const>
    {
        std::lock_guard<std::mutex> lock(resolve_mx_);
        if (!match_) return nullptr;
        return match_->SnapshotFor(viewer);
    }

    auto MatchSession::IsOver() const -> bool
    {
        std::lock_guard<std::mutex> lock(resolve_mx_);
        return !match_ || match_->IsOver();
    }
}
