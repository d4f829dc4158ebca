//
// RecordingSink.hpp
//

#ifndef POLYBOARD_RECORDINGSINK_HPP
#define POLYBOARD_RECORDINGSINK_HPP

#include <algorithm>
#include <vector>

#include "../core/Events.hpp"

namespace polyboard::core::debug
{
    // Keeps every published event, in order.
    class RecordingSink final : public EventSink
    {
    public:
        auto Publish(MatchEvent const& event) -> void override
        {
            events_.push_back(event);
        }

        auto Events() const -> std::vector<MatchEvent> const&
        {
            return events_;
        }

        template <typename T>
        auto OfType() const -> std::vector<T>
        {
            std::vector<T> out;
            for (MatchEvent const& e : events_)
            {
                if (T const* t = std::get_if<T>(&e)) out.push_back(*t);
            }
            return out;
        }

        template <typename T>
        auto Count() const -> std::size_t
        {
            return static_cast<std::size_t>(std::ranges::count_if(events_,
                [](MatchEvent const& e) { return std::holds_alternative<T>(e); }));
        }

        // Index of the first T at or after `from`; events_.size() if none.
        template <typename T>
        auto IndexOf(std::size_t from = 0) const -> std::size_t
        {
            for (std::size_t i = from; i < events_.size(); ++i)
            {
                if (std::holds_alternative<T>(events_[i])) return i;
            }
            return events_.size();
        }

        auto Clear() -> void { events_.clear(); }

    private:
        std::vector<MatchEvent> events_;
    };
}

#endif //POLYBOARD_RECORDINGSINK_HPP
