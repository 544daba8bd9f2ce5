#pragma once

#include <cassert>
#include <cstddef>
#include <utility>
#include <variant>
#include <vector>

namespace veil {

/** Append-only record of the events a contract emitted.

    Events are an output channel only; nothing in the system reads them
    back to make decisions.
*/
template <class... Events>
class EventLog
{
public:
    using value_type = std::variant<Events...>;

    template <class E>
    void
    emit(E&& event)
    {
        entries_.emplace_back(std::forward<E>(event));
    }

    std::vector<value_type> const&
    entries() const
    {
        return entries_;
    }

    std::size_t
    size() const
    {
        return entries_.size();
    }

    bool
    empty() const
    {
        return entries_.empty();
    }

    /** Most recent event. The log must not be empty. */
    value_type const&
    back() const
    {
        assert(!entries_.empty());
        return entries_.back();
    }

    /** Number of recorded events of type E. */
    template <class E>
    std::size_t
    count() const
    {
        std::size_t n = 0;
        for (auto const& e : entries_)
            if (std::holds_alternative<E>(e))
                ++n;
        return n;
    }

private:
    std::vector<value_type> entries_;
};

}  // namespace veil
