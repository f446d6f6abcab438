#pragma once

#include "dnd/core/types.hpp"
#include <cstddef>
#include <map>
#include <optional>

namespace dnd {

template<typename Value>
struct RefCounted
{
    size_t count = 1;
    Value value{};
};

/**
 * @brief Identifier-keyed map whose entries are reference counted.
 *
 * An entry exists iff the number of add() calls for its id exceeds the number
 * of remove() calls. The UI layer may mount a reused identifier before the
 * unmount of its previous owner is delivered (add, add, remove); counting keeps
 * the second registration alive when the stale remove arrives.
 *
 * Unknown identifiers are never an error: update() and remove() on an absent id
 * do nothing, since geometry callbacks can race with mount/unmount.
 *
 * Iteration is in identifier order, so scans over the registry are
 * deterministic for identical contents.
 */
template<typename Value>
class RefRegistry
{
public:
    using Entry = RefCounted<Value>;
    using Map = std::map<ElementId, Entry>;
    using const_iterator = typename Map::const_iterator;

    /// Insert with count 1, or bump the count and overwrite the value.
    void add(ElementId id, Value const& value)
    {
        auto it = entries_.find(id);
        if (it == entries_.end())
        {
            entries_.emplace(id, Entry{ 1, value });
            return;
        }
        ++it->second.count;
        it->second.value = value;
    }

    /// Overwrite the value of a present entry. Returns false if absent.
    bool update(ElementId id, Value const& value)
    {
        auto it = entries_.find(id);
        if (it == entries_.end())
            return false;
        it->second.value = value;
        return true;
    }

    /// Drop one reference. Returns false if absent.
    bool remove(ElementId id)
    {
        auto it = entries_.find(id);
        if (it == entries_.end())
            return false;
        if (it->second.count > 1)
            --it->second.count;
        else
            entries_.erase(it);
        return true;
    }

    std::optional<Value> get(ElementId id) const
    {
        auto it = entries_.find(id);
        if (it == entries_.end())
            return std::nullopt;
        return it->second.value;
    }

    /// Outstanding add() calls for id, 0 if absent
    size_t count(ElementId id) const
    {
        auto it = entries_.find(id);
        return it == entries_.end() ? 0 : it->second.count;
    }

    bool contains(ElementId id) const { return entries_.contains(id); }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    Map entries_;
};

} // namespace dnd
