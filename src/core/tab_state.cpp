#include "tab_state.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <sstream>
#include <unordered_set>

namespace tabsync
{

size_t TabState::index_of(const TabId& id) const
{
    auto it = std::find(order.begin(), order.end(), id);
    if (it == order.end())
        return NO_INDEX;
    return static_cast<size_t>(it - order.begin());
}

const TabItem* TabState::find(const TabId& id) const
{
    auto it = tabs.find(id);
    return it == tabs.end() ? nullptr : &it->second;
}

TabItem* TabState::find(const TabId& id)
{
    auto it = tabs.find(id);
    return it == tabs.end() ? nullptr : &it->second;
}

std::vector<TabItem> TabState::ordered_items() const
{
    std::vector<TabItem> items;
    items.reserve(order.size());
    for (const auto& id : order)
    {
        if (const TabItem* item = find(id))
            items.push_back(*item);
    }
    return items;
}

std::vector<std::string> TabState::check_invariants() const
{
    std::vector<std::string> errors;

    if (order.size() != tabs.size())
    {
        errors.push_back("order has " + std::to_string(order.size()) + " entries but "
                         + std::to_string(tabs.size()) + " tabs exist");
    }

    std::unordered_set<TabId> seen;
    for (const auto& id : order)
    {
        if (!seen.insert(id).second)
            errors.push_back("duplicate id in order: " + id);
        if (tabs.find(id) == tabs.end())
            errors.push_back("order references unknown tab: " + id);
    }
    for (const auto& [id, item] : tabs)
    {
        if (seen.find(id) == seen.end())
            errors.push_back("tab missing from order: " + id);
        if (item.id != id)
            errors.push_back("tab keyed as " + id + " carries id " + item.id);
    }

    if (pinned_id)
    {
        if (order.empty() || order.front() != *pinned_id)
            errors.push_back("pinned tab " + *pinned_id + " is not at index 0");
    }

    if (active_id)
    {
        if (tabs.find(*active_id) == tabs.end())
            errors.push_back("active tab " + *active_id + " does not exist");
    }
    else if (!tabs.empty())
    {
        errors.push_back("no active tab while tabs exist");
    }

    return errors;
}

void move_index(std::vector<TabId>& order, size_t from, size_t to)
{
    if (from >= order.size() || to >= order.size() || from == to)
        return;

    TabId moved = std::move(order[from]);
    order.erase(order.begin() + static_cast<std::ptrdiff_t>(from));
    order.insert(order.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));
}

// ─── String conversions ──────────────────────────────────────────────────────

TabStats count_tabs(const TabState& state)
{
    TabStats stats;
    stats.total = state.tabs.size();
    for (const auto& [id, item] : state.tabs)
    {
        if (state.active_id && *state.active_id == id)
            ++stats.active;
        if (item.is_pinned)
            ++stats.pinned;
        if (item.is_loading)
            ++stats.loading;
    }
    return stats;
}

std::string stats_to_string(const TabStats& stats)
{
    return "total=" + std::to_string(stats.total) + " active=" + std::to_string(stats.active)
           + " pinned=" + std::to_string(stats.pinned) + " loading=" + std::to_string(stats.loading);
}

std::optional<TabStats> stats_from_string(std::string_view text)
{
    struct Field
    {
        std::string_view key;
        size_t TabStats::*member;
    };
    static constexpr Field FIELDS[] = {
        {"total", &TabStats::total},
        {"active", &TabStats::active},
        {"pinned", &TabStats::pinned},
        {"loading", &TabStats::loading},
    };

    TabStats           stats;
    unsigned           seen = 0;
    std::istringstream is{std::string(text)};
    std::string        word;
    while (is >> word)
    {
        auto eq = word.find('=');
        if (eq == std::string::npos)
            return std::nullopt;
        std::string_view key(word.data(), eq);
        const char*      first = word.data() + eq + 1;
        const char*      last  = word.data() + word.size();
        size_t           value = 0;
        auto [ptr, ec]         = std::from_chars(first, last, value);
        if (first == last || ec != std::errc() || ptr != last)
            return std::nullopt;

        for (unsigned i = 0; i < std::size(FIELDS); ++i)
        {
            if (FIELDS[i].key == key)
            {
                stats.*(FIELDS[i].member) = value;
                seen |= 1u << i;
            }
        }
    }
    if (seen != (1u << std::size(FIELDS)) - 1)
        return std::nullopt;
    return stats;
}

std::string_view reason_to_string(SnapshotReason reason)
{
    switch (reason)
    {
        case SnapshotReason::Routine:
            return "routine";
        case SnapshotReason::Immediate:
            return "immediate";
    }
    return "routine";
}

std::optional<SnapshotReason> reason_from_string(std::string_view name)
{
    if (name == "routine")
        return SnapshotReason::Routine;
    if (name == "immediate")
        return SnapshotReason::Immediate;
    return std::nullopt;
}

std::string_view error_to_string(TabError err)
{
    switch (err)
    {
        case TabError::None:
            return "None";
        case TabError::NotFound:
            return "NotFound";
        case TabError::InvalidIndex:
            return "InvalidIndex";
        case TabError::PinnedViolation:
            return "PinnedViolation";
        case TabError::InvalidUrl:
            return "InvalidUrl";
        case TabError::MaxTabsExceeded:
            return "MaxTabsExceeded";
        case TabError::Malformed:
            return "Malformed";
        case TabError::Transport:
            return "Transport";
        case TabError::Timeout:
            return "Timeout";
    }
    return "Unknown";
}

std::optional<TabError> error_from_string(std::string_view name)
{
    static constexpr TabError all[] = {TabError::None,
                                       TabError::NotFound,
                                       TabError::InvalidIndex,
                                       TabError::PinnedViolation,
                                       TabError::InvalidUrl,
                                       TabError::MaxTabsExceeded,
                                       TabError::Malformed,
                                       TabError::Transport,
                                       TabError::Timeout};
    for (TabError e : all)
    {
        if (error_to_string(e) == name)
            return e;
    }
    return std::nullopt;
}

}   // namespace tabsync
