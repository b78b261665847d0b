#include "tab_registry.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <tabsync/logger.hpp>

namespace tabsync::daemon
{

namespace
{

// 31-multiplier string hash, folded to a non-negative 32-bit value.
uint32_t url_hash(const std::string& s)
{
    int32_t h = 0;
    for (unsigned char c : s)
        h = static_cast<int32_t>(static_cast<uint32_t>(h) * 31u + c);
    return static_cast<uint32_t>(h < 0 ? -static_cast<int64_t>(h) : h);
}

}   // namespace

TabRegistry::TabRegistry(size_t max_tabs) : max_tabs_(max_tabs == 0 ? DEFAULT_MAX_TABS : max_tabs)
{
}

// --- Tab lifecycle ---

Result<TabId> TabRegistry::create(const std::string& url, const CreateOptions& options)
{
    std::lock_guard lock(mu_);
    return create_locked(url, options);
}

Result<TabId> TabRegistry::create_locked(const std::string& url, const CreateOptions& options)
{
    if (!is_valid_url(url))
    {
        TABSYNC_LOG_WARN("registry", "create rejected, invalid url '{}'", url);
        return {TabError::InvalidUrl, "invalid url: " + url};
    }
    if (state_.tabs.size() >= max_tabs_)
    {
        TABSYNC_LOG_WARN("registry", "create rejected, limit of {} tabs reached", max_tabs_);
        return {TabError::MaxTabsExceeded, "tab limit reached: " + std::to_string(max_tabs_)};
    }
    if (options.pinned && state_.pinned_id)
    {
        return {TabError::PinnedViolation, "a pinned tab already exists: " + *state_.pinned_id};
    }

    TabItem item;
    item.id         = generate_id(url);
    item.url        = url;
    item.title      = options.title.empty() ? default_title(url, options.pinned) : options.title;
    item.is_loading = true;
    item.is_pinned  = options.pinned;

    size_t pos = options.pinned ? 0 : insert_position(options);
    state_.order.insert(state_.order.begin() + static_cast<std::ptrdiff_t>(pos), item.id);
    if (options.pinned)
        state_.pinned_id = item.id;

    bool activate = options.activate && options.position != CreateOptions::Position::Background;
    if (activate || !state_.active_id)
        state_.active_id = item.id;

    TabId id = item.id;
    state_.tabs.emplace(id, std::move(item));
    bump_revision();

    TABSYNC_LOG_INFO("registry", "created tab {} at {} ({})", id, pos, url);
    return id;
}

Status TabRegistry::close(const TabId& id)
{
    std::lock_guard lock(mu_);
    return close_locked(id);
}

Status TabRegistry::close_locked(const TabId& id)
{
    if (state_.tabs.find(id) == state_.tabs.end())
        return {TabError::NotFound, "no such tab: " + id};
    if (state_.pinned_id && *state_.pinned_id == id)
    {
        TABSYNC_LOG_WARN("registry", "refusing to close pinned tab {}", id);
        return {TabError::PinnedViolation, "pinned tab cannot be closed"};
    }

    size_t index      = state_.index_of(id);
    bool   was_active = state_.active_id && *state_.active_id == id;

    state_.tabs.erase(id);
    if (index != NO_INDEX)
        state_.order.erase(state_.order.begin() + static_cast<std::ptrdiff_t>(index));

    if (was_active)
        activate_neighbour(index == NO_INDEX ? 0 : index);

    bump_revision();
    TABSYNC_LOG_INFO("registry", "closed tab {} ({} left)", id, state_.order.size());
    return ok_status();
}

void TabRegistry::activate_neighbour(size_t closed_index)
{
    if (state_.order.empty())
    {
        state_.active_id.reset();
        return;
    }
    // Prefer the tab that slid into the closed slot, then the one before it.
    if (closed_index < state_.order.size())
        state_.active_id = state_.order[closed_index];
    else
        state_.active_id = state_.order.back();
}

Status TabRegistry::switch_active(const TabId& id)
{
    std::lock_guard lock(mu_);
    if (state_.tabs.find(id) == state_.tabs.end())
        return {TabError::NotFound, "no such tab: " + id};
    if (state_.active_id && *state_.active_id == id)
        return ok_status();

    state_.active_id = id;
    bump_revision();
    return ok_status();
}

Status TabRegistry::reorder(const TabId& id, size_t target_index)
{
    std::lock_guard lock(mu_);

    size_t current = state_.index_of(id);
    if (current == NO_INDEX)
        return {TabError::NotFound, "no such tab: " + id};
    if (state_.pinned_id && (*state_.pinned_id == id || target_index == 0))
    {
        TABSYNC_LOG_WARN("registry", "reorder of {} to {} violates the pinned slot", id, target_index);
        return {TabError::PinnedViolation, "pinned slot cannot be a source or target"};
    }
    if (target_index >= state_.order.size())
    {
        return {TabError::InvalidIndex,
                "index " + std::to_string(target_index) + " out of range [0, "
                    + std::to_string(state_.order.size()) + ")"};
    }
    if (current == target_index)
        return ok_status();

    move_index(state_.order, current, target_index);
    bump_revision();
    TABSYNC_LOG_INFO("registry", "reordered {} {} -> {}", id, current, target_index);
    return ok_status();
}

// --- Content-driven updates ---

Status TabRegistry::update_title(const TabId& id, const std::string& title)
{
    std::lock_guard lock(mu_);
    TabItem* item = state_.find(id);
    if (!item)
        return {TabError::NotFound, "no such tab: " + id};
    if (item->title == title)
        return ok_status();
    item->title = title;
    bump_revision();
    return ok_status();
}

Status TabRegistry::set_loading(const TabId& id, bool loading)
{
    std::lock_guard lock(mu_);
    TabItem* item = state_.find(id);
    if (!item)
        return {TabError::NotFound, "no such tab: " + id};
    if (item->is_loading == loading)
        return ok_status();
    item->is_loading = loading;
    bump_revision();
    return ok_status();
}

// --- Bulk operations ---

Result<size_t> TabRegistry::close_others(const TabId& keep_id)
{
    std::lock_guard lock(mu_);
    if (state_.tabs.find(keep_id) == state_.tabs.end())
        return {TabError::NotFound, "no such tab: " + keep_id};

    std::vector<TabId> doomed;
    for (const auto& id : state_.order)
    {
        if (id != keep_id && !(state_.pinned_id && *state_.pinned_id == id))
            doomed.push_back(id);
    }

    size_t closed = 0;
    for (const auto& id : doomed)
    {
        if (close_locked(id).ok())
            ++closed;
    }

    if (!state_.active_id || *state_.active_id != keep_id)
    {
        state_.active_id = keep_id;
        bump_revision();
    }
    return closed;
}

Result<TabId> TabRegistry::duplicate(const TabId& id)
{
    std::lock_guard lock(mu_);
    const TabItem* source = state_.find(id);
    if (!source)
        return {TabError::NotFound, "no such tab: " + id};

    CreateOptions options;
    options.title    = source->title + " (copy)";
    options.position = CreateOptions::Position::Index;
    options.index    = state_.index_of(id) + 1;
    std::string url  = source->url;
    return create_locked(url, options);
}

Result<size_t> TabRegistry::close_all()
{
    std::lock_guard lock(mu_);

    std::vector<TabId> doomed;
    for (const auto& id : state_.order)
    {
        if (!(state_.pinned_id && *state_.pinned_id == id))
            doomed.push_back(id);
    }

    size_t closed = 0;
    for (const auto& id : doomed)
    {
        if (close_locked(id).ok())
            ++closed;
    }
    TABSYNC_LOG_INFO("registry", "closed all: {} tabs closed", closed);
    return closed;
}

Result<std::vector<TabId>> TabRegistry::create_batch(const std::vector<std::string>& urls)
{
    std::lock_guard lock(mu_);

    CreateOptions options;
    options.position = CreateOptions::Position::Background;

    std::vector<TabId> created;
    TabError           first_error = TabError::None;
    std::string        first_message;
    for (const auto& url : urls)
    {
        auto r = create_locked(url, options);
        if (r.ok())
        {
            created.push_back(r.value());
            continue;
        }
        if (first_error == TabError::None)
        {
            first_error   = r.error();
            first_message = r.message();
        }
    }

    if (created.size() != urls.size())
        TABSYNC_LOG_WARN("registry", "batch create: {} of {} urls failed", urls.size() - created.size(), urls.size());
    if (created.empty() && first_error != TabError::None)
        return Result<std::vector<TabId>>(first_error, first_message);
    return created;
}

// --- Snapshot / queries ---

Snapshot TabRegistry::snapshot(SnapshotReason reason) const
{
    std::lock_guard lock(mu_);
    Snapshot snap;
    snap.state    = state_;
    snap.reason   = reason;
    snap.revision = revision_;
    return snap;
}

TabState TabRegistry::state() const
{
    std::lock_guard lock(mu_);
    return state_;
}

uint64_t TabRegistry::revision() const
{
    std::lock_guard lock(mu_);
    return revision_;
}

size_t TabRegistry::tab_count() const
{
    std::lock_guard lock(mu_);
    return state_.tabs.size();
}

bool TabRegistry::has_tab(const TabId& id) const
{
    std::lock_guard lock(mu_);
    return state_.tabs.find(id) != state_.tabs.end();
}

TabStats TabRegistry::stats() const
{
    std::lock_guard lock(mu_);
    return count_tabs(state_);
}

std::vector<std::string> TabRegistry::check_invariants() const
{
    std::lock_guard lock(mu_);
    return state_.check_invariants();
}

// --- Helpers ---

bool TabRegistry::is_valid_url(const std::string& url)
{
    auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0)
        return false;
    if (!std::isalpha(static_cast<unsigned char>(url[0])))
        return false;
    for (size_t i = 1; i < sep; ++i)
    {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return false;
    }
    if (url.find_first_of(" \t\r\n") != std::string::npos)
        return false;
    return !host_of(url).empty();
}

std::string TabRegistry::host_of(const std::string& url)
{
    auto sep = url.find("://");
    if (sep == std::string::npos)
        return {};
    size_t begin = sep + 3;
    size_t end   = url.find_first_of("/?#", begin);
    std::string authority = url.substr(begin, end == std::string::npos ? std::string::npos : end - begin);

    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority.erase(0, at + 1);
    if (!authority.empty() && authority.front() == '[')
    {
        auto close = authority.find(']');
        return close == std::string::npos ? std::string{} : authority.substr(0, close + 1);
    }
    auto colon = authority.find(':');
    if (colon != std::string::npos)
        authority.erase(colon);
    return authority;
}

TabId TabRegistry::generate_id(const std::string& url)
{
    return "tab_" + std::to_string(next_tab_no_++) + "_" + std::to_string(url_hash(url));
}

std::string TabRegistry::default_title(const std::string& url, bool pinned) const
{
    if (pinned)
        return "Home";
    std::string host = host_of(url);
    return host.empty() ? std::string("New Tab") : host;
}

size_t TabRegistry::insert_position(const CreateOptions& options) const
{
    size_t lo = state_.first_movable_index();
    size_t hi = state_.order.size();
    switch (options.position)
    {
        case CreateOptions::Position::First:
            return lo;
        case CreateOptions::Position::Index:
            return std::clamp(options.index, lo, hi);
        case CreateOptions::Position::Last:
        case CreateOptions::Position::Background:
            break;
    }
    return hi;
}

}   // namespace tabsync::daemon
