#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "../core/tab_state.hpp"

namespace tabsync::daemon
{

// Authoritative tab registry owned by the authority process.
// All mutations go through this class; it validates every command, tracks a
// revision counter and produces snapshots.
// Thread-safe: all public methods lock the internal mutex.
class TabRegistry
{
   public:
    static constexpr size_t DEFAULT_MAX_TABS = 20;

    explicit TabRegistry(size_t max_tabs = DEFAULT_MAX_TABS);

    TabRegistry(const TabRegistry&)            = delete;
    TabRegistry& operator=(const TabRegistry&) = delete;

    // --- Tab lifecycle ---

    // Create a tab for `url`. Fails with InvalidUrl, MaxTabsExceeded, or
    // PinnedViolation (a second pinned tab).
    Result<TabId> create(const std::string& url, const CreateOptions& options = {});

    // Close a tab. The pinned tab cannot be closed. Closing the active tab
    // activates its right neighbour, else its left one.
    Status close(const TabId& id);

    Status switch_active(const TabId& id);

    // Move `id` so that it ends up at `target_index` (remove-then-insert).
    // Never clamps: out-of-range targets are InvalidIndex, anything touching
    // slot 0 while a pinned tab exists is PinnedViolation.
    Status reorder(const TabId& id, size_t target_index);

    // --- Content-driven updates ---

    Status update_title(const TabId& id, const std::string& title);
    Status set_loading(const TabId& id, bool loading);

    // --- Bulk operations ---

    // Close every non-pinned tab except `keep_id`, then activate it.
    // Returns the number of closed tabs.
    Result<size_t> close_others(const TabId& keep_id);

    // Open a copy of `id` right after it and activate the copy.
    Result<TabId> duplicate(const TabId& id);

    // Close every tab except the pinned one. Returns the number closed.
    Result<size_t> close_all();

    // Open each url in the background, appended in the given order. Urls that
    // fail are logged and skipped; the call only fails when none succeeded.
    Result<std::vector<TabId>> create_batch(const std::vector<std::string>& urls);

    // --- Snapshot / queries ---

    Snapshot      snapshot(SnapshotReason reason = SnapshotReason::Routine) const;
    TabState      state() const;
    uint64_t      revision() const;
    size_t        tab_count() const;
    size_t        max_tabs() const { return max_tabs_; }
    bool          has_tab(const TabId& id) const;
    TabStats      stats() const;
    std::vector<std::string> check_invariants() const;

    // --- Helpers exposed for tests ---

    static bool        is_valid_url(const std::string& url);
    static std::string host_of(const std::string& url);

   private:
    mutable std::mutex mu_;
    TabState           state_;
    uint64_t           revision_    = 0;
    uint64_t           next_tab_no_ = 1;
    size_t             max_tabs_;

    // Caller must hold the lock for everything below.
    void                  bump_revision() { ++revision_; }
    TabId                 generate_id(const std::string& url);
    std::string           default_title(const std::string& url, bool pinned) const;
    size_t                insert_position(const CreateOptions& options) const;
    void                  activate_neighbour(size_t closed_index);
    Result<TabId>         create_locked(const std::string& url, const CreateOptions& options);
    Status                close_locked(const TabId& id);
};

}   // namespace tabsync::daemon
