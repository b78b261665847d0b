#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tabsync/fwd.hpp>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace tabsync
{

// ─── Tab item ────────────────────────────────────────────────────────────────

struct TabItem
{
    TabId       id;
    std::string url;
    std::string title;
    std::string favicon_ref;
    bool        is_loading = false;
    bool        is_pinned  = false;

    bool operator==(const TabItem&) const = default;
};

// ─── Tab state ───────────────────────────────────────────────────────────────
// The ordered tab set as seen by one party. The registry owns the canonical
// copy; the replica store owns the last-known copy.
//
// Invariants (checked by check_invariants()):
//   - order is a permutation of the keys of tabs
//   - pinned_id, if set, is at order[0]
//   - active_id, if set, is a key of tabs; it is only empty when tabs is empty

struct TabState
{
    std::unordered_map<TabId, TabItem> tabs;
    std::vector<TabId>                 order;
    std::optional<TabId>               active_id;
    std::optional<TabId>               pinned_id;

    bool   empty() const { return order.empty(); }
    size_t size() const { return order.size(); }

    // Position of `id` in order, or NO_INDEX.
    size_t index_of(const TabId& id) const;

    const TabItem* find(const TabId& id) const;
    TabItem*       find(const TabId& id);

    // Lowest order index a non-pinned tab may occupy (1 with a pinned tab).
    size_t first_movable_index() const { return pinned_id ? 1 : 0; }

    // Tabs in display order. Entries missing from the map are skipped.
    std::vector<TabItem> ordered_items() const;

    // Returns a human-readable description of each violated invariant.
    std::vector<std::string> check_invariants() const;
    bool                     is_consistent() const { return check_invariants().empty(); }

    bool operator==(const TabState&) const = default;
};

// Remove-then-insert: the element at `from` ends up at index `to` of the
// resulting sequence. Both indices must be < order.size().
void move_index(std::vector<TabId>& order, size_t from, size_t to);

// ─── Tab counts ──────────────────────────────────────────────────────────────

struct TabStats
{
    size_t total   = 0;
    size_t active  = 0;   // 0 or 1
    size_t pinned  = 0;   // 0 or 1
    size_t loading = 0;

    bool operator==(const TabStats&) const = default;
};

TabStats count_tabs(const TabState& state);

// "total=4 active=1 pinned=1 loading=2"; the parser wants all four fields.
std::string             stats_to_string(const TabStats& stats);
std::optional<TabStats> stats_from_string(std::string_view text);

// ─── Snapshot ────────────────────────────────────────────────────────────────

enum class SnapshotReason : uint8_t
{
    Routine   = 0,   // periodic reconciliation or change from elsewhere
    Immediate = 1,   // direct consequence of this session's own command
};

std::string_view               reason_to_string(SnapshotReason reason);
std::optional<SnapshotReason>  reason_from_string(std::string_view name);

// Immutable, full-replace description of authority state.
struct Snapshot
{
    TabState       state;
    SnapshotReason reason   = SnapshotReason::Routine;
    uint64_t       revision = 0;

    bool operator==(const Snapshot&) const = default;
};

// ─── Errors ──────────────────────────────────────────────────────────────────

enum class TabError : uint8_t
{
    None = 0,
    NotFound,
    InvalidIndex,
    PinnedViolation,
    InvalidUrl,
    MaxTabsExceeded,
    Malformed,
    Transport,
    Timeout,
};

std::string_view          error_to_string(TabError err);
std::optional<TabError>   error_from_string(std::string_view name);

// Value-or-error return for registry operations.
template <typename T>
class Result
{
   public:
    Result(T value) : value_(std::move(value)) {}
    Result(TabError error, std::string message = {})
        : value_(Failure{error, std::move(message)})
    {
    }

    bool ok() const { return std::holds_alternative<T>(value_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(value_); }
    T&       value() { return std::get<T>(value_); }

    TabError error() const
    {
        return ok() ? TabError::None : std::get<Failure>(value_).error;
    }
    const std::string& message() const
    {
        static const std::string empty;
        return ok() ? empty : std::get<Failure>(value_).message;
    }

   private:
    struct Failure
    {
        TabError    error;
        std::string message;
    };
    std::variant<T, Failure> value_;
};

// Result for operations with no payload.
struct Done
{
};
using Status = Result<Done>;

inline Status ok_status()
{
    return Status(Done{});
}

// ─── Create options ──────────────────────────────────────────────────────────

struct CreateOptions
{
    enum class Position : uint8_t
    {
        Last = 0,     // append and activate
        First,        // first movable slot (after the pinned tab)
        Index,        // at `index`, clamped to the movable range
        Background,   // append without activating
    };

    std::string title;   // empty = derive from url
    bool        pinned   = false;
    Position    position = Position::Last;
    size_t      index    = 0;
    bool        activate = true;
};

}   // namespace tabsync
