#include "shell_session.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <ostream>
#include <sstream>
#include <tabsync/logger.hpp>
#include <thread>

namespace tabsync
{

namespace
{

std::vector<std::string> split_words(const std::string& line)
{
    std::vector<std::string> words;
    std::istringstream       is(line);
    std::string              word;
    while (is >> word)
        words.push_back(word);
    return words;
}

std::string rest_after(const std::string& line, size_t words_to_skip)
{
    size_t pos = 0;
    for (size_t i = 0; i < words_to_skip; ++i)
    {
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string::npos)
            return {};
        pos = line.find_first_of(" \t", pos);
        if (pos == std::string::npos)
            return {};
    }
    pos = line.find_first_not_of(" \t", pos);
    return pos == std::string::npos ? std::string{} : line.substr(pos);
}

}   // namespace

ShellSession::ShellSession(EventLoop&             loop,
                           ipc::AuthorityChannel& channel,
                           const TabsyncConfig&   config,
                           std::ostream&          out)
    : loop_(loop),
      channel_(channel),
      out_(out),
      store_(loop, channel, std::chrono::milliseconds(config.suppression_timeout_ms)),
      drag_(store_, strip_)
{
    drag_.set_drag_threshold(config.drag_threshold_px);
    store_.set_visual_fallback(&strip_);
    strip_listener_ = store_.subscribe(
        [this](ReplicaStore::ChangeKind kind)
        {
            if (kind == ReplicaStore::ChangeKind::State)
                strip_.sync(store_.state());
        });
    store_.attach();
}

ShellSession::~ShellSession()
{
    store_.unsubscribe(strip_listener_);
    store_.set_visual_fallback(nullptr);
    store_.detach();
}

void ShellSession::settle(std::chrono::milliseconds duration)
{
    const auto deadline = loop_.now() + duration;
    do
    {
        if (pump_)
        {
            auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - loop_.now());
            int  wait      = static_cast<int>(std::clamp<int64_t>(remaining.count(), 0, 10));
            if (!pump_(wait) && !authority_lost_)
            {
                authority_lost_ = true;
                out_ << "authority connection lost\n";
            }
        }
        else if (duration.count() > 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        loop_.run_until_idle();
    } while (loop_.now() < deadline);
}

bool ShellSession::parse_index(const std::string& token, size_t& out) const
{
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr != token.data() + token.size())
    {
        out_ << "not an index: " << token << "\n";
        return false;
    }
    if (value >= strip_.element_count())
    {
        out_ << "no tab at " << value << " (" << strip_.element_count() << " tabs)\n";
        return false;
    }
    out = value;
    return true;
}

const TabId* ShellSession::tab_at(size_t index) const
{
    if (index >= strip_.element_count())
        return nullptr;
    return &strip_.element_id(index);
}

bool ShellSession::execute(const std::string& line)
{
    auto words = split_words(line);
    if (words.empty())
        return true;

    const std::string& cmd = words[0];
    size_t             a = 0, b = 0;

    if (cmd == "quit" || cmd == "exit")
        return false;

    if (cmd == "help")
    {
        print_help();
    }
    else if (cmd == "list")
    {
        print_tabs();
    }
    else if (cmd == "open" && words.size() >= 2)
    {
        CreateOptions options;
        if (words.size() >= 3 && words[2] == "background")
            options.position = CreateOptions::Position::Background;
        else if (words.size() >= 3 && words[2] == "first")
            options.position = CreateOptions::Position::First;
        store_.request_create(words[1], options);
    }
    else if (cmd == "close" && words.size() == 2 && parse_index(words[1], a))
    {
        store_.request_close(*tab_at(a));
    }
    else if (cmd == "activate" && words.size() == 2 && parse_index(words[1], a))
    {
        store_.request_activate(*tab_at(a));
    }
    else if (cmd == "dup" && words.size() == 2 && parse_index(words[1], a))
    {
        store_.request_duplicate(*tab_at(a));
    }
    else if (cmd == "only" && words.size() == 2 && parse_index(words[1], a))
    {
        store_.request_close_others(*tab_at(a));
    }
    else if (cmd == "closeall" && words.size() == 1)
    {
        store_.request_close_all();
    }
    else if (cmd == "openall" && words.size() >= 2)
    {
        store_.request_create_batch(std::vector<std::string>(words.begin() + 1, words.end()));
    }
    else if (cmd == "counts" && words.size() == 1)
    {
        store_.request_stats(
            [this](const Result<TabStats>& r)
            {
                if (!r.ok())
                {
                    out_ << "counts failed: " << r.message() << "\n";
                    return;
                }
                const auto& c = r.value();
                out_ << "total " << c.total << ", active " << c.active << ", pinned " << c.pinned
                     << ", loading " << c.loading << "\n";
            });
    }
    else if (cmd == "move" && words.size() == 3 && parse_index(words[1], a) && parse_index(words[2], b))
    {
        store_.apply_local_reorder(a, b);
    }
    else if (cmd == "drag" && words.size() == 3 && parse_index(words[1], a) && parse_index(words[2], b))
    {
        simulate_drag(a, b);
    }
    else if (cmd == "title" && words.size() >= 3 && parse_index(words[1], a))
    {
        channel_.invoke(ipc::Command::update_title(*tab_at(a), rest_after(line, 2)),
                        [this](const ipc::CommandResponse& r)
                        {
                            if (!r.success)
                                out_ << "title failed: " << r.error << "\n";
                        });
    }
    else if (cmd == "loading" && words.size() == 3 && parse_index(words[1], a))
    {
        channel_.invoke(ipc::Command::set_loading(*tab_at(a), words[2] == "on"),
                        [this](const ipc::CommandResponse& r)
                        {
                            if (!r.success)
                                out_ << "loading failed: " << r.error << "\n";
                        });
    }
    else if (cmd == "wait" && words.size() == 2)
    {
        int ms = std::atoi(words[1].c_str());
        settle(std::chrono::milliseconds(std::max(ms, 0)));
        return true;
    }
    else if (cmd == "stats")
    {
        const auto& s = store_.stats();
        out_ << "applied " << s.applied_snapshots << ", dropped " << s.dropped_snapshots << ", rejected "
             << s.rejected_snapshots << ", reorders " << s.local_reorders << ", rollbacks " << s.rollbacks
             << ", failed commands " << s.failed_commands << ", suppression "
             << (store_.suppression_active() ? "on" : "off") << "\n";
    }
    else
    {
        out_ << "unknown or incomplete command: " << line << " (try 'help')\n";
    }

    // Remote authorities need a round trip before the response and the
    // immediate snapshot are in.
    settle(pump_ ? REMOTE_SETTLE : std::chrono::milliseconds::zero());
    return true;
}

void ShellSession::simulate_drag(size_t from, size_t to)
{
    Rect  src = strip_.element_bounds(from);
    Rect  dst = strip_.element_bounds(to);
    float y   = src.y + src.h * 0.5f;

    // Land just inside the far edge of the target so its midpoint is passed
    // (moving right) or not yet reached (moving left).
    float x = to > from ? dst.right() - 1.0f : dst.x + 1.0f;

    drag_.on_pointer_down(src.center_x() - TabStrip::CLOSE_BUTTON_SIZE, y);
    drag_.on_pointer_move(x, y);
    if (!drag_.is_dragging())
    {
        out_ << "tab " << from << " cannot be dragged\n";
        drag_.cancel(TabDragController::CancelReason::PointerCaptureLost);
        return;
    }
    drag_.on_pointer_up(x, y);
}

void ShellSession::print_tabs() const
{
    const auto& state = store_.state();
    if (state.empty())
    {
        out_ << "(no tabs)\n";
        return;
    }
    for (size_t i = 0; i < state.order.size(); ++i)
    {
        const TabItem* item = state.find(state.order[i]);
        if (!item)
            continue;
        bool active = state.active_id && *state.active_id == item->id;
        out_ << (active ? " *" : "  ") << "[" << i << "] " << item->title << "  " << item->url << "  ("
             << item->id << ")";
        if (item->is_pinned)
            out_ << " pinned";
        if (item->is_loading)
            out_ << " loading";
        out_ << "\n";
    }
}

void ShellSession::print_help() const
{
    out_ << "list                      show tabs\n"
            "open <url> [background|first]\n"
            "close <n> | activate <n> | dup <n> | only <n>\n"
            "closeall                  close everything but the pinned tab\n"
            "openall <url>...          open several tabs in the background\n"
            "counts                    tab counts reported by the authority\n"
            "move <from> <to>          local reorder\n"
            "drag <from> <to>          reorder through a simulated pointer drag\n"
            "title <n> <text> | loading <n> on|off\n"
            "wait <ms>                 let pushes and timers run\n"
            "stats | help | quit\n";
}

}   // namespace tabsync
