#include "tab_strip.hpp"

#include <algorithm>
#include <unordered_map>

namespace tabsync
{

TabStrip::TabStrip()
    : measure_([](const std::string& s) { return static_cast<float>(s.size()) * 7.0f; })
{
}

void TabStrip::set_origin(float x, float y)
{
    origin_x_ = x;
    origin_y_ = y;
    relayout();
}

void TabStrip::set_text_measure(TextMeasure measure)
{
    if (!measure)
        return;
    measure_ = std::move(measure);
    relayout();
}

void TabStrip::sync(const TabState& state)
{
    struct Visual
    {
        float opacity;
        float scale;
    };
    std::unordered_map<TabId, Visual> visuals;
    for (const auto& e : elements_)
    {
        if (e.opacity != 1.0f || e.scale != 1.0f)
            visuals.emplace(e.id, Visual{e.opacity, e.scale});
    }

    TabId hovered_id;
    if (hovered_ < elements_.size())
        hovered_id = elements_[hovered_].id;

    elements_.clear();
    elements_.reserve(state.order.size());
    hovered_ = NO_INDEX;

    for (const auto& id : state.order)
    {
        const TabItem* item = state.find(id);
        if (!item)
            continue;

        Element e;
        e.id      = id;
        e.title   = item->title;
        e.pinned  = state.pinned_id && *state.pinned_id == id;
        e.active  = state.active_id && *state.active_id == id;
        e.loading = item->is_loading;

        auto it = visuals.find(id);
        if (it != visuals.end())
        {
            e.opacity = it->second.opacity;
            e.scale   = it->second.scale;
        }
        if (!hovered_id.empty() && hovered_id == id)
        {
            e.hovered = true;
            hovered_  = elements_.size();
        }
        elements_.push_back(std::move(e));
    }

    relayout();
}

void TabStrip::relayout()
{
    float current_x = origin_x_;
    for (auto& e : elements_)
    {
        const bool closable = !e.pinned;

        // Calculate tab width based on title
        float tab_width = std::clamp(measure_(e.title) + TAB_PADDING * 2 + (closable ? CLOSE_BUTTON_SIZE : 0),
                                     TAB_MIN_WIDTH,
                                     TAB_MAX_WIDTH);

        e.bounds = Rect{current_x, origin_y_, tab_width, TAB_HEIGHT};

        // Close button bounds (right side of tab)
        if (closable)
        {
            e.close_bounds = Rect{current_x + tab_width - CLOSE_BUTTON_SIZE - 4,
                                  origin_y_ + (TAB_HEIGHT - CLOSE_BUTTON_SIZE) * 0.5f,
                                  CLOSE_BUTTON_SIZE,
                                  CLOSE_BUTTON_SIZE};
        }
        else
        {
            e.close_bounds = Rect{};
        }

        current_x += tab_width;
    }
}

void TabStrip::move_element(size_t from, size_t to)
{
    if (from >= elements_.size() || to >= elements_.size() || from == to)
        return;

    Element moving = std::move(elements_[from]);
    elements_.erase(elements_.begin() + static_cast<std::ptrdiff_t>(from));
    elements_.insert(elements_.begin() + static_cast<std::ptrdiff_t>(to), std::move(moving));
    hovered_ = NO_INDEX;
    for (auto& e : elements_)
        e.hovered = false;
    relayout();
}

bool TabStrip::is_draggable(size_t index) const
{
    return index < elements_.size() && !elements_[index].pinned;
}

std::vector<Rect> TabStrip::element_rects() const
{
    std::vector<Rect> rects;
    rects.reserve(elements_.size());
    for (const auto& e : elements_)
        rects.push_back(e.bounds);
    return rects;
}

TabStrip::Hit TabStrip::hit_test(float x, float y) const
{
    Hit hit;
    for (size_t i = 0; i < elements_.size(); ++i)
    {
        const auto& e = elements_[i];
        if (!e.bounds.contains(x, y))
            continue;
        hit.index    = i;
        hit.on_close = !e.pinned && e.close_bounds.contains(x, y);
        break;
    }
    return hit;
}

void TabStrip::on_hover(float x, float y)
{
    Hit hit = hit_test(x, y);
    if (hit.index == hovered_)
        return;
    if (hovered_ < elements_.size())
        elements_[hovered_].hovered = false;
    hovered_ = hit.index;
    if (hovered_ < elements_.size())
        elements_[hovered_].hovered = true;
}

size_t TabStrip::active_index() const
{
    for (size_t i = 0; i < elements_.size(); ++i)
    {
        if (elements_[i].active)
            return i;
    }
    return NO_INDEX;
}

void TabStrip::set_drag_visuals(size_t index, bool on)
{
    if (index >= elements_.size())
        return;
    elements_[index].opacity = on ? DRAG_OPACITY : 1.0f;
    elements_[index].scale   = on ? DRAG_SCALE : 1.0f;
}

void TabStrip::clear_drag_visuals()
{
    for (auto& e : elements_)
    {
        e.opacity = 1.0f;
        e.scale   = 1.0f;
    }
}

float TabStrip::total_width() const
{
    if (elements_.empty())
        return 0.0f;
    return elements_.back().bounds.right() - origin_x_;
}

}   // namespace tabsync
