#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <tabsync/fwd.hpp>
#include <vector>

#include "replica_store.hpp"

namespace tabsync
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    bool  contains(float px, float py) const { return px >= x && px < x + w && py >= y && py < y + h; }
    float center_x() const { return x + w * 0.5f; }
    float right() const { return x + w; }
};

/**
 * TabStrip - Geometry and visual state of the tab row
 *
 * Rebuilt from the replica store's state on every change. Supplies element
 * bounds for hit testing and drop-index computation; carries per-element
 * visual state (hover, active, drag opacity/scale) for whatever draws it.
 * Never mutates tab state itself.
 */
class TabStrip : public ReplicaStore::VisualFallback
{
   public:
    // Layout constants
    static constexpr float TAB_HEIGHT        = 32.0f;
    static constexpr float TAB_MIN_WIDTH     = 80.0f;
    static constexpr float TAB_MAX_WIDTH     = 200.0f;
    static constexpr float TAB_PADDING       = 12.0f;
    static constexpr float CLOSE_BUTTON_SIZE = 16.0f;

    // Drag visuals applied to the source element
    static constexpr float DRAG_OPACITY = 0.6f;
    static constexpr float DRAG_SCALE   = 1.05f;

    // Returns the rendered width of a title in pixels.
    using TextMeasure = std::function<float(const std::string&)>;

    struct Element
    {
        TabId       id;
        std::string title;
        bool        pinned  = false;
        bool        active  = false;
        bool        loading = false;
        bool        hovered = false;
        float       opacity = 1.0f;
        float       scale   = 1.0f;
        Rect        bounds;
        Rect        close_bounds;   // zero-sized for the pinned tab
    };

    struct Hit
    {
        size_t index    = NO_INDEX;
        bool   on_close = false;

        bool hit() const { return index != NO_INDEX; }
    };

    TabStrip();
    ~TabStrip() override = default;

    TabStrip(const TabStrip&)            = delete;
    TabStrip& operator=(const TabStrip&) = delete;

    // Top-left corner of the strip in pointer coordinates.
    void set_origin(float x, float y);
    // Default measure: 7 px per byte, enough for tests and the console shell.
    void set_text_measure(TextMeasure measure);

    // Rebuild elements in tab order. Drag visuals survive for ids that are
    // still present.
    void sync(const TabState& state);

    // VisualFallback
    size_t element_count() const override { return elements_.size(); }
    void   move_element(size_t from, size_t to) override;

    const Element&              element(size_t index) const { return elements_.at(index); }
    const std::vector<Element>& elements() const { return elements_; }
    Rect                        element_bounds(size_t index) const { return elements_.at(index).bounds; }
    const TabId&                element_id(size_t index) const { return elements_.at(index).id; }
    bool                        is_draggable(size_t index) const;

    // Bounds of every element, in order.
    std::vector<Rect> element_rects() const;

    Hit hit_test(float x, float y) const;

    void   on_hover(float x, float y);
    size_t hovered_index() const { return hovered_; }
    size_t active_index() const;

    void set_drag_visuals(size_t index, bool on);
    void clear_drag_visuals();

    float total_width() const;

   private:
    void relayout();

    std::vector<Element> elements_;
    TextMeasure          measure_;
    float                origin_x_ = 0.0f;
    float                origin_y_ = 0.0f;
    size_t               hovered_  = NO_INDEX;
};

}   // namespace tabsync
