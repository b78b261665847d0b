#pragma once

#include <cstddef>
#include <cstdint>

#include "../replica_store.hpp"
#include "../tab_drag_controller.hpp"
#include "../tab_strip.hpp"

namespace tabsync
{

/**
 * ImGuiTabStrip - Draws a TabStrip inside the current ImGui window
 *
 * Measures titles with ImGui::CalcTextSize, forwards mouse state to the drag
 * controller (press, move, release), cancels an active gesture on Escape or
 * when the window loses focus, and offers the usual context menu. It only
 * reads the strip; every change goes through the store.
 *
 * Call draw() once per frame between ImGui::Begin and ImGui::End.
 */
class ImGuiTabStrip
{
   public:
    ImGuiTabStrip(ReplicaStore& store, TabStrip& strip, TabDragController& drag);

    ImGuiTabStrip(const ImGuiTabStrip&)            = delete;
    ImGuiTabStrip& operator=(const ImGuiTabStrip&) = delete;

    void draw();

   private:
    void handle_input();
    void draw_tabs();
    void draw_context_menu();

    ReplicaStore&      store_;
    TabStrip&          strip_;
    TabDragController& drag_;

    bool   was_focused_  = false;
    size_t context_menu_ = NO_INDEX;
};

}   // namespace tabsync
