#ifdef TABSYNC_USE_IMGUI

    #include "imgui_tab_strip.hpp"

    #include <imgui.h>
    #include <tabsync/logger.hpp>

namespace tabsync
{

namespace
{

constexpr ImU32 COLOR_BG          = IM_COL32(37, 37, 41, 255);
constexpr ImU32 COLOR_BG_HOVER    = IM_COL32(52, 58, 70, 255);
constexpr ImU32 COLOR_BG_ACTIVE   = IM_COL32(60, 60, 66, 255);
constexpr ImU32 COLOR_BORDER      = IM_COL32(70, 70, 78, 255);
constexpr ImU32 COLOR_ACCENT      = IM_COL32(88, 140, 235, 255);
constexpr ImU32 COLOR_TEXT        = IM_COL32(225, 225, 230, 255);
constexpr ImU32 COLOR_TEXT_DIM    = IM_COL32(160, 160, 168, 255);
constexpr ImU32 COLOR_CLOSE_HOVER = IM_COL32(230, 90, 80, 255);
constexpr ImU32 COLOR_LOADING     = IM_COL32(235, 180, 70, 255);

ImU32 with_alpha(ImU32 color, float opacity)
{
    uint32_t a = (color >> IM_COL32_A_SHIFT) & 0xFF;
    a          = static_cast<uint32_t>(static_cast<float>(a) * opacity);
    return (color & ~IM_COL32_A_MASK) | (a << IM_COL32_A_SHIFT);
}

}   // namespace

ImGuiTabStrip::ImGuiTabStrip(ReplicaStore& store, TabStrip& strip, TabDragController& drag)
    : store_(store), strip_(strip), drag_(drag)
{
    strip_.set_text_measure([](const std::string& title) { return ImGui::CalcTextSize(title.c_str()).x; });
}

void ImGuiTabStrip::draw()
{
    ImVec2 origin = ImGui::GetCursorScreenPos();
    strip_.set_origin(origin.x, origin.y);

    handle_input();
    draw_tabs();
    draw_context_menu();

    ImGui::Dummy(ImVec2(strip_.total_width(), TabStrip::TAB_HEIGHT));
}

// ─── Input ───────────────────────────────────────────────────────────────────

void ImGuiTabStrip::handle_input()
{
    bool focused = ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows);
    if (was_focused_ && !focused && drag_.is_active())
        drag_.cancel(TabDragController::CancelReason::FocusLost);
    was_focused_ = focused;

    if (drag_.is_active() && ImGui::IsKeyPressed(ImGuiKey_Escape))
        drag_.cancel(TabDragController::CancelReason::Escape);

    ImVec2 mouse = ImGui::GetMousePos();
    strip_.on_hover(mouse.x, mouse.y);

    if (!focused && !drag_.is_active())
        return;

    if (ImGui::IsMouseClicked(ImGuiMouseButton_Left) && ImGui::IsWindowHovered())
        drag_.on_pointer_down(mouse.x, mouse.y);

    if (drag_.is_active() && ImGui::IsMouseDown(ImGuiMouseButton_Left))
        drag_.on_pointer_move(mouse.x, mouse.y);

    if (drag_.is_active() && ImGui::IsMouseReleased(ImGuiMouseButton_Left))
        drag_.on_pointer_up(mouse.x, mouse.y);

    if (ImGui::IsMouseClicked(ImGuiMouseButton_Right))
    {
        auto hit = strip_.hit_test(mouse.x, mouse.y);
        if (hit.hit())
        {
            context_menu_ = hit.index;
            ImGui::OpenPopup("##tabsync_tab_menu");
        }
    }
}

// ─── Drawing ─────────────────────────────────────────────────────────────────

void ImGuiTabStrip::draw_tabs()
{
    ImDrawList* draw_list = ImGui::GetWindowDrawList();

    const auto& elements = strip_.elements();
    if (elements.empty())
        return;

    const Rect first = elements.front().bounds;
    draw_list->AddLine(ImVec2(first.x, first.y + first.h - 1),
                       ImVec2(first.x + strip_.total_width(), first.y + first.h - 1),
                       COLOR_BORDER,
                       1.0f);

    // Dragged element last so it sits on top of its neighbours.
    size_t dragged = drag_.is_dragging() ? drag_.source_index() : NO_INDEX;
    auto   draw_one = [&](size_t i)
    {
        const auto& el = elements[i];

        Rect  b   = el.bounds;
        float grow_w = b.w * (el.scale - 1.0f) * 0.5f;
        float grow_h = b.h * (el.scale - 1.0f) * 0.5f;
        ImVec2 tl(b.x + 1.0f - grow_w, b.y + 4.0f - grow_h);
        ImVec2 br(b.x + b.w - 1.0f + grow_w, b.y + b.h + grow_h);

        ImU32 bg = el.active ? COLOR_BG_ACTIVE : (el.hovered ? COLOR_BG_HOVER : COLOR_BG);
        draw_list->AddRectFilled(tl, br, with_alpha(bg, el.opacity), 4.0f, ImDrawFlags_RoundCornersTop);

        if (el.active)
            draw_list->AddLine(ImVec2(tl.x + 4, br.y - 1), ImVec2(br.x - 4, br.y - 1), COLOR_ACCENT, 2.0f);

        ImVec2 text_size = ImGui::CalcTextSize(el.title.c_str());
        ImVec2 text_pos(b.x + TabStrip::TAB_PADDING, b.y + (b.h - text_size.y) * 0.5f);
        float  clip_right = el.close_bounds.w > 0.0f ? el.close_bounds.x : b.right() - TabStrip::TAB_PADDING;
        draw_list->PushClipRect(ImVec2(b.x, b.y), ImVec2(clip_right, b.y + b.h), true);
        draw_list->AddText(text_pos, with_alpha(el.active ? COLOR_TEXT : COLOR_TEXT_DIM, el.opacity), el.title.c_str());
        draw_list->PopClipRect();

        if (el.loading)
            draw_list->AddCircleFilled(ImVec2(b.x + 6, b.y + 10), 3.0f, COLOR_LOADING);

        if (el.close_bounds.w > 0.0f && (el.active || el.hovered))
        {
            ImVec2 mouse = ImGui::GetMousePos();
            bool   close_hovered = el.close_bounds.contains(mouse.x, mouse.y);
            ImVec2 c(el.close_bounds.center_x(), el.close_bounds.y + el.close_bounds.h * 0.5f);
            float  sz = TabStrip::CLOSE_BUTTON_SIZE * 0.3f;
            ImU32  color = close_hovered ? COLOR_CLOSE_HOVER : COLOR_TEXT_DIM;
            draw_list->AddLine(ImVec2(c.x - sz, c.y - sz), ImVec2(c.x + sz, c.y + sz), color, 1.5f);
            draw_list->AddLine(ImVec2(c.x - sz, c.y + sz), ImVec2(c.x + sz, c.y - sz), color, 1.5f);
        }
    };

    for (size_t i = 0; i < elements.size(); ++i)
    {
        if (i != dragged)
            draw_one(i);
    }
    if (dragged < elements.size())
    {
        draw_one(dragged);

        // Insertion marker at the candidate slot
        size_t candidate = drag_.candidate_drop_index();
        if (candidate < elements.size() && candidate != dragged)
        {
            const Rect& target = elements[candidate].bounds;
            float       x      = candidate > dragged ? target.right() : target.x;
            draw_list->AddLine(ImVec2(x, target.y + 4), ImVec2(x, target.y + target.h), COLOR_ACCENT, 2.0f);
        }
    }
}

void ImGuiTabStrip::draw_context_menu()
{
    if (!ImGui::BeginPopup("##tabsync_tab_menu"))
    {
        context_menu_ = NO_INDEX;
        return;
    }

    if (context_menu_ < strip_.element_count())
    {
        const auto& el = strip_.element(context_menu_);

        if (ImGui::MenuItem("Duplicate"))
            store_.request_duplicate(el.id);

        ImGui::Separator();

        if (!el.pinned && ImGui::MenuItem("Close"))
            store_.request_close(el.id);

        if (strip_.element_count() > 1 && ImGui::MenuItem("Close Others"))
            store_.request_close_others(el.id);
    }
    ImGui::EndPopup();
}

}   // namespace tabsync

#endif   // TABSYNC_USE_IMGUI
