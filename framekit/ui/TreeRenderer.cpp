#include "framekit/ui/TreeRenderer.hpp"

#include <algorithm>

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

namespace framekit::ui
{
namespace
{
constexpr float kMinThumbLength = 12.0F;

ImU32 ToColor(const glm::vec4& color)
{
    return ImGui::ColorConvertFloat4ToU32(ImVec4(color.r, color.g, color.b, color.a));
}

ImDrawList* DrawList()
{
    return ImGui::GetBackgroundDrawList();
}
} // namespace

TreeRenderer::~TreeRenderer()
{
    Shutdown();
}

bool TreeRenderer::Initialize(platform::Window& window)
{
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window.NativeHandle(), true))
    {
        ImGui::DestroyContext();
        return false;
    }
    if (!ImGui_ImplOpenGL3_Init("#version 450"))
    {
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        return false;
    }
    m_initialized = true;
    return true;
}

void TreeRenderer::Shutdown()
{
    if (!m_initialized)
    {
        return;
    }
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    m_initialized = false;
}

void TreeRenderer::BeginFrame()
{
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void TreeRenderer::Draw(const UiTree& tree)
{
    if (const UINode* root = tree.GetRoot())
    {
        DrawNode(*root);
    }
}

void TreeRenderer::EndFrame()
{
    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

void TreeRenderer::DrawNode(const UINode& node)
{
    if (node.visibility != Visibility::Visible || node.layout.display == Display::None)
    {
        return;
    }

    const ComputedRect& rect = node.computedRect;
    const ImVec2 min(rect.x, rect.y);
    const ImVec2 max(rect.x + rect.w, rect.y + rect.h);
    ImDrawList* drawList = DrawList();

    if (node.type == UINodeType::Scrollbar)
    {
        DrawScrollbar(node);
        return;
    }

    if (node.type == UINodeType::Button)
    {
        const ImU32 fill = node.state.hover ? IM_COL32(96, 110, 140, 255) : IM_COL32(70, 80, 104, 255);
        drawList->AddRectFilled(min, max, fill, 4.0F);
        drawList->AddRect(min, max, IM_COL32(140, 150, 175, 255), 4.0F);
    }
    else if (node.backgroundColor.has_value())
    {
        drawList->AddRectFilled(min, max, ToColor(*node.backgroundColor));
    }

    if ((node.type == UINodeType::Text || node.type == UINodeType::Button) && !node.text.empty())
    {
        drawList->AddText(nullptr, node.fontSize, ImVec2(rect.contentX, rect.contentY), ToColor(node.textColor), node.text.c_str());
    }

    const bool clips = node.type == UINodeType::ScrollView;
    if (clips)
    {
        drawList->PushClipRect(min, max, true);
    }
    for (const auto& child : node.children)
    {
        if (child)
        {
            DrawNode(*child);
        }
    }
    if (clips)
    {
        drawList->PopClipRect();
    }
}

void TreeRenderer::DrawScrollbar(const UINode& node)
{
    const ComputedRect& rect = node.computedRect;
    ImDrawList* drawList = DrawList();
    drawList->AddRectFilled(ImVec2(rect.x, rect.y), ImVec2(rect.x + rect.w, rect.y + rect.h), IM_COL32(30, 30, 36, 200));

    const ImU32 thumbColor = node.state.disabled ? IM_COL32(80, 80, 88, 200) : IM_COL32(150, 160, 180, 230);
    const bool horizontal = node.layout.flexDirection == FlexDirection::Row;
    const float track = horizontal ? rect.w : rect.h;
    const float thumb = std::min(track, std::max(kMinThumbLength, track * node.state.thumbExtent));
    const float start = (track - thumb) * node.state.value01;
    if (horizontal)
    {
        drawList->AddRectFilled(ImVec2(rect.x + start, rect.y + 2.0F), ImVec2(rect.x + start + thumb, rect.y + rect.h - 2.0F), thumbColor, 3.0F);
    }
    else
    {
        drawList->AddRectFilled(ImVec2(rect.x + 2.0F, rect.y + start), ImVec2(rect.x + rect.w - 2.0F, rect.y + start + thumb), thumbColor, 3.0F);
    }
}
} // namespace framekit::ui
