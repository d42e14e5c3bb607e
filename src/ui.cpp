#include "ui.h"
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_wgpu.h>

bool UI::init(GpuContext& ctx) {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = "fluoddity_layout.ini";

    // Callbacks installed later by the app replace these; main forwards scroll explicitly
    if (!ImGui_ImplGlfw_InitForOther(ctx.window, true)) return false;

    ImGui_ImplWGPU_InitInfo initInfo = {};
    initInfo.Device = ctx.device;
    initInfo.RenderTargetFormat = ctx.surfaceFormat;
    initInfo.DepthStencilFormat = WGPUTextureFormat_Undefined;
    initInfo.NumFramesInFlight = 1;
    return ImGui_ImplWGPU_Init(&initInfo);
}

void UI::beginFrame() {
    ImGui_ImplWGPU_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void UI::endFrame(WGPURenderPassEncoder renderPass) {
    ImGui::Render();
    ImGui_ImplWGPU_RenderDrawData(ImGui::GetDrawData(), renderPass);
}

void UI::drawStats(const StatsOverlay& stats) {
    ImGui::SetNextWindowPos(ImVec2(ImGui::GetIO().DisplaySize.x - 190, 10));
    ImGui::SetNextWindowBgAlpha(0.6f);
    ImGui::Begin("##stats", nullptr,
        ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoInputs |
        ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoSavedSettings);
    ImGui::Text("FPS: %.0f", stats.fps);
    ImGui::Text("Canvas: %ux%u", stats.canvasDim, stats.canvasDim);
    ImGui::Text("Entities: %u", stats.entityCount);
    ImGui::Text("Tick: %u", stats.tick);
    ImGui::Text("Zoom: %.1fx", stats.zoom);
    if (stats.errors > 0 || stats.warnings > 0)
        ImGui::TextColored(ImVec4(1.0f, 0.6f, 0.2f, 1.0f), "%d errors, %d warnings", stats.errors, stats.warnings);
    ImGui::End();
}

bool UI::wantsMouse() const {
    return ImGui::GetIO().WantCaptureMouse;
}

bool UI::wantsKeyboard() const {
    return ImGui::GetIO().WantCaptureKeyboard;
}

void UI::shutdown() {
    ImGui_ImplWGPU_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
}
