#include "gpu_context.h"
#include "control_panel.h"
#include "diagnostics.h"
#include "export.h"
#include "frame_assembler.h"
#include "particle_view.h"
#include "render_pass.h"
#include "session.h"
#include "trail_sim.h"
#include "ui.h"
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <GLFW/glfw3.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <unordered_map>

struct AppUserData {
    GpuContext* gpu = nullptr;
    ViewTransform* view = nullptr;
    UI* ui = nullptr;
};

// Edge-triggered key and button state for polled GLFW input
struct InputLatch {
    std::unordered_map<int, bool> keys;
    std::unordered_map<int, bool> buttons;

    bool keyPressed(GLFWwindow* win, int key) {
        bool down = glfwGetKey(win, key) == GLFW_PRESS;
        bool& was = keys[key];
        bool pressed = down && !was;
        was = down;
        return pressed;
    }
    bool buttonPressed(GLFWwindow* win, int button) {
        bool down = glfwGetMouseButton(win, button) == GLFW_PRESS;
        bool& was = buttons[button];
        bool pressed = down && !was;
        was = down;
        return pressed;
    }
};

static void submit(WGPUQueue queue, WGPUCommandEncoder encoder) {
    WGPUCommandBufferDescriptor cbDesc = {};
    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, &cbDesc);
    wgpuQueueSubmit(queue, 1, &cmdBuf);
    wgpuCommandBufferRelease(cmdBuf);
    wgpuCommandEncoderRelease(encoder);
}

// The reticle sits at a canvas position; dot views need it in window space
static FrameStyle frameStyleFor(const Session& session, bool recording, const ViewTransform& view, float aspect) {
    const PhysicsConfig& c = session.state.config;
    FrameStyle style;
    style.brightness = session.prefs.brightness;
    style.exposure = session.prefs.exposure;
    style.inkWeight = c.inkWeight;
    style.watercolor = c.watercolor;
    style.embossIntensity = c.effectiveEmbossIntensity();
    style.embossSmoothness = c.embossSmoothness;
    style.reticle = c.sweepReticle();
    if (recording) style.reticle.visible = false;
    if (isParticleView(session.state.view))
        canvasToScreen(view, aspect, style.reticle.u, style.reticle.v, style.reticle.u, style.reticle.v);
    return style;
}

int main() {
    Diagnostics diag;

    GpuContext gpu;
    if (!gpu.init(1280, 1280, "fluoddity", diag)) {
        fprintf(stderr, "Failed to initialize GPU context\n");
        return 1;
    }

    // Update to actual framebuffer size (handles Retina displays)
    gpu.updateSize();

    UI ui;
    if (!ui.init(gpu)) {
        diag.error("Failed to initialize ImGui");
        return 1;
    }

    RenderPass renderPass;
    if (!renderPass.init(gpu.device, gpu.queue, gpu.surfaceFormat, diag)) {
        fprintf(stderr, "Failed to build the present pass\n");
        return 1;
    }

    TrailSim sim(diag);
    Session session(sim, diag);
    session.prefs = loadPreferences();
    if (!gpu.fitsStorageBinding((uint64_t)entityCountFor(session.prefs.worldSize) * sizeof(GpuEntity))) {
        diag.error("World size %.2f exceeds the device's storage limit, using 1.0", session.prefs.worldSize);
        session.prefs.worldSize = 1.0f;
    }
    if (!sim.init(gpu.device, gpu.queue, session.prefs.worldSize)) {
        fprintf(stderr, "Failed to initialize the simulation\n");
        return 1;
    }
    session.history.pushZeroRule();

    FrameAssembler assembler(diag);
    if (!assembler.init(gpu.device, gpu.queue)) {
        fprintf(stderr, "Failed to initialize the frame assembler\n");
        return 1;
    }

    ParticleView particles(diag);
    if (!particles.init(gpu.device, gpu.queue)) {
        fprintf(stderr, "Failed to build the particle view\n");
        return 1;
    }

    ControlPanel panel;
    SequenceRecorder recorder;
    InputLatch input;

    double lastTime = glfwGetTime();
    float fps = 0.0f;
    int frameCount = 0;

    ViewTransform view;
    bool panning = false;
    double lastMouseX = 0.0, lastMouseY = 0.0;
    double lastPanClickTime = 0.0;
    float prevDrawU = 0.5f, prevDrawV = 0.5f;
    bool drawing = false;

    // Wrap user pointer so resize and scroll callbacks both work
    AppUserData appData;
    appData.gpu = &gpu;
    appData.view = &view;
    appData.ui = &ui;
    glfwSetWindowUserPointer(gpu.window, &appData);

    glfwSetFramebufferSizeCallback(gpu.window, [](GLFWwindow* win, int w, int h) {
        auto* app = (AppUserData*)glfwGetWindowUserPointer(win);
        if (app && app->gpu && w > 0 && h > 0) {
            app->gpu->width = (uint32_t)w;
            app->gpu->height = (uint32_t)h;
            app->gpu->configureSurface();
        }
    });

    glfwSetScrollCallback(gpu.window, [](GLFWwindow* w, double xoff, double yoff) {
        ImGui_ImplGlfw_ScrollCallback(w, xoff, yoff);
        auto* app = (AppUserData*)glfwGetWindowUserPointer(w);
        if (app->ui->wantsMouse()) return;
        float factor = yoff > 0 ? 1.1f : (1.0f / 1.1f);
        app->view->zoom *= factor;
        if (app->view->zoom < 0.1f) app->view->zoom = 0.1f;
        if (app->view->zoom > 100.0f) app->view->zoom = 100.0f;
    });

    while (!glfwWindowShouldClose(gpu.window)) {
        glfwPollEvents();

        // FPS counter
        frameCount++;
        double now = glfwGetTime();
        if (now - lastTime >= 0.5) {
            fps = (float)(frameCount / (now - lastTime));
            frameCount = 0;
            lastTime = now;
        }

        ui.beginFrame();

        PanelStatus status;
        status.fps = fps;
        status.entityCount = sim.entityCount();
        status.canvasDim = sim.canvasDim();
        status.tick = sim.tick();
        status.recording = recorder.recording();
        status.recordedFrames = recorder.framesWritten();
        status.pendingWrites = recorder.pending();
        status.failedWrites = recorder.failedWrites();
        status.recordDir = recorder.directory();
        PanelActions actions = panel.draw(session, status);

        if (glfwGetKey(gpu.window, GLFW_KEY_TAB) == GLFW_PRESS) {
            StatsOverlay stats;
            stats.fps = fps;
            stats.canvasDim = sim.canvasDim();
            stats.entityCount = sim.entityCount();
            stats.tick = sim.tick();
            stats.zoom = view.zoom;
            stats.warnings = diag.totalWarnings();
            stats.errors = diag.errorCount();
            ui.drawStats(stats);
        }

        // --- Input: mouse ---
        int winW, winH;
        glfwGetWindowSize(gpu.window, &winW, &winH);
        int fbW, fbH;
        glfwGetFramebufferSize(gpu.window, &fbW, &fbH);
        float aspectRatio = (fbH > 0) ? (float)fbW / (float)fbH : 1.0f;

        double mx, my;
        glfwGetCursorPos(gpu.window, &mx, &my);
        float mouseU, mouseV;
        screenToCanvas(view, aspectRatio, mx, my, winW, winH, mouseU, mouseV);
        const ViewOption viewOption = session.state.view;
        const bool cameraView = isParticleView(viewOption);
        const bool tiled = isTiledView(viewOption);
        if (tiled) {
            mouseU = wrapToBaseTile(mouseU);
            mouseV = wrapToBaseTile(mouseV);
        }

        bool leftPressed = input.buttonPressed(gpu.window, GLFW_MOUSE_BUTTON_LEFT);
        bool rightPressed = input.buttonPressed(gpu.window, GLFW_MOUSE_BUTTON_RIGHT);
        bool leftHeld = glfwGetMouseButton(gpu.window, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS;

        if (!ui.wantsMouse()) {
            if (leftPressed) {
                if (!session.consumeSweepPreviewRestore()) session.onLeftClick(mouseU, mouseV);
            }
            if (rightPressed) {
                if (!session.consumeSweepPreviewRestore()) session.onRightClick();
            }

            // Pan with middle drag, double-click resets the view
            if (glfwGetMouseButton(gpu.window, GLFW_MOUSE_BUTTON_MIDDLE) == GLFW_PRESS) {
                if (!panning) {
                    panning = true;
                    if (now - lastPanClickTime < 0.3) {
                        view.offsetX = 0.0f;
                        view.offsetY = 0.0f;
                        view.zoom = 1.0f;
                    }
                    lastPanClickTime = now;
                } else {
                    float dx = (float)(mx - lastMouseX) / (float)winW;
                    float dy = (float)(my - lastMouseY) / (float)winH;
                    view.offsetX += dx * aspectRatio / view.zoom;
                    view.offsetY += dy / view.zoom;
                }
            } else {
                panning = false;
            }
        } else {
            panning = false;
            leftHeld = false;
        }
        lastMouseX = mx;
        lastMouseY = my;

        // Drawing stamps the segment from the previous cursor position while the button is held
        bool wantDraw = leftHeld && session.prefs.mouseMode == MouseMode::DrawTrail;
        // Crossing a tile edge restarts the stroke instead of streaking across the canvas
        bool crossedTile = tiled && (std::fabs(mouseU - prevDrawU) > 0.5f || std::fabs(mouseV - prevDrawV) > 0.5f);
        if (wantDraw && (!drawing || crossedTile)) {
            prevDrawU = mouseU;
            prevDrawV = mouseV;
        }
        drawing = wantDraw;
        DrawInput& draw = session.state.draw;
        draw.requested = wantDraw;
        draw.mouseU = mouseU;
        draw.mouseV = mouseV;
        draw.prevU = prevDrawU;
        draw.prevV = prevDrawV;
        draw.size = session.prefs.drawSize;
        draw.power = wantDraw ? session.prefs.drawPower : 0.0f;

        // --- Input: keyboard ---
        if (!ui.wantsKeyboard()) {
            GLFWwindow* win = gpu.window;
            bool ctrl = glfwGetKey(win, GLFW_KEY_LEFT_CONTROL) == GLFW_PRESS ||
                        glfwGetKey(win, GLFW_KEY_RIGHT_CONTROL) == GLFW_PRESS ||
                        glfwGetKey(win, GLFW_KEY_LEFT_SUPER) == GLFW_PRESS;

            if (input.keyPressed(win, GLFW_KEY_C) && ctrl) {
                glfwSetClipboardString(win, session.copyConfig().c_str());
            }
            if (input.keyPressed(win, GLFW_KEY_V) && ctrl) {
                const char* text = glfwGetClipboardString(win);
                if (text) session.pasteConfig(text);
                else diag.error("Clipboard is empty");
            }
            if (input.keyPressed(win, GLFW_KEY_R)) session.reset();
            if (input.keyPressed(win, GLFW_KEY_Z)) session.fullReset();
            if (input.keyPressed(win, GLFW_KEY_SPACE)) session.paused = !session.paused;

            float panSpeed = 0.01f / view.zoom;
            if (glfwGetKey(win, GLFW_KEY_W) == GLFW_PRESS) view.offsetY += panSpeed;
            if (glfwGetKey(win, GLFW_KEY_S) == GLFW_PRESS) view.offsetY -= panSpeed;
            if (glfwGetKey(win, GLFW_KEY_A) == GLFW_PRESS) view.offsetX += panSpeed;
            if (glfwGetKey(win, GLFW_KEY_D) == GLFW_PRESS) view.offsetX -= panSpeed;
            if (glfwGetKey(win, GLFW_KEY_E) == GLFW_PRESS) {
                view.zoom *= 1.02f;
                if (view.zoom > 100.0f) view.zoom = 100.0f;
            }
            if (glfwGetKey(win, GLFW_KEY_Q) == GLFW_PRESS) {
                view.zoom /= 1.02f;
                if (view.zoom < 0.1f) view.zoom = 0.1f;
            }
            if (glfwGetKey(win, GLFW_KEY_0) == GLFW_PRESS) {
                view.offsetX = 0.0f;
                view.offsetY = 0.0f;
                view.zoom = 1.0f;
            }
        }

        // --- Panel requests ---
        if (actions.reloadShaders) {
            bool simOk = sim.reloadShaders();
            bool frameOk = assembler.reloadShaders();
            bool dotsOk = particles.reloadShaders();
            sim.applyRule(sim.activeRule());
            if (simOk && frameOk && dotsOk) diag.info("Shaders reloaded");
        }
        if (actions.toggleRecording) {
            if (recorder.recording()) recorder.stop();
            else recorder.start(session.prefs.recordInterval, session.prefs.maxFrames);
        }

        // Canvas views assemble the canvas-sized texture; dot views render a window-sized frame first
        uint32_t dim = sim.canvasDim();
        uint32_t frameW = cameraView ? (uint32_t)std::max(fbW, 1) : dim;
        uint32_t frameH = cameraView ? (uint32_t)std::max(fbH, 1) : dim;
        auto assembleSample = [&](WGPUCommandEncoder encoder, uint32_t totalSamples, uint32_t sampleIndex,
                                  const FrameStyle& style) {
            WGPUTextureView raw, emboss;
            if (cameraView) {
                particles.render(encoder, sim.entityBuffer(), sim.entityCount(), dim, frameW, frameH, view, tiled);
                raw = emboss = particles.targetView();
            } else {
                raw = sim.viewFor(viewOption);
                emboss = session.state.config.emboss == EmbossMode::Brush ? sim.brushView() : sim.trailView();
            }
            return assembler.assemble(encoder, raw, emboss, frameW, frameH, totalSamples, sampleIndex, style) != nullptr;
        };

        // --- Simulation: each tick gets its own submission so per-tick uniform writes land in order ---
        bool frameFinished = false;
        if (!session.paused || actions.stepOnce) {
            const Preferences& p = session.prefs;
            bool recording = recorder.recording();
            SampleSchedule schedule = actions.stepOnce
                ? makeSampleSchedule(1, false, 1)
                : makeSampleSchedule(p.speedmult,
                                     recording ? p.recordingMotionBlur : p.motionBlur,
                                     recording ? p.recordingBlurQuality : p.blurQuality);
            FrameStyle style = frameStyleFor(session, recording, view, aspectRatio);

            for (uint32_t step = 0; step < schedule.stepsPerFrame; step++) {
                WGPUCommandEncoderDescriptor encDesc = {};
                WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(gpu.device, &encDesc);

                sim.step(encoder, session.state, session.multiLoad);

                if (schedule.rendersAfterStep(step)) {
                    uint32_t sampleIndex = schedule.motionBlur ? step / schedule.cadence : 0;
                    if (assembleSample(encoder, schedule.totalSamples, sampleIndex, style)) frameFinished = true;
                }
                submit(gpu.queue, encoder);
            }

            if (drawing) {
                prevDrawU = mouseU;
                prevDrawV = mouseV;
            }
        } else {
            // Paused: restyle the current state every frame so view changes and pan/zoom still show
            WGPUCommandEncoderDescriptor encDesc = {};
            WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(gpu.device, &encDesc);
            assembleSample(encoder, 1, 0, frameStyleFor(session, recorder.recording(), view, aspectRatio));
            submit(gpu.queue, encoder);
        }

        // --- Present ---
        // Dot views are already in window space
        if (cameraView) renderPass.setTransform(ViewTransform{}, 1.0f);
        else renderPass.setTransform(view, aspectRatio);

        WGPUTextureView surfaceView = gpu.getNextSurfaceTextureView();
        if (!surfaceView) {
            ImGui::EndFrame();
            continue;
        }

        WGPUCommandEncoderDescriptor encDesc = {};
        WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(gpu.device, &encDesc);

        WGPUBindGroup quadBG = nullptr;
        if (assembler.outputView()) quadBG = renderPass.createBindGroup(assembler.outputView());

        WGPURenderPassColorAttachment colorAtt = {};
        colorAtt.view = surfaceView;
        colorAtt.loadOp = WGPULoadOp_Clear;
        colorAtt.storeOp = WGPUStoreOp_Store;
        colorAtt.clearValue = { 0.0, 0.0, 0.0, 1.0 };

        WGPURenderPassDescriptor rpDesc = {};
        rpDesc.colorAttachmentCount = 1;
        rpDesc.colorAttachments = &colorAtt;

        WGPURenderPassEncoder rpass = wgpuCommandEncoderBeginRenderPass(encoder, &rpDesc);
        if (quadBG) renderPass.draw(rpass, quadBG);
        ui.endFrame(rpass);
        wgpuRenderPassEncoderEnd(rpass);
        wgpuRenderPassEncoderRelease(rpass);

        submit(gpu.queue, encoder);
        if (quadBG) wgpuBindGroupRelease(quadBG);

        gpu.present();
        wgpuTextureViewRelease(surfaceView);

        // Only finished frames are exported or recorded
        if (actions.exportFrame) {
            if (assembler.outputTexture()) {
                exportTextureToPNG(gpu.device, gpu.queue, assembler.outputTexture(),
                                   assembler.width(), assembler.height(), timestampedExportPath("fluoddity"));
            } else {
                diag.error("Nothing to export yet");
            }
        }
        if (frameFinished && recorder.recording()) {
            recorder.onFrame(gpu.device, gpu.queue, assembler.outputTexture(),
                             assembler.width(), assembler.height());
        }
    }

    if (!savePreferences(session.prefs)) diag.error("Could not save preferences");
    recorder.stop();
    assembler.shutdown();
    particles.shutdown();
    sim.shutdown();
    renderPass.shutdown();
    ui.shutdown();
    gpu.shutdown();
    return 0;
}
