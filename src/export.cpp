#include "export.h"
#include "preset.h"
#include <webgpu/wgpu.h>
#include <cstdio>
#include <cstring>
#include <ctime>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

static bool mapReadBuffer(WGPUDevice device, WGPUBuffer buffer, uint64_t size) {
    struct MapData { bool done = false; WGPUBufferMapAsyncStatus status; };
    MapData mapData;
    wgpuBufferMapAsync(buffer, WGPUMapMode_Read, 0, size,
        [](WGPUBufferMapAsyncStatus status, void* ud) {
            auto* data = (MapData*)ud;
            data->status = status;
            data->done = true;
        }, &mapData);

    while (!mapData.done) {
        wgpuDevicePoll(device, true, nullptr);
    }
    return mapData.status == WGPUBufferMapAsyncStatus_Success;
}

static void submitEncoder(WGPUQueue queue, WGPUCommandEncoder encoder) {
    WGPUCommandBufferDescriptor cbDesc = {};
    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, &cbDesc);
    wgpuQueueSubmit(queue, 1, &cmdBuf);
    wgpuCommandBufferRelease(cmdBuf);
    wgpuCommandEncoderRelease(encoder);
}

bool readbackBuffer(WGPUDevice device, WGPUQueue queue, WGPUBuffer src, uint64_t size,
                    std::vector<uint8_t>& out) {
    uint64_t alignedSize = (size + 3) & ~uint64_t(3); // copies move whole words

    WGPUBufferDescriptor bufDesc = {};
    bufDesc.size = alignedSize;
    bufDesc.usage = WGPUBufferUsage_CopyDst | WGPUBufferUsage_MapRead;
    WGPUBuffer staging = wgpuDeviceCreateBuffer(device, &bufDesc);

    WGPUCommandEncoderDescriptor encDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(device, &encDesc);
    wgpuCommandEncoderCopyBufferToBuffer(encoder, src, 0, staging, 0, alignedSize);
    submitEncoder(queue, encoder);

    bool ok = mapReadBuffer(device, staging, alignedSize);
    if (ok) {
        const uint8_t* mapped = (const uint8_t*)wgpuBufferGetConstMappedRange(staging, 0, alignedSize);
        out.assign(mapped, mapped + size);
        wgpuBufferUnmap(staging);
    }
    wgpuBufferRelease(staging);
    return ok;
}

bool readbackTexture(WGPUDevice device, WGPUQueue queue, WGPUTexture texture,
                     uint32_t width, uint32_t height, std::vector<uint8_t>& pixels) {
    uint32_t bytesPerRow = ((width * 4 + 255) / 256) * 256; // 256-byte aligned
    uint64_t bufferSize = (uint64_t)bytesPerRow * height;

    WGPUBufferDescriptor bufDesc = {};
    bufDesc.size = bufferSize;
    bufDesc.usage = WGPUBufferUsage_CopyDst | WGPUBufferUsage_MapRead;
    WGPUBuffer staging = wgpuDeviceCreateBuffer(device, &bufDesc);

    WGPUCommandEncoderDescriptor encDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(device, &encDesc);

    WGPUImageCopyTexture src = {};
    src.texture = texture;
    WGPUImageCopyBuffer dst = {};
    dst.buffer = staging;
    dst.layout.bytesPerRow = bytesPerRow;
    dst.layout.rowsPerImage = height;
    WGPUExtent3D size = { width, height, 1 };
    wgpuCommandEncoderCopyTextureToBuffer(encoder, &src, &dst, &size);
    submitEncoder(queue, encoder);

    bool ok = mapReadBuffer(device, staging, bufferSize);
    if (ok) {
        const uint8_t* mapped = (const uint8_t*)wgpuBufferGetConstMappedRange(staging, 0, bufferSize);
        pixels.resize((size_t)width * height * 4);
        for (uint32_t y = 0; y < height; y++) {
            memcpy(&pixels[(size_t)y * width * 4], &mapped[(size_t)y * bytesPerRow], width * 4);
        }
        wgpuBufferUnmap(staging);
    }
    wgpuBufferRelease(staging);
    return ok;
}

bool exportTextureToPNG(WGPUDevice device, WGPUQueue queue,
                        WGPUTexture texture, uint32_t width, uint32_t height,
                        const std::string& filename)
{
    std::vector<uint8_t> pixels;
    if (!readbackTexture(device, queue, texture, width, height, pixels)) {
        fprintf(stderr, "Readback failed, nothing exported\n");
        return false;
    }

    bool ok = stbi_write_png(filename.c_str(), width, height, 4, pixels.data(), width * 4) != 0;
    if (ok) printf("Exported: %s\n", filename.c_str());
    else fprintf(stderr, "Failed to write PNG: %s\n", filename.c_str());
    return ok;
}

static std::string timestamp() {
    time_t t = time(nullptr);
    struct tm* tm_info = localtime(&t);
    char ts[32];
    strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", tm_info);
    return ts;
}

std::string timestampedExportPath(const std::string& prefix) {
    ensureDirectory("exports");
    return "exports/" + prefix + "_" + timestamp() + ".png";
}

// --- AsyncExporter ---

void AsyncExporter::start() {
    if (m_running) return;
    m_running = true;
    m_thread = std::thread(&AsyncExporter::workerLoop, this);
}

void AsyncExporter::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
    }
    m_cv.notify_one();
    if (m_thread.joinable()) m_thread.join();
}

void AsyncExporter::enqueue(std::vector<uint8_t>&& pixels, uint32_t w, uint32_t h,
                             const std::string& filename) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs.push({std::move(pixels), w, h, filename});
        m_pending++;
    }
    m_cv.notify_one();
}

void AsyncExporter::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [&]{ return !m_jobs.empty() || !m_running; });
            if (!m_running && m_jobs.empty()) break;
            job = std::move(m_jobs.front());
            m_jobs.pop();
        }

        bool ok = stbi_write_png(job.filename.c_str(), job.width, job.height, 4,
                                  job.pixels.data(), job.width * 4) != 0;
        if (!ok) {
            fprintf(stderr, "Failed to write PNG: %s\n", job.filename.c_str());
            m_failures++;
        }
        m_pending--;
    }
}

// --- SequenceRecorder ---

bool SequenceRecorder::start(int interval, int maxFrames) {
    if (m_recording) return true;
    m_dir = "exports/seq_" + timestamp();
    if (!ensureDirectory("exports") || !ensureDirectory(m_dir)) {
        fprintf(stderr, "Recording: cannot create %s\n", m_dir.c_str());
        return false;
    }
    m_interval = interval < 1 ? 1 : interval;
    m_maxFrames = maxFrames;
    m_framesSeen = 0;
    m_framesWritten = 0;
    m_recording = true;
    m_exporter.start();
    printf("Recording to %s\n", m_dir.c_str());
    return true;
}

void SequenceRecorder::stop() {
    if (!m_recording) return;
    m_recording = false;
    m_exporter.stop();
    printf("Recording stopped: %d frames in %s\n", m_framesWritten, m_dir.c_str());
}

void SequenceRecorder::onFrame(WGPUDevice device, WGPUQueue queue, WGPUTexture frame, uint32_t w, uint32_t h) {
    if (!m_recording) return;
    int seen = m_framesSeen++;
    if (seen % m_interval != 0) return;

    std::vector<uint8_t> pixels;
    if (!readbackTexture(device, queue, frame, w, h, pixels)) {
        fprintf(stderr, "Recording: readback failed for frame %d\n", seen);
        return;
    }

    char filename[256];
    snprintf(filename, sizeof(filename), "%s/%06d.png", m_dir.c_str(), m_framesWritten);
    m_exporter.enqueue(std::move(pixels), w, h, filename);
    m_framesWritten++;

    if (m_maxFrames > 0 && m_framesWritten >= m_maxFrames) stop();
}
