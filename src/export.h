#pragma once
#include <webgpu/webgpu.h>
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>

// Blocking copy of the first `size` bytes of `src` (needs CopySrc usage)
bool readbackBuffer(WGPUDevice device, WGPUQueue queue, WGPUBuffer src, uint64_t size,
                    std::vector<uint8_t>& out);

// Blocking copy of an rgba8 texture into tightly packed rows
bool readbackTexture(WGPUDevice device, WGPUQueue queue, WGPUTexture texture,
                     uint32_t width, uint32_t height, std::vector<uint8_t>& pixels);

// Synchronous single-frame export
bool exportTextureToPNG(WGPUDevice device, WGPUQueue queue,
                        WGPUTexture texture, uint32_t width, uint32_t height,
                        const std::string& filename);

// "exports/<prefix>_<timestamp>.png"
std::string timestampedExportPath(const std::string& prefix);

// PNG encoding on a worker thread; readback stays on the caller's thread
class AsyncExporter {
public:
    void start();
    void stop(); // blocks until queue is drained

    void enqueue(std::vector<uint8_t>&& pixels, uint32_t w, uint32_t h,
                 const std::string& filename);

    int pending() const { return m_pending.load(); }
    int failures() const { return m_failures.load(); }

private:
    void workerLoop();

    struct Job {
        std::vector<uint8_t> pixels;
        uint32_t width, height;
        std::string filename;
    };

    std::thread m_thread;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::queue<Job> m_jobs;
    std::atomic<bool> m_running{false};
    std::atomic<int> m_pending{0};
    std::atomic<int> m_failures{0};
};

// Writes finished frames to exports/seq_<timestamp>/%06d.png
class SequenceRecorder {
public:
    bool start(int interval, int maxFrames);
    void stop();
    bool recording() const { return m_recording; }

    // Called once per finished frame; reads back and queues it when the interval says so.
    // Stops by itself after maxFrames written frames.
    void onFrame(WGPUDevice device, WGPUQueue queue, WGPUTexture frame, uint32_t w, uint32_t h);

    int framesWritten() const { return m_framesWritten; }
    int pending() const { return m_exporter.pending(); }
    int failedWrites() const { return m_exporter.failures(); }
    const std::string& directory() const { return m_dir; }

private:
    AsyncExporter m_exporter;
    std::string m_dir;
    bool m_recording = false;
    int m_interval = 1;
    int m_maxFrames = 0;
    int m_framesSeen = 0;
    int m_framesWritten = 0;
};
