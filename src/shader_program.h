#pragma once
#include <webgpu/webgpu.h>
#include "diagnostics.h"
#include "shader_reflection.h"
#include <map>
#include <string>
#include <vector>

// Render pipeline target for ShaderProgram::buildRender
struct RenderTarget {
    WGPUTextureFormat format = WGPUTextureFormat_RGBA16Float;
    bool additive = false;  // blend ONE/ONE
    WGPUPrimitiveTopology topology = WGPUPrimitiveTopology_TriangleList;
};

// A WGSL module and the pipelines built from it.
// A rebuild replaces the current pipelines only if the whole build validates,
// so a shader edit with a typo keeps the last good program running.
class ShaderProgram {
public:
    void init(WGPUDevice device, Diagnostics& diag, const char* label, const char* path,
              std::vector<const char*> preludes = {});

    // Source = preludes + file contents
    std::string loadSource() const;

    bool buildCompute(WGPUPipelineLayout layout, const std::vector<std::string>& entries);
    bool buildRender(WGPUPipelineLayout layout, const RenderTarget& target,
                     const char* vsEntry = "vs_main", const char* fsEntry = "fs_main");

    bool ready() const { return m_ready; }
    WGPUComputePipeline compute(const std::string& entry) const;
    WGPURenderPipeline render() const { return m_render; }

    bool hasUniform(const std::string& name) const { return m_reflection.hasUniform(name); }
    const ShaderReflection& reflection() const { return m_reflection; }
    const char* label() const { return m_label.c_str(); }

    void release();

private:
    WGPUShaderModule compileModule(const std::string& code) const;
    // Pops the validation scope pushed before building; returns the error text, empty on success
    std::string popValidationScope() const;
    void releasePipelines();

    WGPUDevice m_device = nullptr;
    Diagnostics* m_diag = nullptr;
    std::string m_label;
    std::string m_path;
    std::vector<const char*> m_preludes;

    WGPUShaderModule m_module = nullptr;
    std::map<std::string, WGPUComputePipeline> m_compute;
    WGPURenderPipeline m_render = nullptr;
    ShaderReflection m_reflection;
    bool m_ready = false;
};
