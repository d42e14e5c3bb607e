#include "shader_program.h"
#include "compute_pass.h"
#include <webgpu/wgpu.h>

void ShaderProgram::init(WGPUDevice device, Diagnostics& diag, const char* label, const char* path,
                         std::vector<const char*> preludes) {
    m_device = device;
    m_diag = &diag;
    m_label = label;
    m_path = path;
    m_preludes = std::move(preludes);
}

std::string ShaderProgram::loadSource() const {
    std::string body = loadShaderFile(m_path.c_str());
    if (body.empty()) return "";
    std::string code;
    for (const char* p : m_preludes) code += p;
    code += body;
    return code;
}

WGPUShaderModule ShaderProgram::compileModule(const std::string& code) const {
    WGPUShaderModuleWGSLDescriptor wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderModuleWGSLDescriptor;
    wgslDesc.code = code.c_str();
    WGPUShaderModuleDescriptor smDesc = {};
    smDesc.nextInChain = &wgslDesc.chain;
    smDesc.label = m_label.c_str();
    return wgpuDeviceCreateShaderModule(m_device, &smDesc);
}

std::string ShaderProgram::popValidationScope() const {
    struct ScopeData { bool done = false; WGPUErrorType type = WGPUErrorType_NoError; std::string message; };
    ScopeData scope;
    wgpuDevicePopErrorScope(m_device,
        [](WGPUErrorType type, const char* message, void* ud) {
            auto* data = (ScopeData*)ud;
            data->type = type;
            if (message) data->message = message;
            data->done = true;
        }, &scope);

    while (!scope.done) {
        wgpuDevicePoll(m_device, true, nullptr);
    }

    if (scope.type == WGPUErrorType_NoError) return "";
    return scope.message.empty() ? "validation failed" : scope.message;
}

bool ShaderProgram::buildCompute(WGPUPipelineLayout layout, const std::vector<std::string>& entries) {
    std::string code = loadSource();
    if (code.empty()) {
        m_diag->error("%s: could not read %s, keeping previous program", m_label.c_str(), m_path.c_str());
        return false;
    }

    ShaderReflection reflection = reflectWgsl(code);
    for (const auto& entry : entries) {
        if (!reflection.hasEntryPoint(entry)) {
            m_diag->error("%s: entry point '%s' not found, keeping previous program",
                          m_label.c_str(), entry.c_str());
            return false;
        }
    }

    wgpuDevicePushErrorScope(m_device, WGPUErrorFilter_Validation);
    WGPUShaderModule module = compileModule(code);

    std::map<std::string, WGPUComputePipeline> pipelines;
    auto makePipeline = [&](const char* entry) -> WGPUComputePipeline {
        WGPUComputePipelineDescriptor desc = {};
        desc.layout = layout;
        desc.compute.module = module;
        desc.compute.entryPoint = entry;
        return wgpuDeviceCreateComputePipeline(m_device, &desc);
    };
    for (const auto& entry : entries)
        pipelines[entry] = makePipeline(entry.c_str());

    std::string error = popValidationScope();
    if (!error.empty()) {
        m_diag->error("%s: compilation failed, keeping previous program\n%s", m_label.c_str(), error.c_str());
        for (auto& kv : pipelines) if (kv.second) wgpuComputePipelineRelease(kv.second);
        if (module) wgpuShaderModuleRelease(module);
        return false;
    }

    releasePipelines();
    m_module = module;
    m_compute = std::move(pipelines);
    m_reflection = std::move(reflection);
    m_ready = true;
    m_diag->info("%s: compiled %zu entry points", m_label.c_str(), m_compute.size());
    return true;
}

bool ShaderProgram::buildRender(WGPUPipelineLayout layout, const RenderTarget& target,
                                const char* vsEntry, const char* fsEntry) {
    std::string code = loadSource();
    if (code.empty()) {
        m_diag->error("%s: could not read %s, keeping previous program", m_label.c_str(), m_path.c_str());
        return false;
    }

    ShaderReflection reflection = reflectWgsl(code);
    wgpuDevicePushErrorScope(m_device, WGPUErrorFilter_Validation);
    WGPUShaderModule module = compileModule(code);

    WGPUBlendState blend = {};
    blend.color.operation = WGPUBlendOperation_Add;
    blend.color.srcFactor = WGPUBlendFactor_One;
    blend.color.dstFactor = WGPUBlendFactor_One;
    blend.alpha = blend.color;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = target.format;
    colorTarget.blend = target.additive ? &blend : nullptr;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragState = {};
    fragState.module = module;
    fragState.entryPoint = fsEntry;
    fragState.targetCount = 1;
    fragState.targets = &colorTarget;

    WGPURenderPipelineDescriptor rpDesc = {};
    rpDesc.label = m_label.c_str();
    rpDesc.layout = layout;
    rpDesc.vertex.module = module;
    rpDesc.vertex.entryPoint = vsEntry;
    rpDesc.primitive.topology = target.topology;
    rpDesc.multisample.count = 1;
    rpDesc.multisample.mask = 0xFFFFFFFF;
    rpDesc.fragment = &fragState;
    WGPURenderPipeline pipeline = wgpuDeviceCreateRenderPipeline(m_device, &rpDesc);

    std::string error = popValidationScope();
    if (!error.empty()) {
        m_diag->error("%s: compilation failed, keeping previous program\n%s", m_label.c_str(), error.c_str());
        if (pipeline) wgpuRenderPipelineRelease(pipeline);
        if (module) wgpuShaderModuleRelease(module);
        return false;
    }

    releasePipelines();
    m_module = module;
    m_render = pipeline;
    m_reflection = std::move(reflection);
    m_ready = true;
    m_diag->info("%s: compiled render pipeline", m_label.c_str());
    return true;
}

WGPUComputePipeline ShaderProgram::compute(const std::string& entry) const {
    auto it = m_compute.find(entry);
    return it == m_compute.end() ? nullptr : it->second;
}

void ShaderProgram::releasePipelines() {
    for (auto& kv : m_compute) if (kv.second) wgpuComputePipelineRelease(kv.second);
    m_compute.clear();
    if (m_render) wgpuRenderPipelineRelease(m_render);
    m_render = nullptr;
    if (m_module) wgpuShaderModuleRelease(m_module);
    m_module = nullptr;
}

void ShaderProgram::release() {
    releasePipelines();
    m_reflection = ShaderReflection{};
    m_ready = false;
}
