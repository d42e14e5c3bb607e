#pragma once
#include <string>
#include <vector>

struct ShaderBinding {
    std::string name;
    std::string addressSpace;  // "uniform", "storage, read_write", ... empty for textures/samplers
    int group = -1;
    int binding = -1;
};

// Resource bindings and entry points declared by a WGSL module.
struct ShaderReflection {
    std::vector<ShaderBinding> bindings;
    std::vector<std::string> computeEntries;
    std::vector<std::string> vertexEntries;
    std::vector<std::string> fragmentEntries;

    // True when the module declares a bound global called `name`.
    bool hasUniform(const std::string& name) const;
    bool hasEntryPoint(const std::string& name) const;
    const ShaderBinding* find(const std::string& name) const;
};

std::string stripWgslComments(const std::string& source);
ShaderReflection reflectWgsl(const std::string& source);
