#include "shader_reflection.h"
#include <algorithm>
#include <regex>

bool ShaderReflection::hasUniform(const std::string& name) const {
    return find(name) != nullptr;
}

bool ShaderReflection::hasEntryPoint(const std::string& name) const {
    for (auto* list : {&computeEntries, &vertexEntries, &fragmentEntries})
        if (std::find(list->begin(), list->end(), name) != list->end()) return true;
    return false;
}

const ShaderBinding* ShaderReflection::find(const std::string& name) const {
    for (auto& b : bindings)
        if (b.name == name) return &b;
    return nullptr;
}

std::string stripWgslComments(const std::string& src) {
    std::string out;
    out.reserve(src.size());
    size_t i = 0;
    while (i < src.size()) {
        if (src.compare(i, 2, "//") == 0) {
            while (i < src.size() && src[i] != '\n') i++;
        } else if (src.compare(i, 2, "/*") == 0) {
            // WGSL block comments nest
            int depth = 0;
            do {
                if (src.compare(i, 2, "/*") == 0) { depth++; i += 2; }
                else if (src.compare(i, 2, "*/") == 0) { depth--; i += 2; }
                else i++;
            } while (depth > 0 && i < src.size());
            out += ' ';
        } else {
            out += src[i++];
        }
    }
    return out;
}

ShaderReflection reflectWgsl(const std::string& source) {
    ShaderReflection r;
    std::string code = stripWgslComments(source);

    // @group(G) @binding(B) var<space> name  (attributes in either order)
    static const std::regex bindingRe(
        R"(@(group|binding)\s*\(\s*(\d+)\s*\)\s*@(group|binding)\s*\(\s*(\d+)\s*\)\s*var\s*(<\s*([^>]*)>)?\s*(\w+))");
    for (auto it = std::sregex_iterator(code.begin(), code.end(), bindingRe); it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        ShaderBinding b;
        int first = std::stoi(m[2].str());
        int second = std::stoi(m[4].str());
        if (m[1].str() == "group") { b.group = first; b.binding = second; }
        else { b.binding = first; b.group = second; }
        b.addressSpace = m[6].str();
        b.name = m[7].str();
        r.bindings.push_back(b);
    }

    // @compute @workgroup_size(...) fn name
    static const std::regex entryRe(R"(@(compute|vertex|fragment)((\s*@\w+\s*(\([^)]*\))?)*)\s*fn\s+(\w+))");
    for (auto it = std::sregex_iterator(code.begin(), code.end(), entryRe); it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        std::string stage = m[1].str();
        std::string name = m[5].str();
        if (stage == "compute") r.computeEntries.push_back(name);
        else if (stage == "vertex") r.vertexEntries.push_back(name);
        else r.fragmentEntries.push_back(name);
    }
    return r;
}
