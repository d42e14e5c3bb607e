#include <catch2/catch.hpp>
#include "multi_load.h"
#include "physics_setting.h"
#include "preset.h"
#include "rule.h"
#include "shader_reflection.h"
#include <string>

static const char* const kSample = R"(
struct Params { width: u32, height: u32 }

@group(0) @binding(0) var<uniform> params: Params;
@binding(1) @group(0) var source: texture_2d<f32>;
@group(0) @binding(2) var<storage, read_write> cells: array<f32>;
// @group(0) @binding(3) var<uniform> commented_out: Params;
/* @group(0) @binding(4) var<uniform> also_gone: Params;
   /* nested */ @group(0) @binding(5) var<uniform> still_gone: Params; */

@compute @workgroup_size(8, 8)
fn step_cells(@builtin(global_invocation_id) id: vec3<u32>) {
    cells[id.x] = f32(params.width);
}

@vertex
fn vs_main(@builtin(vertex_index) vi: u32) -> @builtin(position) vec4<f32> {
    return vec4<f32>(0.0);
}

@fragment fn fs_main() -> @location(0) vec4<f32> { return vec4<f32>(1.0); }
)";

TEST_CASE("WGSL reflection", "[reflection]") {
    ShaderReflection r = reflectWgsl(kSample);

    SECTION("Bindings in either attribute order") {
        REQUIRE(r.bindings.size() == 3);
        REQUIRE(r.hasUniform("params"));
        REQUIRE(r.hasUniform("source"));
        const ShaderBinding* cells = r.find("cells");
        REQUIRE(cells != nullptr);
        REQUIRE(cells->binding == 2);
        REQUIRE(cells->group == 0);
        REQUIRE(cells->addressSpace == "storage, read_write");
        REQUIRE(r.find("source")->binding == 1);
        REQUIRE(r.find("source")->addressSpace.empty());
    }

    SECTION("Commented-out bindings are not reported") {
        REQUIRE_FALSE(r.hasUniform("commented_out"));
        REQUIRE_FALSE(r.hasUniform("also_gone"));
        REQUIRE_FALSE(r.hasUniform("still_gone"));
    }

    SECTION("Entry points by stage") {
        REQUIRE(r.computeEntries == std::vector<std::string>{"step_cells"});
        REQUIRE(r.vertexEntries == std::vector<std::string>{"vs_main"});
        REQUIRE(r.fragmentEntries == std::vector<std::string>{"fs_main"});
        REQUIRE(r.hasEntryPoint("step_cells"));
        REQUIRE_FALSE(r.hasEntryPoint("main"));
    }

    SECTION("Empty source") {
        ShaderReflection empty = reflectWgsl("");
        REQUIRE(empty.bindings.empty());
        REQUIRE_FALSE(empty.hasUniform("params"));
    }
}

#ifdef FLUODDITY_SHADER_DIR
static std::string shaderSource(const char* name, std::initializer_list<const char*> preludes = {}) {
    std::string code;
    for (const char* p : preludes) code += p;
    std::string body;
    REQUIRE(readTextFile(std::string(FLUODDITY_SHADER_DIR) + "/" + name, body));
    return code + body;
}

TEST_CASE("Shipped shaders expose what the host binds", "[reflection][shaders]") {
    SECTION("Entity update") {
        ShaderReflection r = reflectWgsl(shaderSource("entity_update.wgsl", {kSweepWgsl, kRuleWgsl, kMultiLoadWgsl}));
        REQUIRE(r.hasEntryPoint("update_entities"));
        REQUIRE(r.hasEntryPoint("read_entity_rule"));
        for (const char* name : {"params", "trail", "entities", "picked_rule", "base_rule",
                                 "multi_load", "multi_configs", "multi_rules"})
            REQUIRE(r.hasUniform(name));
        REQUIRE(r.find("multi_configs")->binding == 6);
    }

    SECTION("Canvas update") {
        ShaderReflection r = reflectWgsl(shaderSource("canvas_update.wgsl", {kSweepWgsl}));
        REQUIRE(r.hasEntryPoint("update_canvas"));
        REQUIRE(r.hasUniform("trail_back"));
        REQUIRE(r.find("brush")->binding == 2);
    }

    SECTION("Brush and present passes") {
        ShaderReflection brush = reflectWgsl(shaderSource("brush.wgsl"));
        REQUIRE(brush.hasEntryPoint("vs_main"));
        REQUIRE(brush.hasEntryPoint("fs_main"));
        ShaderReflection quad = reflectWgsl(shaderSource("fullscreen_quad.wgsl"));
        REQUIRE(quad.hasUniform("transform"));
    }

    SECTION("Particle view") {
        ShaderReflection r = reflectWgsl(shaderSource("particle_view.wgsl"));
        REQUIRE(r.hasEntryPoint("vs_main"));
        REQUIRE(r.hasEntryPoint("fs_main"));
        REQUIRE(r.find("params")->binding == 0);
        REQUIRE(r.find("entities")->binding == 1);
    }

    SECTION("Frame assembly") {
        ShaderReflection r = reflectWgsl(shaderSource("frame_assembly.wgsl"));
        REQUIRE(r.hasEntryPoint("accumulate"));
        REQUIRE(r.hasEntryPoint("finish"));
        REQUIRE(r.find("out_frame")->binding == 7);
    }
}
#endif
