// Start-up check of the engine uniform blocks
//
// Demonstrates:
// - Registering the base blocks at their binding slots
// - Comparing each record against the registered size and its GLSL declaration
// - Effect blocks registered from their record type
// - Refusing to start when anything disagrees

#include <UboFusion/base_blocks.hpp>
#include <UboFusion/startup_check.hpp>
#include <UboFusion/error_formatting.hpp>
#include <iostream>
#include <vector>

using namespace UboFusion;
using namespace UboFusion::options;

using Vec4 = std::array<float, 4>;

struct WaveConfig {
    Annotated<Vec4, as_vec4>                          params;       // amplitude, frequency, speed, phase
    Annotated<Vec4, as_vec4>                          tint;
    Annotated<std::vector<Vec4>, as_vec4_array<16>>   emitters;
};

template<> struct UboFusion::Annotated<WaveConfig> {
    using Options = OptionsPack<options::block<"WaveConfigData">>;
};

constexpr std::string_view wave_glsl = R"(
layout(std140) uniform WaveConfigData {
    vec4 WaveParams;
    vec4 WaveTint;
    vec4 WaveEmitters[16];
};
)";

template<class T>
bool check(const BindingRegistry & registry, std::string_view glsl) {
    auto res = CheckBlock<T>(registry, glsl);
    if (!res) {
        std::cerr << BlockCheckToString(res) << std::endl;
        return false;
    }
    std::cout << BindingResultToString(res.binding()) << std::endl;
    return true;
}

int main() {
    BindingRegistry registry;
    if (auto r = base_blocks::RegisterBaseBlocks(registry); !r) {
        std::cerr << BindingResultToString(r) << std::endl;
        return 1;
    }
    if (auto r = registry.registerBinding<WaveConfig>(20); !r) {
        std::cerr << BindingResultToString(r) << std::endl;
        return 1;
    }
    registry.freeze();

    bool ok = true;
    ok = check<base_blocks::Frame>(registry, base_blocks::frame_glsl) && ok;
    ok = check<base_blocks::Camera>(registry, base_blocks::camera_glsl) && ok;
    ok = check<base_blocks::Object>(registry, base_blocks::object_glsl) && ok;
    ok = check<base_blocks::Material>(registry, base_blocks::material_glsl) && ok;
    ok = check<base_blocks::Light>(registry, base_blocks::light_glsl) && ok;
    ok = check<WaveConfig>(registry, wave_glsl) && ok;

    if (!ok) {
        std::cerr << "uniform block layout check failed" << std::endl;
        return 1;
    }
    std::cout << registry.entries().size() << " uniform blocks verified" << std::endl;
    return 0;
}
