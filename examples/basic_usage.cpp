// Basic UboFusion usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <UboFusion/writer.hpp>
#include <UboFusion/validator.hpp>
#include <UboFusion/error_formatting.hpp>
#include <array>
#include <iostream>
#include <vector>

using namespace UboFusion;
using namespace UboFusion::options;

using Vec4 = std::array<float, 4>;

struct Particle {
    Annotated<Vec4, as_vec4>                            position;
    Annotated<Vec4, as_vec4>                            color;
    Annotated<std::array<float, 3>, as_floats<3, true>> velocity;
};

static_assert(CalculateSize<Particle>() == 48);

constexpr std::string_view shader = R"(
#version 330 core
layout(std140) uniform Particle {
    vec4 Position;
    vec4 Color;
    vec3 Velocity;
};
)";

int main() {
    auto report = Validate<Particle>(shader, "Particle");
    std::cout << LayoutReportToString(report);
    if (!report) {
        return 1;
    }

    Particle p;
    p.position = Vec4{1.0f, 2.0f, 0.0f, 1.0f};
    p.color = Vec4{1.0f, 0.5f, 0.0f, 1.0f};
    p.velocity = std::array<float, 3>{0.0f, -9.8f, 0.0f};

    std::array<std::byte, CalculateSize<Particle>()> buffer{};
    auto result = Write(p, std::span<std::byte>(buffer));

    if (!result) {
        std::cout << WriteResultToString(result) << std::endl;
        return 1;
    }

    std::cout << "Packed " << result.bytesWritten() << " bytes:" << std::endl;
    for (std::size_t i = 0; i < buffer.size(); i ++) {
        std::cout << std::hex << static_cast<int>(std::to_integer<unsigned char>(buffer[i]))
                  << ((i % 16 == 15) ? "\n" : " ");
    }
    std::cout << std::dec;

    return 0;
}
