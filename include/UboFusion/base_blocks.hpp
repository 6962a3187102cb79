#pragma once

/// @file base_blocks.hpp
/// @brief Engine-level uniform blocks bound at slots 0-4
///
/// Each block is a record of vec4-shaped members plus the matching GLSL
/// declaration. The registry sizes below are the independent expectation that
/// `CheckBlock` compares against `CalculateSize`.

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

#include "annotated.hpp"
#include "options.hpp"
#include "registry.hpp"

namespace UboFusion {

namespace base_blocks {

using Mat4 = std::array<float, 16>;   // column-major

inline constexpr float current_layout_version = 1.0f;

struct FrameTime {
    float time = 0.0f;
    float deltaTime = 0.0f;
    float frameIndex = 0.0f;
    float layoutVersion = current_layout_version;
};

struct Frame {
    Annotated<FrameTime, options::as_vec4> frameTime;
};


struct CameraPosition { float x = 0, y = 0, z = 0, w = 0; };
struct CameraForward  { float x = 0, y = 0, z = -1, aspect = 1; };
struct CameraUp       { float x = 0, y = 1, z = 0, fov = 70; };
struct CameraClip     { float nearPlane = 0.05f, farPlane = 1000.0f, isFlying = 0, reserved = 0; };

struct Camera {
    Annotated<CameraPosition, options::as_vec4>           position;
    Annotated<CameraForward, options::as_vec4>            forward;
    Annotated<CameraUp, options::as_vec4>                 up;
    Annotated<CameraClip, options::as_vec4>               clip;
    Annotated<std::optional<Mat4>, options::as_mat4>      viewProj;      // identity when unset
    Annotated<std::optional<Mat4>, options::as_mat4>      invViewProj;
    Annotated<std::array<float, 4>, options::as_vec4>     reserved1{};
    Annotated<std::array<float, 4>, options::as_vec4>     reserved2{};
};


struct ObjectIdentity  { float objectId = 0, objectType = 0, flags = 0, reserved = 0; };
struct ObjectTransform { float offsetX = 0, offsetY = 0, offsetZ = 0, scale = 1; };

struct Object {
    Annotated<ObjectIdentity, options::as_vec4>  identity;
    Annotated<ObjectTransform, options::as_vec4> transform;
};


struct MaterialAlbedo     { float r = 1, g = 1, b = 1, a = 1; };
struct MaterialProperties { float roughness = 0.5f, metallic = 0, emission = 0, reserved = 0; };

struct Material {
    Annotated<MaterialAlbedo, options::as_vec4>     albedo;
    Annotated<MaterialProperties, options::as_vec4> properties;
};


inline constexpr std::size_t max_lights = 4;

struct LightHeader    { float lightCount = 0, ambientR = 0.01f, ambientG = 0.01f, ambientB = 0.01f; };
struct LightPosition  { float x = 0, y = 0, z = 0, strength = 0; };
struct LightColor     { float r = 0, g = 0, b = 0, attenuation = 0; };
struct LightDirection { float x = 0, y = -1, z = 0, angle = 0; };

struct LightSource {
    Annotated<LightPosition, options::as_vec4>  position;
    Annotated<LightColor, options::as_vec4>     color;
    Annotated<LightDirection, options::as_vec4> direction;
};

struct Light {
    Annotated<LightHeader, options::as_vec4> header;
    LightSource light0;
    LightSource light1;
    LightSource light2;
    LightSource light3;
};


inline constexpr std::size_t frame_slot    = 0;
inline constexpr std::size_t camera_slot   = 1;
inline constexpr std::size_t object_slot   = 2;
inline constexpr std::size_t material_slot = 3;
inline constexpr std::size_t light_slot    = 4;

inline constexpr std::size_t frame_size    = 16;
inline constexpr std::size_t camera_size   = 224;
inline constexpr std::size_t object_size   = 32;
inline constexpr std::size_t material_size = 32;
inline constexpr std::size_t light_size    = 208;


inline constexpr std::string_view frame_glsl = R"(
layout(std140) uniform FrameData {
    vec4 FrameTimeParams;   // time, deltaTime, frameIndex, layoutVersion
};
)";

inline constexpr std::string_view camera_glsl = R"(
layout(std140) uniform CameraData {
    vec4 CameraPositionUBO;
    vec4 CameraForwardUBO;  // xyz forward, w aspect
    vec4 CameraUpUBO;       // xyz up, w fov
    vec4 CameraClipUBO;     // near, far, isFlying, reserved
    mat4 ViewProjUBO;
    mat4 InvViewProjUBO;
    vec4 CameraReserved1;
    vec4 CameraReserved2;
};
)";

inline constexpr std::string_view object_glsl = R"(
layout(std140) uniform ObjectData {
    vec4 ObjectIdentity;
    vec4 ObjectTransform;
};
)";

inline constexpr std::string_view material_glsl = R"(
layout(std140) uniform MaterialData {
    vec4 MaterialAlbedo;
    vec4 MaterialProperties;  // roughness, metallic, emission, reserved
};
)";

inline constexpr std::string_view light_glsl = R"(
layout(std140) uniform LightData {
    vec4 LightHeader;         // count, ambient rgb
    vec4 Light0Position;
    vec4 Light0Color;
    vec4 Light0Direction;
    vec4 Light1Position;
    vec4 Light1Color;
    vec4 Light1Direction;
    vec4 Light2Position;
    vec4 Light2Color;
    vec4 Light2Direction;
    vec4 Light3Position;
    vec4 Light3Color;
    vec4 Light3Direction;
};
)";

} // namespace base_blocks


template<> struct Annotated<base_blocks::Frame> {
    using Options = OptionsPack<options::block<"FrameData">>;
};
template<> struct Annotated<base_blocks::Camera> {
    using Options = OptionsPack<options::block<"CameraData">>;
};
template<> struct Annotated<base_blocks::Object> {
    using Options = OptionsPack<options::block<"ObjectData">>;
};
template<> struct Annotated<base_blocks::Material> {
    using Options = OptionsPack<options::block<"MaterialData">>;
};
template<> struct Annotated<base_blocks::Light> {
    using Options = OptionsPack<options::block<"LightData">>;
};


namespace base_blocks {

/// Registers the five base blocks with their expected sizes; returns the
/// first failure.
constexpr BindingResult RegisterBaseBlocks(BindingRegistry & registry) {
    constexpr struct { std::string_view name; std::size_t slot; std::size_t size; } table[] = {
        {"FrameData",    frame_slot,    frame_size},
        {"CameraData",   camera_slot,   camera_size},
        {"ObjectData",   object_slot,   object_size},
        {"MaterialData", material_slot, material_size},
        {"LightData",    light_slot,    light_size},
    };
    for(const auto & b : table) {
        if(BindingResult r = registry.registerBinding(b.name, b.slot, b.size); !r) {
            return r;
        }
    }
    return BindingResult(BindingError::none, {}, 0, 0, 0);
}

} // namespace base_blocks

} // namespace UboFusion
