#pragma once

// GLSL 3.30 sources for the vector renderer.
namespace gl::shaders
{

// Lines and circles. Each quad is drawn as six vertices; the vertex index
// recovers the corner's position in "line space": x along the segment, y
// across it, both in [-1, 1].
inline constexpr const char* kPolylineVertex = R"GLSL(
#version 330 core

uniform mat3 u_matrix;
uniform float u_depth;
uniform float u_alpha;

in vec2 a_position;
in vec4 a_color;
in float a_cap_region;

out vec2 v_linespace;
out float v_cap_region;
out vec4 v_color;

const vec2 c_linespace[6] = vec2[](
    vec2(-1, -1),
    vec2( 1, -1),
    vec2(-1,  1),
    vec2(-1,  1),
    vec2( 1, -1),
    vec2( 1,  1)
);

void main() {
    int vi = gl_VertexID % 6;
    v_linespace = c_linespace[vi];
    v_cap_region = a_cap_region;
    gl_Position = vec4((u_matrix * vec3(a_position, 1)).xy, u_depth, 1);
    v_color = a_color;
    v_color.a *= u_alpha;
}
)GLSL";

// Cuts the rounded ends out of the quad.
inline constexpr const char* kPolylineFragment = R"GLSL(
#version 330 core

in vec2 v_linespace;
in float v_cap_region;
in vec4 v_color;

out vec4 o_color;

void main() {
    float x = v_linespace.x;
    float y = v_linespace.y;

    if (x < (-1.0 + v_cap_region)) {
        float a = (1.0 + x) / v_cap_region;
        x = mix(-1.0, 0.0, a);
        if (x * x + y * y >= 1.0) {
            discard;
        }
    } else if (x > (1.0 - v_cap_region)) {
        float a = (x - (1.0 - v_cap_region)) / v_cap_region;
        x = mix(0.0, 1.0, a);
        if (x * x + y * y >= 1.0) {
            discard;
        }
    }

    o_color = v_color;
}
)GLSL";

inline constexpr const char* kPolygonVertex = R"GLSL(
#version 330 core

uniform mat3 u_matrix;
uniform float u_depth;
uniform float u_alpha;

in vec2 a_position;
in vec4 a_color;

out vec4 v_color;

void main() {
    gl_Position = vec4((u_matrix * vec3(a_position, 1)).xy, u_depth, 1);
    v_color = a_color;
    v_color.a *= u_alpha;
}
)GLSL";

inline constexpr const char* kPolygonFragment = R"GLSL(
#version 330 core

in vec4 v_color;

out vec4 o_color;

void main() {
    o_color = v_color;
}
)GLSL";

}  // namespace gl::shaders
