#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#ifndef GL_GLEXT_PROTOTYPES
#define GL_GLEXT_PROTOTYPES 1
#endif
#include <SDL3/SDL_opengl.h>

// Thin RAII owners for the GL objects used by the vector renderer. All of
// them require the owning context to be current when created or destroyed.
namespace gl
{

class ShaderProgram
{
public:
    ShaderProgram() = default;
    ~ShaderProgram();

    ShaderProgram(const ShaderProgram&) = delete;
    ShaderProgram& operator=(const ShaderProgram&) = delete;
    ShaderProgram(ShaderProgram&&) = delete;
    ShaderProgram& operator=(ShaderProgram&&) = delete;

    // Compiles and links; logs the info log and returns false on failure.
    bool Load(const std::string& name, const char* vertex_source, const char* fragment_source);
    // Deletes the program. The owning context must be current.
    void Release();

    void Bind() const;

    [[nodiscard]] GLint Attribute(const std::string& name) const;
    [[nodiscard]] GLint Uniform(const std::string& name) const;

    [[nodiscard]] bool IsValid() const { return m_program_ != 0; }
    [[nodiscard]] const std::string& GetName() const { return m_name_; }

private:
    GLuint Compile(GLenum type, const char* source) const;

    std::string m_name_;
    GLuint m_program_ = 0;
    std::unordered_map<std::string, GLint> m_attributes_;
    std::unordered_map<std::string, GLint> m_uniforms_;
};

class Buffer
{
public:
    Buffer();
    ~Buffer();

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
    Buffer(Buffer&&) = delete;
    Buffer& operator=(Buffer&&) = delete;

    void Bind() const;
    // Uploads as GL_STATIC_DRAW.
    void Set(const std::vector<float>& data);

private:
    GLuint m_buffer_ = 0;
};

class VertexArray
{
public:
    VertexArray();
    ~VertexArray();

    VertexArray(const VertexArray&) = delete;
    VertexArray& operator=(const VertexArray&) = delete;
    VertexArray(VertexArray&&) = delete;
    VertexArray& operator=(VertexArray&&) = delete;

    void Bind() const;

    // Binds 'buffer' to the attribute with 'components' floats per vertex.
    // A negative attribute location (optimized out by the compiler) is ignored.
    void AttachBuffer(const Buffer& buffer, GLint attribute, GLint components) const;

private:
    GLuint m_vao_ = 0;
};

}  // namespace gl
