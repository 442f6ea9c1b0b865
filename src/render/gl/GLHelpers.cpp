#include "render/gl/GLHelpers.hpp"

#include <iostream>

namespace gl
{

ShaderProgram::~ShaderProgram()
{
    Release();
}

void ShaderProgram::Release()
{
    if (m_program_ != 0) {
        glDeleteProgram(m_program_);
        m_program_ = 0;
    }
    m_attributes_.clear();
    m_uniforms_.clear();
}

GLuint ShaderProgram::Compile(GLenum type, const char* source) const
{
    GLuint const shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    GLint status = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
    if (status != GL_TRUE) {
        GLint log_length = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &log_length);
        std::string log(static_cast<size_t>(log_length > 0 ? log_length : 1), '\0');
        glGetShaderInfoLog(shader, log_length, nullptr, log.data());
        std::cerr << "ShaderProgram: Error compiling " << (type == GL_VERTEX_SHADER ? "vertex" : "fragment") << " shader '" << m_name_ << "': " << log << std::endl;
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

bool ShaderProgram::Load(const std::string& name, const char* vertex_source, const char* fragment_source)
{
    Release();
    m_name_ = name;

    GLuint const vertex = Compile(GL_VERTEX_SHADER, vertex_source);
    if (vertex == 0) {
        return false;
    }
    GLuint const fragment = Compile(GL_FRAGMENT_SHADER, fragment_source);
    if (fragment == 0) {
        glDeleteShader(vertex);
        return false;
    }

    m_program_ = glCreateProgram();
    glAttachShader(m_program_, vertex);
    glAttachShader(m_program_, fragment);
    glLinkProgram(m_program_);
    glDeleteShader(vertex);
    glDeleteShader(fragment);

    GLint status = GL_FALSE;
    glGetProgramiv(m_program_, GL_LINK_STATUS, &status);
    if (status != GL_TRUE) {
        GLint log_length = 0;
        glGetProgramiv(m_program_, GL_INFO_LOG_LENGTH, &log_length);
        std::string log(static_cast<size_t>(log_length > 0 ? log_length : 1), '\0');
        glGetProgramInfoLog(m_program_, log_length, nullptr, log.data());
        std::cerr << "ShaderProgram: Error linking '" << m_name_ << "': " << log << std::endl;
        glDeleteProgram(m_program_);
        m_program_ = 0;
        return false;
    }

    // Cache attribute and uniform locations
    GLint count = 0;
    GLchar buffer[256];
    GLsizei length = 0;
    GLint size = 0;
    GLenum type = 0;

    glGetProgramiv(m_program_, GL_ACTIVE_ATTRIBUTES, &count);
    for (GLint i = 0; i < count; ++i) {
        glGetActiveAttrib(m_program_, static_cast<GLuint>(i), sizeof(buffer), &length, &size, &type, buffer);
        std::string const attribute_name(buffer, static_cast<size_t>(length));
        m_attributes_[attribute_name] = glGetAttribLocation(m_program_, attribute_name.c_str());
    }

    glGetProgramiv(m_program_, GL_ACTIVE_UNIFORMS, &count);
    for (GLint i = 0; i < count; ++i) {
        glGetActiveUniform(m_program_, static_cast<GLuint>(i), sizeof(buffer), &length, &size, &type, buffer);
        std::string const uniform_name(buffer, static_cast<size_t>(length));
        m_uniforms_[uniform_name] = glGetUniformLocation(m_program_, uniform_name.c_str());
    }

    std::cout << "ShaderProgram: Loaded '" << m_name_ << "'" << std::endl;
    return true;
}

void ShaderProgram::Bind() const
{
    glUseProgram(m_program_);
}

GLint ShaderProgram::Attribute(const std::string& name) const
{
    auto it = m_attributes_.find(name);
    return it != m_attributes_.end() ? it->second : -1;
}

GLint ShaderProgram::Uniform(const std::string& name) const
{
    auto it = m_uniforms_.find(name);
    return it != m_uniforms_.end() ? it->second : -1;
}

Buffer::Buffer()
{
    glGenBuffers(1, &m_buffer_);
}

Buffer::~Buffer()
{
    if (m_buffer_ != 0) {
        glDeleteBuffers(1, &m_buffer_);
    }
}

void Buffer::Bind() const
{
    glBindBuffer(GL_ARRAY_BUFFER, m_buffer_);
}

void Buffer::Set(const std::vector<float>& data)
{
    Bind();
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(data.size() * sizeof(float)), data.data(), GL_STATIC_DRAW);
}

VertexArray::VertexArray()
{
    glGenVertexArrays(1, &m_vao_);
}

VertexArray::~VertexArray()
{
    if (m_vao_ != 0) {
        glDeleteVertexArrays(1, &m_vao_);
    }
}

void VertexArray::Bind() const
{
    glBindVertexArray(m_vao_);
}

void VertexArray::AttachBuffer(const Buffer& buffer, GLint attribute, GLint components) const
{
    if (attribute < 0) {
        return;
    }
    Bind();
    buffer.Bind();
    glEnableVertexAttribArray(static_cast<GLuint>(attribute));
    glVertexAttribPointer(static_cast<GLuint>(attribute), components, GL_FLOAT, GL_FALSE, 0, nullptr);
}

}  // namespace gl
