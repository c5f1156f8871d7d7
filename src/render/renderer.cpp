#include "gravsim/renderer.hpp"
#include "gravsim/error_handling.hpp"

namespace gravsim {

// Full-screen triangle generated from gl_VertexID, no vertex buffer needed
const char* VERTEX_SHADER_SOURCE = R"(
#version 330 core
out vec2 uv;

void main() {
    vec2 pos = vec2((gl_VertexID << 1) & 2, gl_VertexID & 2);
    uv = vec2(pos.x, 1.0 - pos.y);
    gl_Position = vec4(pos * 2.0 - 1.0, 0.0, 1.0);
}
)";

const char* FRAGMENT_SHADER_SOURCE = R"(
#version 330 core
in vec2 uv;
out vec4 FragColor;

uniform sampler2D frame;

void main() {
    FragColor = texture(frame, uv);
}
)";

void checkGLError(const char* operation) {
    GLenum err = glGetError();
    if (err != GL_NO_ERROR) {
        throw OpenGLException(operation, err);
    }
}

Renderer::Renderer()
    : shader_program_(0), vao_(0), texture_(0), texture_loc_(-1),
      texture_width_(0), texture_height_(0), is_initialized_(false) {}

Renderer::~Renderer() {
    cleanup();
}

void Renderer::initialize(int width, int height) {
    // Initialize GLEW
    glewExperimental = GL_TRUE;
    if (glewInit() != GLEW_OK) {
        throw OpenGLException("glewInit", 0);
    }
    // glewInit can leave a spurious GL_INVALID_ENUM behind
    glGetError();

    compileShaders();

    glGenVertexArrays(1, &vao_);
    createTexture(width, height);
    checkGLError("Renderer::initialize");

    glViewport(0, 0, width, height);
    is_initialized_ = true;
}

void Renderer::cleanup() {
    if (shader_program_) {
        glDeleteProgram(shader_program_);
        shader_program_ = 0;
    }
    if (vao_) {
        glDeleteVertexArrays(1, &vao_);
        vao_ = 0;
    }
    if (texture_) {
        glDeleteTextures(1, &texture_);
        texture_ = 0;
    }
    is_initialized_ = false;
}

void Renderer::compileShaders() {
    GLuint vertex_shader = compileShader(GL_VERTEX_SHADER, VERTEX_SHADER_SOURCE);
    GLuint fragment_shader = compileShader(GL_FRAGMENT_SHADER, FRAGMENT_SHADER_SOURCE);

    shader_program_ = glCreateProgram();
    glAttachShader(shader_program_, vertex_shader);
    glAttachShader(shader_program_, fragment_shader);
    glLinkProgram(shader_program_);
    checkProgramLinking(shader_program_);

    glDeleteShader(vertex_shader);
    glDeleteShader(fragment_shader);

    texture_loc_ = glGetUniformLocation(shader_program_, "frame");
}

GLuint Renderer::compileShader(GLenum type, const char* source) {
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);
    checkShaderCompilation(shader);
    return shader;
}

void Renderer::checkShaderCompilation(GLuint shader) {
    GLint success;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        char info_log[512];
        glGetShaderInfoLog(shader, 512, nullptr, info_log);
        glDeleteShader(shader);
        throw OpenGLException(info_log, 0);
    }
}

void Renderer::checkProgramLinking(GLuint program) {
    GLint success;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success) {
        char info_log[512];
        glGetProgramInfoLog(program, 512, nullptr, info_log);
        throw OpenGLException(info_log, 0);
    }
}

void Renderer::createTexture(int width, int height) {
    if (texture_) {
        glDeleteTextures(1, &texture_);
    }

    glGenTextures(1, &texture_);
    glBindTexture(GL_TEXTURE_2D, texture_);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, width, height, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    glBindTexture(GL_TEXTURE_2D, 0);

    texture_width_ = width;
    texture_height_ = height;
}

void Renderer::present(const Framebuffer& framebuffer) {
    if (!is_initialized_) return;

    if (framebuffer.getWidth() != texture_width_ || framebuffer.getHeight() != texture_height_) {
        createTexture(framebuffer.getWidth(), framebuffer.getHeight());
    }

    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, texture_);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, texture_width_, texture_height_,
                    GL_RGBA, GL_UNSIGNED_BYTE, framebuffer.data());

    glUseProgram(shader_program_);
    glUniform1i(texture_loc_, 0);

    glBindVertexArray(vao_);
    glDrawArrays(GL_TRIANGLES, 0, 3);
    glBindVertexArray(0);

    checkGLError("Renderer::present");
}

void Renderer::onResize(int width, int height) {
    glViewport(0, 0, width, height);
}

} // namespace gravsim
