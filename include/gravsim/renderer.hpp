#pragma once

#include "gravsim/framebuffer.hpp"
#include <GL/glew.h>

namespace gravsim {

// Presents a Framebuffer through OpenGL: the pixels are streamed into a
// texture and drawn over the whole window.
class Renderer {
public:
    Renderer();
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Requires a current OpenGL 3.3 context
    void initialize(int width, int height);

    // Cleanup resources
    void cleanup();

    // Upload and draw the framebuffer
    void present(const Framebuffer& framebuffer);

    // Window resize handling
    void onResize(int width, int height);

private:
    // OpenGL objects
    GLuint shader_program_;
    GLuint vao_;
    GLuint texture_;
    GLint texture_loc_;

    int texture_width_;
    int texture_height_;
    bool is_initialized_;

    // Shader compilation
    void compileShaders();
    GLuint compileShader(GLenum type, const char* source);
    void checkShaderCompilation(GLuint shader);
    void checkProgramLinking(GLuint program);
    void createTexture(int width, int height);
};

// Throws OpenGLException if the GL error flag is set
void checkGLError(const char* operation);

// Shader source code
extern const char* VERTEX_SHADER_SOURCE;
extern const char* FRAGMENT_SHADER_SOURCE;

} // namespace gravsim
