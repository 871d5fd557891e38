#include "arbor/Renderer.hpp"

#include <glad/glad.h>
#include <algorithm>
#include <iostream>

namespace arbor
{
    Renderer::~Renderer()
    {
        shutdown();
    }

    uint32_t Renderer::compileShader(const uint32_t type, const char *src)
    {
        const GLuint s = glCreateShader(type);
        glShaderSource(s, 1, &src, nullptr);
        glCompileShader(s);

        GLint ok = 0;
        glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
        if (!ok)
        {
            char log[4096];
            glGetShaderInfoLog(s, static_cast<GLsizei>(sizeof(log)), nullptr, log);
            std::cerr << "Shader compile error:\n" << log << "\n";
        }
        return s;
    }

    uint32_t Renderer::makeProgram(const char *vs, const char *fs)
    {
        const GLuint v = compileShader(GL_VERTEX_SHADER, vs);
        const GLuint f = compileShader(GL_FRAGMENT_SHADER, fs);

        const GLuint p = glCreateProgram();
        glAttachShader(p, v);
        glAttachShader(p, f);
        glLinkProgram(p);

        GLint ok = 0;
        glGetProgramiv(p, GL_LINK_STATUS, &ok);
        if (!ok)
        {
            char log[4096];
            glGetProgramInfoLog(p, static_cast<GLsizei>(sizeof(log)), nullptr, log);
            std::cerr << "Program link error:\n" << log << "\n";
            glDeleteShader(v);
            glDeleteShader(f);
            glDeleteProgram(p);
            return 0;
        }

        glDeleteShader(v);
        glDeleteShader(f);
        return p;
    }

    void Renderer::makeVertexArray(uint32_t &vao, uint32_t &vbo)
    {
        glGenVertexArrays(1, &vao);
        glGenBuffers(1, &vbo);
        glBindVertexArray(vao);
        glBindBuffer(GL_ARRAY_BUFFER, vbo);
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(sizeof(LineVertex) * 1024), nullptr,
                     GL_DYNAMIC_DRAW);

        // pos
        glEnableVertexAttribArray(0);
        glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(LineVertex), static_cast<void *>(nullptr));
        // color
        glEnableVertexAttribArray(1);
        glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, sizeof(LineVertex),
                              reinterpret_cast<void *>(2 * sizeof(float)));

        glBindVertexArray(0);
    }

    bool Renderer::init()
    {
        if (m_inited)
            return true;

        const auto VS = R"(
        #version 330 core
        layout(location=0) in vec2 aPos;
        layout(location=1) in vec4 aColor;

        uniform mat4 uProj;
        out vec4 vColor;

        void main(){
            gl_Position = uProj * vec4(aPos, 0.0, 1.0);
            vColor = aColor;
        }
    )";

        const auto FS = R"(
        #version 330 core
        in vec4 vColor;
        out vec4 FragColor;

        void main(){
            FragColor = vColor;
        }
    )";

        m_prog = makeProgram(VS, FS);
        if (!m_prog)
            return false;
        m_uProj = glGetUniformLocation(m_prog, "uProj");

        makeVertexArray(m_vaoBands, m_vboBands);
        makeVertexArray(m_vaoLines, m_vboLines);

        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

        m_inited = true;
        return true;
    }

    void Renderer::shutdown()
    {
        if (!m_inited)
            return;

        if (m_vboLines)
            glDeleteBuffers(1, &m_vboLines);
        if (m_vaoLines)
            glDeleteVertexArrays(1, &m_vaoLines);

        if (m_vboBands)
            glDeleteBuffers(1, &m_vboBands);
        if (m_vaoBands)
            glDeleteVertexArrays(1, &m_vaoBands);

        if (m_prog)
            glDeleteProgram(m_prog);

        m_vboLines = m_vaoLines = 0;
        m_vboBands = m_vaoBands = 0;
        m_prog     = 0;

        m_inited = false;
    }

    void Renderer::resize(const int w, const int h)
    {
        m_w = std::max(1, w);
        m_h = std::max(1, h);
        glViewport(0, 0, m_w, m_h);
    }

    void Renderer::setProjection(const Mat4 &proj)
    {
        m_proj = proj;
    }

    void Renderer::clear() const
    {
        glClearColor(m_clear[0], m_clear[1], m_clear[2], 1.f);
        glClear(GL_COLOR_BUFFER_BIT);
    }

    void Renderer::upload(const uint32_t vbo, const std::vector<LineVertex> &verts)
    {
        glBindBuffer(GL_ARRAY_BUFFER, vbo);
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(verts.size() * sizeof(LineVertex)), verts.data(),
                     GL_DYNAMIC_DRAW);
    }

    void Renderer::uploadBands(const std::vector<LineVertex> &triangles)
    {
        m_bandVertexCount = static_cast<int>(triangles.size());
        upload(m_vboBands, triangles);
    }

    void Renderer::drawBands() const
    {
        if (!m_showBands)
            return;
        if (m_bandVertexCount < 3)
            return;

        glUseProgram(m_prog);
        glUniformMatrix4fv(m_uProj, 1, GL_FALSE, m_proj.m);

        glBindVertexArray(m_vaoBands);
        glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(m_bandVertexCount));
        glBindVertexArray(0);
    }

    void Renderer::uploadLines(const std::vector<LineVertex> &lines)
    {
        m_lineVertexCount = static_cast<int>(lines.size());
        upload(m_vboLines, lines);
    }

    void Renderer::drawLines() const
    {
        if (m_lineVertexCount <= 1)
            return;

        glUseProgram(m_prog);
        glUniformMatrix4fv(m_uProj, 1, GL_FALSE, m_proj.m);

        glBindVertexArray(m_vaoLines);
        glDrawArrays(GL_LINES, 0, static_cast<GLsizei>(m_lineVertexCount));
        glBindVertexArray(0);
    }
} // namespace arbor
