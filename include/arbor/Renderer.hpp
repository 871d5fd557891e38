#pragma once
#include <cstdint>
#include <vector>

#include "Math.hpp"
#include "RenderTypes.hpp"

namespace arbor
{
    class Renderer
    {
        public:
            Renderer() = default;
            ~Renderer();

            bool init();
            void shutdown();

            void resize(int w, int h);
            void setProjection(const Mat4 &proj);
            void clear() const;

            // Translucent bands behind the lines: triangles
            void uploadBands(const std::vector<LineVertex> &triangles);
            void drawBands() const;

            void uploadLines(const std::vector<LineVertex> &lines); // pairs (A,B)
            void drawLines() const;

            void setShowBands(const bool v)
            {
                m_showBands = v;
            }

            [[nodiscard]] bool showBands() const
            {
                return m_showBands;
            }

        private:
            bool m_inited = false;

            int  m_w    = 1;
            int  m_h    = 1;
            Mat4 m_proj = Mat4::identity();

            float m_clear[3] = {0.96f, 0.95f, 0.92f};

            bool m_showBands = true;

            uint32_t m_prog  = 0;
            int      m_uProj = -1;

            uint32_t m_vaoBands        = 0;
            uint32_t m_vboBands        = 0;
            int      m_bandVertexCount = 0;

            uint32_t m_vaoLines        = 0;
            uint32_t m_vboLines        = 0;
            int      m_lineVertexCount = 0;

        private:
            static uint32_t compileShader(uint32_t type, const char *src);
            static uint32_t makeProgram(const char *vs, const char *fs);

            static void makeVertexArray(uint32_t &vao, uint32_t &vbo);
            static void upload(uint32_t vbo, const std::vector<LineVertex> &verts);
    };
} // namespace arbor
