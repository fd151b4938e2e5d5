#include "SceneRenderer.hpp"

#include "kviz/Bindings/Gl.hpp"
#include "kviz/Graphics/Color.hpp"
#include "kviz/Graphics/Mesh.hpp"
#include "kviz/Graphics/MeshTopology.hpp"
#include "kviz/Maths/PolarPerspectiveCamera.hpp"
#include "kviz/Scene/Actor.hpp"
#include "kviz/Scene/Scene.hpp"
#include "kviz/Utils/UID.hpp"

#include <glm/gtc/type_ptr.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
#include <nonstd/span.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace
{
    char const g_VertexShader[] = R"(
        #version 330 core

        uniform mat4 uViewProjMat;

        layout (location = 0) in vec3 aPos;
        layout (location = 1) in vec4 aColor;

        out vec3 FragWorldPos;
        out vec4 VertColor;

        void main()
        {
            FragWorldPos = aPos;
            VertColor = aColor;
            gl_Position = uViewProjMat * vec4(aPos, 1.0);
        }
    )";

    // triangles are flat-shaded with a normal computed from screen-space derivatives,
    // so meshes don't need to carry normals
    char const g_FragmentShader[] = R"(
        #version 330 core

        uniform vec4 uColor;
        uniform bool uIsLit;
        uniform vec3 uLightDir;

        in vec3 FragWorldPos;
        in vec4 VertColor;

        out vec4 FragColor;

        void main()
        {
            vec4 color = uColor * VertColor;
            if (uIsLit)
            {
                vec3 normal = normalize(cross(dFdx(FragWorldPos), dFdy(FragWorldPos)));
                float diffuse = abs(dot(normal, uLightDir));
                color.rgb *= 0.3 + 0.7*diffuse;
            }
            FragColor = color;
        }
    )";

    struct GpuVertex final {
        glm::vec3 pos;
        glm::vec4 color;
    };

    // CPU-side data that is uploaded for one mesh
    //
    // lines with per-line colors are "exploded" so that each line has its own
    // two (colored) vertices
    void PackMesh(kviz::Mesh const& mesh, std::vector<GpuVertex>& verts, std::vector<uint32_t>& indices)
    {
        verts.clear();
        indices.clear();

        nonstd::span<glm::vec3 const> const meshVerts = mesh.getVerts();
        nonstd::span<uint32_t const> const meshIndices = mesh.getIndices();
        nonstd::span<kviz::Color const> const cellColors = mesh.getCellColors();

        if (mesh.getTopology() == kviz::MeshTopology::Lines && !cellColors.empty())
        {
            size_t const numLines = mesh.getNumPrimitives();
            for (size_t line = 0; line < numLines; ++line)
            {
                glm::vec4 const color = line < cellColors.size() ? glm::vec4{cellColors[line]} : glm::vec4{1.0f};
                for (size_t i = 0; i < 2; ++i)
                {
                    indices.push_back(static_cast<uint32_t>(verts.size()));
                    verts.push_back({meshVerts[meshIndices[2*line + i]], color});
                }
            }
            return;
        }

        verts.reserve(meshVerts.size());
        for (glm::vec3 const& v : meshVerts)
        {
            verts.push_back({v, glm::vec4{1.0f}});
        }
        indices.assign(meshIndices.begin(), meshIndices.end());
    }

    // GPU-side copy of one actor's mesh
    struct GpuMesh final {
        kviz::UID version = kviz::UID::invalid();
        gl::ArrayBuffer<GpuVertex> vbo;
        gl::ElementArrayBuffer<uint32_t> ebo;
        gl::VertexArray vao;
        GLenum mode = GL_TRIANGLES;
    };
}

class kviz::SceneRenderer::Impl final {
public:
    void draw(Scene const& scene, glm::ivec2 dims)
    {
        if (dims.x <= 0 || dims.y <= 0)
        {
            return;
        }

        Color const& bg = scene.getBackgroundColor();
        gl::Viewport(0, 0, dims.x, dims.y);
        gl::ClearColor(bg.r, bg.g, bg.b, bg.a);
        gl::Clear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        garbageCollect(scene);

        PolarPerspectiveCamera const& camera = scene.getCamera();
        float const aspectRatio = static_cast<float>(dims.x) / static_cast<float>(dims.y);
        glm::mat4 const viewProj = camera.getProjMtx(aspectRatio) * camera.getViewMtx();
        glm::vec3 const lightDir = glm::normalize(-camera.focusPoint - camera.getPos());

        gl::UseProgram(m_Program);
        gl::Uniform(m_ViewProjMat, glm::value_ptr(viewProj));
        gl::Uniform(m_LightDir, glm::value_ptr(lightDir));

        // opaque actors first, then blended ones (without depth writes)
        gl::Enable(GL_DEPTH_TEST);
        gl::Disable(GL_BLEND);
        for (auto const& actor : scene.getActors())
        {
            if (actor->getOpacity() >= 1.0f)
            {
                drawActor(*actor);
            }
        }

        gl::Enable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glDepthMask(GL_FALSE);
        for (auto const& actor : scene.getActors())
        {
            if (actor->getOpacity() < 1.0f && actor->getOpacity() > 0.0f)
            {
                drawActor(*actor);
            }
        }
        glDepthMask(GL_TRUE);
        gl::Disable(GL_BLEND);

        gl::BindVertexArray();
        gl::UseProgram();
    }

private:
    void drawActor(Actor const& actor)
    {
        Mesh const& mesh = actor.getMesh();
        if (mesh.getIndices().empty())
        {
            return;
        }

        GpuMesh& gpuMesh = upload(actor.getID(), mesh);

        gl::Uniform(m_Color, ValuePtr(actor.getColor()));
        gl::Uniform(m_IsLit, gpuMesh.mode == GL_TRIANGLES);
        if (gpuMesh.mode == GL_LINES)
        {
            glLineWidth(actor.getLineWidth());
        }

        gl::BindVertexArray(gpuMesh.vao);
        gl::DrawElements(gpuMesh.mode, gpuMesh.ebo.sizei(), GL_UNSIGNED_INT, nullptr);
    }

    GpuMesh& upload(UID actorID, Mesh const& mesh)
    {
        auto [it, inserted] = m_GpuMeshes.try_emplace(actorID);
        GpuMesh& gpuMesh = it->second;

        if (!inserted && gpuMesh.version == mesh.getVersion())
        {
            return gpuMesh;
        }

        PackMesh(mesh, m_VertexScratch, m_IndexScratch);

        gl::BindVertexArray(gpuMesh.vao);
        gpuMesh.vbo.assign(m_VertexScratch);
        gpuMesh.ebo.assign(m_IndexScratch);
        gl::VertexAttribPointer(m_PosAttr, false, sizeof(GpuVertex), offsetof(GpuVertex, pos));
        gl::EnableVertexAttribArray(m_PosAttr);
        gl::VertexAttribPointer(m_ColorAttr, false, sizeof(GpuVertex), offsetof(GpuVertex, color));
        gl::EnableVertexAttribArray(m_ColorAttr);
        gl::BindVertexArray();

        gpuMesh.mode = mesh.getTopology() == MeshTopology::Lines ? GL_LINES : GL_TRIANGLES;
        gpuMesh.version = mesh.getVersion();

        return gpuMesh;
    }

    // drops GPU data for actors that are no longer in the scene
    void garbageCollect(Scene const& scene)
    {
        std::unordered_set<UID> live;
        for (auto const& actor : scene.getActors())
        {
            live.insert(actor->getID());
        }

        for (auto it = m_GpuMeshes.begin(); it != m_GpuMeshes.end();)
        {
            if (live.find(it->first) == live.end())
            {
                it = m_GpuMeshes.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    gl::Program m_Program = gl::CreateProgramFrom(
        gl::CompileFromSource<gl::VertexShader>(g_VertexShader),
        gl::CompileFromSource<gl::FragmentShader>(g_FragmentShader)
    );
    gl::UniformMat4 m_ViewProjMat{m_Program, "uViewProjMat"};
    gl::UniformVec4 m_Color{m_Program, "uColor"};
    gl::UniformBool m_IsLit{m_Program, "uIsLit"};
    gl::UniformVec3 m_LightDir{m_Program, "uLightDir"};
    gl::AttributeVec3 m_PosAttr{0};
    gl::AttributeVec4 m_ColorAttr{1};

    std::unordered_map<UID, GpuMesh> m_GpuMeshes;
    std::vector<GpuVertex> m_VertexScratch;
    std::vector<uint32_t> m_IndexScratch;
};

kviz::SceneRenderer::SceneRenderer() :
    m_Impl{std::make_unique<Impl>()}
{
}

kviz::SceneRenderer::SceneRenderer(SceneRenderer&&) noexcept = default;
kviz::SceneRenderer& kviz::SceneRenderer::operator=(SceneRenderer&&) noexcept = default;
kviz::SceneRenderer::~SceneRenderer() noexcept = default;

void kviz::SceneRenderer::draw(Scene const& scene, glm::ivec2 dims)
{
    m_Impl->draw(scene, dims);
}
