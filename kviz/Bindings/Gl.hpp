#pragma once

#include <GL/glew.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

#define GL_STRINGIFY(x) #x
#define GL_TOSTRING(x) GL_STRINGIFY(x)
#define GL_SOURCELOC __FILE__ ":" GL_TOSTRING(__LINE__)

// gl: convenience C++ bindings to OpenGL
namespace gl
{
    // an exception that specifically means something has gone wrong in
    // the OpenGL API
    class OpenGlException final : public std::exception {
        std::string m_Msg;

    public:
        explicit OpenGlException(std::string s) : m_Msg{std::move(s)} {
        }

        char const* what() const noexcept override;
    };

    static inline constexpr void swap(GLuint& a, GLuint& b) noexcept {
        GLuint tmp = a;
        a = b;
        b = tmp;
    }

    // a moveable handle to an OpenGL shader
    class ShaderHandle {
        GLuint m_ShaderHandle;

    public:
        static constexpr GLuint senteniel = 0;

        explicit ShaderHandle(GLenum type) : m_ShaderHandle{glCreateShader(type)} {
            if (m_ShaderHandle == senteniel) {
                throw OpenGlException{GL_SOURCELOC ": glCreateShader() failed: this could mean that your GPU/system is out of memory, or that your OpenGL driver is invalid in some way"};
            }
        }

        ShaderHandle(ShaderHandle const&) = delete;

        constexpr ShaderHandle(ShaderHandle&& tmp) noexcept : m_ShaderHandle{tmp.m_ShaderHandle} {
            tmp.m_ShaderHandle = senteniel;
        }

        ShaderHandle& operator=(ShaderHandle const&) = delete;

        constexpr ShaderHandle& operator=(ShaderHandle&& tmp) noexcept {
            swap(m_ShaderHandle, tmp.m_ShaderHandle);
            return *this;
        }

        ~ShaderHandle() noexcept {
            if (m_ShaderHandle != senteniel) {
                glDeleteShader(m_ShaderHandle);
            }
        }

        [[nodiscard]] constexpr GLuint get() const noexcept {
            return m_ShaderHandle;
        }
    };

    // compile a shader from source
    void CompileFromSource(ShaderHandle const&, const char* src);

    // a shader of a particular type (e.g. GL_FRAGMENT_SHADER) that owns a
    // shader handle
    template<GLuint ShaderType>
    class Shader {
        ShaderHandle m_ShaderHandle;

    public:
        static constexpr GLuint type = ShaderType;

        Shader() : m_ShaderHandle{type} {
        }

        [[nodiscard]] constexpr GLuint get() const noexcept {
            return m_ShaderHandle.get();
        }

        [[nodiscard]] constexpr ShaderHandle& handle() noexcept {
            return m_ShaderHandle;
        }

        [[nodiscard]] constexpr ShaderHandle const& handle() const noexcept {
            return m_ShaderHandle;
        }
    };

    class VertexShader : public Shader<GL_VERTEX_SHADER> {};
    class FragmentShader : public Shader<GL_FRAGMENT_SHADER> {};

    template<typename TShader>
    inline TShader CompileFromSource(const char* src) {
        TShader rv;
        CompileFromSource(rv.handle(), src);
        return rv;
    }

    // an OpenGL program (i.e. n shaders linked into one pipeline)
    class Program final {
        GLuint m_ProgramHandle;

    public:
        static constexpr GLuint senteniel = 0;

        Program() : m_ProgramHandle{glCreateProgram()} {
            if (m_ProgramHandle == senteniel) {
                throw OpenGlException{GL_SOURCELOC "glCreateProgram() failed: this could mean that your GPU/system is out of memory, or that your OpenGL driver is invalid in some way"};
            }
        }

        Program(Program const&) = delete;

        constexpr Program(Program&& tmp) noexcept : m_ProgramHandle{tmp.m_ProgramHandle} {
            tmp.m_ProgramHandle = senteniel;
        }

        Program& operator=(Program const&) = delete;

        constexpr Program& operator=(Program&& tmp) noexcept {
            swap(m_ProgramHandle, tmp.m_ProgramHandle);
            return *this;
        }

        ~Program() noexcept {
            if (m_ProgramHandle != senteniel) {
                glDeleteProgram(m_ProgramHandle);
            }
        }

        [[nodiscard]] constexpr GLuint get() const noexcept {
            return m_ProgramHandle;
        }
    };

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glUseProgram.xhtml
    inline void UseProgram(Program const& p) noexcept {
        glUseProgram(p.get());
    }

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glUseProgram.xhtml
    inline void UseProgram() noexcept {
        glUseProgram(static_cast<GLuint>(0));
    }

    template<GLuint ShaderType>
    inline void AttachShader(Program& p, Shader<ShaderType> const& s) noexcept {
        glAttachShader(p.get(), s.get());
    }

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glLinkProgram.xhtml
    void LinkProgram(Program& prog);

    inline gl::Program CreateProgramFrom(VertexShader const& vs, FragmentShader const& fs) {
        gl::Program p;
        AttachShader(p, vs);
        AttachShader(p, fs);
        LinkProgram(p);
        return p;
    }

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glGetUniformLocation.xhtml
    //     *throws on error
    [[nodiscard]] inline GLint GetUniformLocation(Program const& p, GLchar const* name) {
        GLint handle = glGetUniformLocation(p.get(), name);
        if (handle == -1) {
            throw OpenGlException{std::string{"glGetUniformLocation() failed: cannot get "} + name};
        }
        return handle;
    }

    // metadata for GLSL data types that are typically bound from the CPU via (e.g.)
    // glVertexAttribPointer
    namespace glsl {
        struct bool_ final {
            static constexpr GLint size = 1;
            static constexpr GLenum type = GL_INT;
        };
        struct vec3 final {
            static constexpr GLint size = 3;
            static constexpr GLenum type = GL_FLOAT;
        };
        struct vec4 final {
            static constexpr GLint size = 4;
            static constexpr GLenum type = GL_FLOAT;
        };
        struct mat4 final {
            static constexpr GLint size = 16;
            static constexpr GLenum type = GL_FLOAT;
        };
    }

    // a uniform shader symbol (e.g. `uniform mat4 uProjectionMatrix`) at a
    // particular location in a linked OpenGL program
    template<typename TGlsl>
    class Uniform_ {
        GLint m_UniformLocation;

    public:
        Uniform_(Program const& p, GLchar const* name) : m_UniformLocation{GetUniformLocation(p, name)} {
        }

        [[nodiscard]] constexpr GLint geti() const noexcept {
            return m_UniformLocation;
        }
    };

    class UniformBool : public Uniform_<glsl::bool_> {
        using Uniform_::Uniform_;
    };
    class UniformVec3 : public Uniform_<glsl::vec3> {
        using Uniform_::Uniform_;
    };
    class UniformVec4 : public Uniform_<glsl::vec4> {
        using Uniform_::Uniform_;
    };
    class UniformMat4 : public Uniform_<glsl::mat4> {
        using Uniform_::Uniform_;
    };

    // set the value of a `bool` uniform
    inline void Uniform(UniformBool& u, bool v) noexcept {
        glUniform1i(u.geti(), v);
    }

    // set the value of a `vec3` uniform
    inline void Uniform(UniformVec3& u, float const vs[3]) noexcept {
        glUniform3fv(u.geti(), 1, vs);
    }

    // set the value of a `vec4` uniform
    inline void Uniform(UniformVec4& u, float const vs[4]) noexcept {
        glUniform4fv(u.geti(), 1, vs);
    }

    // set the value of a `mat4` uniform (column-major)
    inline void Uniform(UniformMat4& u, float const vs[16]) noexcept {
        glUniformMatrix4fv(u.geti(), 1, GL_FALSE, vs);
    }

    // an attribute shader symbol (e.g. `in vec3 aPos`) at a particular
    // location in a linked OpenGL program
    template<typename TGlsl>
    class Attribute {
        GLint m_AttributeLocation;

    public:
        using glsl_type = TGlsl;

        constexpr explicit Attribute(GLint location) noexcept : m_AttributeLocation{location} {
        }

        [[nodiscard]] constexpr GLuint get() const noexcept {
            return static_cast<GLuint>(m_AttributeLocation);
        }
    };

    using AttributeVec3 = Attribute<glsl::vec3>;
    using AttributeVec4 = Attribute<glsl::vec4>;

    // set the attribute pointer parameters for an attribute, which specifies
    // how the attribute reads its data from an OpenGL buffer
    template<typename TGlsl>
    inline void VertexAttribPointer(Attribute<TGlsl> const& attr,
                                    bool normalized,
                                    size_t stride,
                                    size_t offset) noexcept {

        static_assert(TGlsl::size <= 4);

        GLboolean normgl = normalized ? GL_TRUE : GL_FALSE;
        GLsizei stridegl = static_cast<GLsizei>(stride);
        void* offsetgl = reinterpret_cast<void*>(offset);

        glVertexAttribPointer(attr.get(), TGlsl::size, TGlsl::type, normgl, stridegl, offsetgl);
    }

    // enable an attribute, which effectively makes it load data from the bound
    // OpenGL buffer during a draw call
    template<typename TGlsl>
    inline void EnableVertexAttribArray(Attribute<TGlsl> const& loc) noexcept {
        glEnableVertexAttribArray(loc.get());
    }

    // a moveable handle to an OpenGL buffer (e.g. GL_ARRAY_BUFFER)
    class BufferHandle {
        GLuint m_BufferHandle;

    public:
        static constexpr GLuint senteniel = 0;

        BufferHandle() {
            glGenBuffers(1, &m_BufferHandle);
            if (m_BufferHandle == senteniel) {
                throw OpenGlException{GL_SOURCELOC "glGenBuffers() failed: this could mean that your GPU/system is out of memory, or that your OpenGL driver is invalid in some way"};
            }
        }

        BufferHandle(BufferHandle const&) = delete;

        constexpr BufferHandle(BufferHandle&& tmp) noexcept : m_BufferHandle{tmp.m_BufferHandle} {
            tmp.m_BufferHandle = senteniel;
        }

        BufferHandle& operator=(BufferHandle const&) = delete;

        constexpr BufferHandle& operator=(BufferHandle&& tmp) noexcept {
            swap(m_BufferHandle, tmp.m_BufferHandle);
            return *this;
        }

        ~BufferHandle() noexcept {
            if (m_BufferHandle != senteniel) {
                glDeleteBuffers(1, &m_BufferHandle);
            }
        }

        [[nodiscard]] constexpr GLuint get() const noexcept {
            return m_BufferHandle;
        }
    };

    // an OpenGL buffer with compile-time known:
    //
    // - user type (T)
    // - OpenGL type (BufferType, e.g. GL_ARRAY_BUFFER)
    // - usage (e.g. GL_STATIC_DRAW)
    //
    // must be a trivially copyable type with a standard layout, because its
    // data transfers onto the GPU
    template<typename T, GLenum TBuffer, GLenum Usage>
    class Buffer : public BufferHandle {
        using size_type = uint32_t;
        size_type m_BufferSz = 0;

    public:
        static_assert(std::is_trivially_copyable<T>::value);
        static_assert(std::is_standard_layout<T>::value);

        using value_type = T;
        static constexpr GLenum BufferType = TBuffer;

        Buffer() = default;

        [[nodiscard]] constexpr GLsizei sizei() const noexcept {
            return static_cast<GLsizei>(m_BufferSz);
        }

        void assign(T const* begin, size_t n) {
            if (n > std::numeric_limits<size_type>::max()) {
                throw OpenGlException{"tried to assign a buffer that is bigger than the max supported size"};
            }

            glBindBuffer(BufferType, get());
            glBufferData(BufferType, static_cast<GLsizeiptr>(sizeof(T) * n), begin, Usage);
            m_BufferSz = static_cast<size_type>(n);
        }

        template<typename Container>
        void assign(Container const& c) {
            assign(c.data(), c.size());
        }
    };

    template<typename T, GLenum Usage = GL_DYNAMIC_DRAW>
    class ArrayBuffer : public Buffer<T, GL_ARRAY_BUFFER, Usage> {
        using Buffer<T, GL_ARRAY_BUFFER, Usage>::Buffer;
    };

    template<typename T, GLenum Usage = GL_DYNAMIC_DRAW>
    class ElementArrayBuffer : public Buffer<T, GL_ELEMENT_ARRAY_BUFFER, Usage> {
        static_assert(std::is_unsigned_v<T>, "element indicies should be unsigned integers");
        static_assert(sizeof(T) <= 4);
        using Buffer<T, GL_ELEMENT_ARRAY_BUFFER, Usage>::Buffer;
    };

    template<typename Buffer>
    inline void BindBuffer(Buffer const& buf) noexcept {
        glBindBuffer(Buffer::BufferType, buf.get());
    }

    // a handle to an OpenGL VAO with RAII semantics for glGenVertexArrays etc.
    class VertexArray final {
        GLuint m_VaoHandle;

    public:
        static constexpr GLuint senteniel = 0;

        VertexArray() {
            glGenVertexArrays(1, &m_VaoHandle);
            if (m_VaoHandle == senteniel) {
                throw OpenGlException{GL_SOURCELOC "glGenVertexArrays() failed: this could mean that your GPU/system is out of memory, or that your OpenGL driver is invalid in some way"};
            }
        }

        VertexArray(VertexArray const&) = delete;

        constexpr VertexArray(VertexArray&& tmp) noexcept : m_VaoHandle{tmp.m_VaoHandle} {
            tmp.m_VaoHandle = senteniel;
        }

        VertexArray& operator=(VertexArray const&) = delete;

        constexpr VertexArray& operator=(VertexArray&& tmp) noexcept {
            swap(m_VaoHandle, tmp.m_VaoHandle);
            return *this;
        }

        ~VertexArray() noexcept {
            if (m_VaoHandle != senteniel) {
                glDeleteVertexArrays(1, &m_VaoHandle);
            }
        }

        [[nodiscard]] constexpr GLuint get() const noexcept {
            return m_VaoHandle;
        }
    };

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glBindVertexArray.xhtml
    inline void BindVertexArray(VertexArray const& vao) noexcept {
        glBindVertexArray(vao.get());
    }

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glBindVertexArray.xhtml
    inline void BindVertexArray() noexcept {
        glBindVertexArray(static_cast<GLuint>(0));
    }

    // https://www.khronos.org/registry/OpenGL-Refpages/es3.0/html/glClear.xhtml
    inline void Clear(GLbitfield mask) noexcept {
        glClear(mask);
    }

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glClearColor.xhtml
    inline void ClearColor(GLfloat red, GLfloat green, GLfloat blue, GLfloat alpha) noexcept {
        glClearColor(red, green, blue, alpha);
    }

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glViewport.xhtml
    inline void Viewport(GLint x, GLint y, GLsizei w, GLsizei h) noexcept {
        glViewport(x, y, w, h);
    }

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glDrawElements.xhtml
    inline void DrawElements(GLenum mode, GLsizei count, GLenum type, const void* indices) noexcept {
        glDrawElements(mode, count, type, indices);
    }

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glEnable.xhtml
    inline void Enable(GLenum cap) noexcept {
        glEnable(cap);
    }

    // https://www.khronos.org/registry/OpenGL-Refpages/gl4/html/glEnable.xhtml
    inline void Disable(GLenum cap) noexcept {
        glDisable(cap);
    }
}
