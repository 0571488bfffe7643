#pragma once

#include <parexec/cancellation_token.hh>
#include <parexec/config.hh>
#include <parexec/mode.hh>
#include <parexec/result_normalizer.hh>
#include <parexec/workspace.hh>
#include <string_view>

namespace parexec {

class Compiler {
public:
    Compiler() = default;
    Compiler(const Compiler&) = delete;
    Compiler(Compiler&&) = delete;
    Compiler& operator=(const Compiler&) = delete;
    Compiler& operator=(Compiler&&) = delete;

    virtual ~Compiler() = default;

    /**
     * @brief Writes @p source into @p ws and compiles it into the artifact
     * @details The compiler process is killed once @p token is cancelled or
     *   expires. Must be thread-safe.
     *
     * @errors Throws std::runtime_error on host-level failures (e.g. the
     *   compiler cannot be executed)
     */
    virtual CompilationResult compile(
        const Workspace& ws,
        std::string_view source,
        Mode mode,
        Language lang,
        const CancellationToken& token
    ) const = 0;
};

// Invokes the compilers named in the config
class ToolchainCompiler : public Compiler {
    const Config& config_;

public:
    explicit ToolchainCompiler(const Config& config) : config_(config) {}

    CompilationResult compile(
        const Workspace& ws,
        std::string_view source,
        Mode mode,
        Language lang,
        const CancellationToken& token
    ) const override;
};

} // namespace parexec
