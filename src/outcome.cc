#include <parexec/outcome.hh>
#include <parexec/overloaded.hh>

namespace parexec {

std::string_view classification(const CompileOutcome& outcome) noexcept {
    return std::visit(
        overloaded{
            [](const outcome::Success& /*unused*/) -> std::string_view { return "Success"; },
            [](const outcome::CompileError& ce) -> std::string_view {
                return ce.cancelled ? "Cancelled" : "Compilation Error";
            },
            [](const outcome::RuntimeError& re) -> std::string_view {
                return re.cancelled ? "Cancelled" : "Runtime Error";
            },
            [](const outcome::Timeout& t) -> std::string_view {
                return t.phase == Phase::COMPILE ? "Compilation Timeout" : "Execution Timeout";
            },
            [](const outcome::Rejected& /*unused*/) -> std::string_view { return "Rejected"; },
            [](const outcome::ResourceExhausted& /*unused*/) -> std::string_view {
                return "Resource Exhausted";
            },
            [](const outcome::ToolchainError& /*unused*/) -> std::string_view {
                return "Toolchain Error";
            },
        },
        outcome
    );
}

} // namespace parexec
