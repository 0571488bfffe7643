#include <parexec/config.hh>
#include <parexec/macros/throw.hh>

using std::string;

namespace {

constexpr const char* VARIABLES[] = {
    "scratch_root",
    "compile_timeout_ms",
    "thread_parallel_execute_timeout_ms",
    "process_parallel_execute_timeout_ms",
    "thread_parallel_max_workers",
    "process_parallel_max_workers",
    "max_output_bytes",
    "max_source_bytes",
    "max_executable_file_size_bytes",
    "stale_workspace_max_age_s",
    "deny_patterns",
    "c_compiler",
    "cpp_compiler",
    "mpi_c_compiler",
    "mpi_cpp_compiler",
    "mpi_launcher",
    "child_path",
    "stdlog",
    "errlog",
};

ConfigFile make_config_file() {
    ConfigFile cf;
    for (const char* name : VARIABLES) {
        cf.add_vars(name);
    }
    return cf;
}

const ConfigFile::Variable& scalar_var(const ConfigFile& cf, const char* name) {
    const auto& var = cf[name];
    if (var.is_set() and var.is_array()) {
        THROW("config: variable `", name, "` has to be a single value, not an array");
    }
    return var;
}

// Sets @p dest to the value of variable @p name if it is set
template <class T>
void load_positive_number(const ConfigFile& cf, const char* name, T& dest) {
    const auto& var = scalar_var(cf, name);
    if (not var.is_set()) {
        return;
    }
    auto val = var.as<T>();
    if (not val or *val <= 0) {
        THROW(
            "config: variable `", name, "` has to be a positive integer, got: `", var.as_string(), '`'
        );
    }
    dest = *val;
}

void load_string(const ConfigFile& cf, const char* name, string& dest) {
    const auto& var = scalar_var(cf, name);
    if (not var.is_set()) {
        return;
    }
    if (var.as_string().empty()) {
        THROW("config: variable `", name, "` cannot be empty");
    }
    dest = var.as_string();
}

template <class Duration>
void load_duration(const ConfigFile& cf, const char* name, Duration& dest) {
    auto count = dest.count();
    load_positive_number(cf, name, count);
    dest = Duration{count};
}

} // namespace

namespace parexec {

Config Config::from_config_file(const ConfigFile& cf) {
    Config res;
    load_string(cf, "scratch_root", res.scratch_root);
    load_duration(cf, "compile_timeout_ms", res.compile_timeout);
    load_duration(cf, "thread_parallel_execute_timeout_ms", res.thread_parallel_execute_timeout);
    load_duration(cf, "process_parallel_execute_timeout_ms", res.process_parallel_execute_timeout);
    load_positive_number(cf, "thread_parallel_max_workers", res.thread_parallel_max_workers);
    load_positive_number(cf, "process_parallel_max_workers", res.process_parallel_max_workers);
    load_positive_number(cf, "max_output_bytes", res.max_output_bytes);
    load_positive_number(cf, "max_source_bytes", res.max_source_bytes);
    load_positive_number(
        cf, "max_executable_file_size_bytes", res.max_executable_file_size_bytes
    );
    load_duration(cf, "stale_workspace_max_age_s", res.stale_workspace_max_age);

    if (const auto& var = cf["deny_patterns"]; var.is_set()) {
        if (not var.is_array()) {
            THROW("config: variable `deny_patterns` has to be an array");
        }
        for (const auto& patt : var.as_array()) {
            if (patt.empty()) {
                THROW("config: variable `deny_patterns` cannot contain an empty pattern");
            }
        }
        res.deny_patterns = var.as_array();
    }

    load_string(cf, "c_compiler", res.c_compiler);
    load_string(cf, "cpp_compiler", res.cpp_compiler);
    load_string(cf, "mpi_c_compiler", res.mpi_c_compiler);
    load_string(cf, "mpi_cpp_compiler", res.mpi_cpp_compiler);
    load_string(cf, "mpi_launcher", res.mpi_launcher);
    load_string(cf, "child_path", res.child_path);

    if (const auto& var = scalar_var(cf, "stdlog"); var.is_set() and !var.as_string().empty()) {
        res.stdlog_file = var.as_string();
    }
    if (const auto& var = scalar_var(cf, "errlog"); var.is_set() and !var.as_string().empty()) {
        res.errlog_file = var.as_string();
    }
    return res;
}

Config Config::load_from_file(const string& path) {
    auto cf = make_config_file();
    cf.load_config_from_file(path);
    return from_config_file(cf);
}

Config Config::load_from_string(string config) {
    auto cf = make_config_file();
    cf.load_config_from_string(std::move(config));
    return from_config_file(cf);
}

} // namespace parexec
