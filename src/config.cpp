#include "config.hpp"
#include <glog/logging.h>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, sandbox_config &config) {
    if (j.count("default_timeout_seconds"))
        j.at("default_timeout_seconds").get_to(config.default_timeout_seconds);
    if (j.count("default_memory_limit_bytes"))
        j.at("default_memory_limit_bytes").get_to(config.default_memory_limit_bytes);
    if (j.count("max_output_bytes"))
        j.at("max_output_bytes").get_to(config.max_output_bytes);
    if (j.count("denylisted_modules"))
        j.at("denylisted_modules").get_to(config.denylisted_modules);
    if (j.count("allowed_modules"))
        j.at("allowed_modules").get_to(config.allowed_modules);
    if (j.count("max_source_bytes"))
        j.at("max_source_bytes").get_to(config.max_source_bytes);
    if (j.count("python_executable"))
        config.python_executable = j.at("python_executable").get<string>();
    if (j.count("scratch_root"))
        config.scratch_root = j.at("scratch_root").get<string>();
    if (j.count("max_processes"))
        j.at("max_processes").get_to(config.max_processes);
    if (j.count("max_open_files"))
        j.at("max_open_files").get_to(config.max_open_files);
    if (j.count("use_seccomp"))
        j.at("use_seccomp").get_to(config.use_seccomp);
    if (j.count("workers"))
        j.at("workers").get_to(config.workers);
}

void to_json(json &j, const sandbox_config &config) {
    j = json{{"default_timeout_seconds", config.default_timeout_seconds},
             {"default_memory_limit_bytes", config.default_memory_limit_bytes},
             {"max_output_bytes", config.max_output_bytes},
             {"denylisted_modules", config.denylisted_modules},
             {"allowed_modules", config.allowed_modules},
             {"max_source_bytes", config.max_source_bytes},
             {"python_executable", config.python_executable.string()},
             {"scratch_root", config.scratch_root.string()},
             {"max_processes", config.max_processes},
             {"max_open_files", config.max_open_files},
             {"use_seccomp", config.use_seccomp},
             {"workers", config.workers}};
}

sandbox_config load_config(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin) throw invalid_argument("unable to open configuration file " + path.string());

    sandbox_config config;
    try {
        json j;
        fin >> j;
        j.get_to(config);
    } catch (json::exception &ex) {
        throw invalid_argument("malformed configuration file " + path.string() + ": " + ex.what());
    }
    return config;
}

sandbox_config finalize_config(sandbox_config config) {
    if (!isfinite(config.default_timeout_seconds) || config.default_timeout_seconds <= 0)
        throw invalid_argument("default_timeout_seconds must be positive");
    if (config.default_memory_limit_bytes <= 0)
        throw invalid_argument("default_memory_limit_bytes must be positive");
    if (config.max_output_bytes <= 0)
        throw invalid_argument("max_output_bytes must be positive");
    if (config.max_source_bytes <= 0)
        throw invalid_argument("max_source_bytes must be positive");
    if (config.python_executable.empty())
        throw invalid_argument("python_executable must be set");

    if (config.scratch_root.empty())
        config.scratch_root = filesystem::temp_directory_path();
    if (config.workers == 0)
        config.workers = max(1u, thread::hardware_concurrency());

    LOG(INFO) << "sandbox configured: timeout ceiling " << config.default_timeout_seconds
              << "s, memory ceiling " << config.default_memory_limit_bytes
              << " bytes, output ceiling " << config.max_output_bytes << " bytes";
    return config;
}

}  // namespace sandbox
