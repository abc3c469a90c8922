#pragma once

#include <string>
#include <vector>

namespace coderun::config {

struct RunnerConfig {
    double time_limit_s = 10.0;
    std::string temp_dir_name = "temp_files";
    std::vector<std::string> python_candidates = {"python3", "python"};
    std::string c_compiler = "gcc";
    std::string cpp_compiler = "g++";
    std::string java_compiler = "javac";
    std::string java_launcher = "java";
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    RunnerConfig runner;
    LoggingConfig logging;
};

}  // namespace coderun::config
