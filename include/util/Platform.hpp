#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace halcyon::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();

    // Whitespace-separated argv; double quotes group words
    static std::vector<std::string> split_command(const std::string& command);
};

}  // namespace halcyon::util
