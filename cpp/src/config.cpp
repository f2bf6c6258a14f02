#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace dg {

LoaderConfig LoaderConfig::defaults() {
    LoaderConfig config;
    config.candidates = {"./libdg_go.so", "./libgo.so"};
    config.verbose = false;
    return config;
}

LoaderConfig LoaderConfig::from_environment() {
    LoaderConfig config = defaults();

    if (const char* paths = std::getenv("DG_GO_LIBRARY")) {
        std::vector<std::string> extra = split_path_list(paths);
        config.candidates.insert(config.candidates.begin(), extra.begin(), extra.end());
    }
    config.verbose = parse_flag(std::getenv("DG_GO_VERBOSE"));

    return config;
}

std::vector<std::string> split_path_list(const std::string& value) {
    std::vector<std::string> paths;
    std::istringstream stream(value);
    std::string path;

    while (std::getline(stream, path, ':')) {
        if (!path.empty()) {
            paths.push_back(path);
        }
    }
    return paths;
}

bool parse_flag(const char* value) {
    if (value == nullptr) {
        return false;
    }

    std::string flag(value);
    std::transform(flag.begin(), flag.end(), flag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return flag == "1" || flag == "true" || flag == "yes" || flag == "on";
}

} // namespace dg
