#pragma once
#include <string>
#include <vector>

namespace dg {

// Where to look for the native library and how loudly
struct LoaderConfig {
    std::vector<std::string> candidates;  // Tried in order, first loadable wins
    bool verbose = false;                 // Log each failed candidate to stderr

    // ./libdg_go.so, then ./libgo.so; quiet
    static LoaderConfig defaults();

    // Defaults overridden by the environment:
    //   DG_GO_LIBRARY  colon-separated paths tried before the defaults
    //   DG_GO_VERBOSE  1/true/yes/on enables verbose loading
    static LoaderConfig from_environment();
};

// Split a colon-separated path list, dropping empty entries
std::vector<std::string> split_path_list(const std::string& value);

// Interpret an environment flag; unset or unrecognised values are false
bool parse_flag(const char* value);

} // namespace dg
