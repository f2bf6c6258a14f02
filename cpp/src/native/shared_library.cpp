#include "native/shared_library.hpp"
#include <dlfcn.h>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace dg {

LibraryNotFound::LibraryNotFound(std::vector<std::string> candidates, const std::string& message)
    : std::runtime_error(message), candidates_(std::move(candidates)) {}

SharedLibrary::SharedLibrary(void* handle, std::string path)
    : handle_(handle), path_(std::move(path)) {}

SharedLibrary::~SharedLibrary() {
    close();
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr)),
      path_(std::move(other.path_)) {}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept {
    if (this != &other) {
        close();
        handle_ = std::exchange(other.handle_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

void SharedLibrary::close() {
    if (handle_ != nullptr) {
        dlclose(handle_);
        handle_ = nullptr;
    }
}

void* SharedLibrary::raw_symbol(const char* name) const {
    if (handle_ == nullptr) {
        throw std::runtime_error("symbol lookup on a closed library: " + std::string(name));
    }

    dlerror();  // Clear any stale error
    void* address = dlsym(handle_, name);
    if (address == nullptr) {
        throw std::runtime_error("undefined symbol: " + std::string(name) + " in " + path_);
    }
    return address;
}

SharedLibrary open_first_loadable(const std::vector<std::string>& candidates, bool verbose) {
    std::string reasons;

    for (const auto& path : candidates) {
        dlerror();
        void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (handle != nullptr) {
            if (verbose) {
                std::cerr << "[dg_go] loaded " << path << std::endl;
            }
            return SharedLibrary(handle, path);
        }

        const char* err = dlerror();
        std::string reason = err ? err : "unknown error";
        if (verbose) {
            std::cerr << "[dg_go] failed to load " << path << ": " << reason << std::endl;
        }
        reasons += "\n  " + path + ": " + reason;
    }

    if (candidates.empty()) {
        reasons = " (no candidates)";
    }
    throw LibraryNotFound(candidates, "Failed to load the shared library" + reasons);
}

SharedLibrary load_or_exit(const std::vector<std::string>& candidates, bool verbose) {
    try {
        return open_first_loadable(candidates, verbose);
    } catch (const LibraryNotFound& e) {
        // what() names every candidate with its dlerror() reason
        std::cerr << "[dg_go] " << e.what() << std::endl;
        std::exit(1);
    }
}

} // namespace dg
