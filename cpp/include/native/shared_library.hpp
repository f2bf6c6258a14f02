#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace dg {

/**
 * Thrown when none of the candidate paths could be opened.
 *
 * what() lists every candidate together with the loader's reason.
 */
class LibraryNotFound : public std::runtime_error {
public:
    LibraryNotFound(std::vector<std::string> candidates, const std::string& message);

    const std::vector<std::string>& candidates() const { return candidates_; }

private:
    std::vector<std::string> candidates_;
};

/**
 * Owning handle to a dlopen()ed shared library.
 *
 * Move-only; the handle is closed when the last owner goes away.
 */
class SharedLibrary {
public:
    SharedLibrary(void* handle, std::string path);
    ~SharedLibrary();

    SharedLibrary(SharedLibrary&& other) noexcept;
    SharedLibrary& operator=(SharedLibrary&& other) noexcept;

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    /**
     * Resolve an exported function.
     *
     * @param name Symbol name (extern "C")
     * @return Function pointer cast to Fn
     * @throws std::runtime_error if the library does not export it
     */
    template <typename Fn>
    Fn symbol(const char* name) const {
        return reinterpret_cast<Fn>(raw_symbol(name));
    }

    const std::string& path() const { return path_; }

private:
    void* raw_symbol(const char* name) const;
    void close();

    void* handle_;
    std::string path_;
};

// Open each candidate in order and return the first that loads.
// Throws LibraryNotFound when none do.
SharedLibrary open_first_loadable(const std::vector<std::string>& candidates,
                                  bool verbose = false);

// Same as open_first_loadable, but a failure is fatal: the error goes to
// stderr and the process exits with status 1.
SharedLibrary load_or_exit(const std::vector<std::string>& candidates,
                           bool verbose = false);

} // namespace dg
