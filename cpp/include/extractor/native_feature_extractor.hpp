#pragma once

#include "feature_extractor.hpp"
#include "../config.hpp"
#include "../native/example_layout.hpp"
#include "../native/shared_library.hpp"

namespace dg {

/**
 * FeatureExtractor backed by the Go engine's shared library.
 *
 * The library must export
 *
 *     int get_num_features();
 *     int extract_single_example(const char* sgf, Example* out);
 *
 * The feature count is queried once at construction and fixes the
 * Example layout for the lifetime of the extractor.
 */
class NativeFeatureExtractor : public FeatureExtractor {
public:
    /**
     * Take ownership of an already loaded library.
     *
     * @param library Library exporting both entry points
     * @throws std::runtime_error if an entry point is missing
     * @throws std::invalid_argument if the library reports no features
     */
    explicit NativeFeatureExtractor(SharedLibrary library);

    /**
     * Load the first loadable candidate from the configuration.
     *
     * @throws LibraryNotFound if no candidate loads
     */
    explicit NativeFeatureExtractor(const LoaderConfig& config);

    ~NativeFeatureExtractor() override = default;

    int num_features() const override { return layout_.num_features(); }

    /**
     * Run the native extractor on one record.
     *
     * @param sgf SGF game record
     * @return Native status, with an example only when the status is 0
     */
    ExtractResult extract(const std::string& sgf) const override;

    const ExampleLayout& layout() const { return layout_; }
    const std::string& library_path() const { return library_.path(); }

private:
    using GetNumFeaturesFn = int (*)();
    using ExtractSingleExampleFn = int (*)(const char*, void*);

    SharedLibrary library_;
    GetNumFeaturesFn get_num_features_;
    ExtractSingleExampleFn extract_single_example_;
    ExampleLayout layout_;
};

} // namespace dg
