#include "extractor/native_feature_extractor.hpp"
#include <utility>

namespace dg {

NativeFeatureExtractor::NativeFeatureExtractor(SharedLibrary library)
    : library_(std::move(library)),
      get_num_features_(library_.symbol<GetNumFeaturesFn>("get_num_features")),
      extract_single_example_(library_.symbol<ExtractSingleExampleFn>("extract_single_example")),
      layout_(get_num_features_()) {}

NativeFeatureExtractor::NativeFeatureExtractor(const LoaderConfig& config)
    : NativeFeatureExtractor(open_first_loadable(config.candidates, config.verbose)) {}

ExtractResult NativeFeatureExtractor::extract(const std::string& sgf) const {
    ExampleBuffer buffer(layout_);

    ExtractResult result;
    result.status = extract_single_example_(sgf.c_str(), buffer.data());
    if (result.status == 0) {
        result.example = buffer.to_example();
    }

    return result;
}

} // namespace dg
