#pragma once
#include "../common.hpp"
#include <string>

namespace dg {

// Interface for turning one SGF record into a training example
class FeatureExtractor {
public:
    virtual ~FeatureExtractor() = default;

    // Number of feature planes per example
    virtual int num_features() const = 0;

    // Extract a single example from an SGF record
    virtual ExtractResult extract(const std::string& sgf) const = 0;
};

} // namespace dg
