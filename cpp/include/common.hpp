#pragma once
#include <vector>
#include <string>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace dg {

// Points on a 19x19 board; one feature plane covers all of them
constexpr int kBoardPoints = 361;

// Size of the encoded policy field in the native Example struct
constexpr std::size_t kPolicySize = 905;

// Single training example, copied out of native memory
struct Example {
    std::vector<float> features;  // num_features × 361 planes
    int32_t index = 0;             // Move index within the game record
    int32_t color = 0;             // Side to move
    std::string policy;            // Encoded policy, up to 905 bytes
    int32_t winner = 0;            // Game outcome
    int32_t number = 0;            // Move number
};

// Outcome of one extraction call
struct ExtractResult {
    int status = 0;                  // 0 on success, opaque native code otherwise
    std::optional<Example> example;  // Present only when status == 0
};

} // namespace dg
