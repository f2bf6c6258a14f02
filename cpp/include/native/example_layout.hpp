#pragma once
#include "../common.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dg {

/**
 * Memory layout of the native Example struct.
 *
 * The native side declares
 *
 *     typedef struct {
 *         float features[361 * num_features];
 *         int index;
 *         int color;
 *         char policy[905];
 *         int winner;
 *         int number;
 *     } Example;
 *
 * so the layout is only known once num_features has been queried. Offsets
 * follow the C rules: every int is 4-byte aligned and the total size is
 * rounded up to the struct alignment.
 */
class ExampleLayout {
public:
    /**
     * @param num_features Feature planes reported by the native library
     * @throws std::invalid_argument if num_features <= 0
     */
    explicit ExampleLayout(int num_features);

    int num_features() const { return num_features_; }

    // Number of floats in the features array
    std::size_t feature_count() const { return feature_count_; }

    // Size of the features array in bytes
    std::size_t feature_bytes() const { return feature_count_ * sizeof(float); }

    std::size_t features_offset() const { return 0; }
    std::size_t index_offset() const { return index_offset_; }
    std::size_t color_offset() const { return color_offset_; }
    std::size_t policy_offset() const { return policy_offset_; }
    std::size_t winner_offset() const { return winner_offset_; }
    std::size_t number_offset() const { return number_offset_; }

    // Total struct size including trailing padding
    std::size_t size() const { return size_; }

    static constexpr std::size_t alignment() { return alignof(int32_t); }

private:
    int num_features_;
    std::size_t feature_count_;
    std::size_t index_offset_;
    std::size_t color_offset_;
    std::size_t policy_offset_;
    std::size_t winner_offset_;
    std::size_t number_offset_;
    std::size_t size_;
};

/**
 * Zero-initialised receiving buffer for one native extraction call.
 *
 * Owns storage sized and aligned for the layout. The buffer lives for one
 * call; to_example() copies every field into host memory so nothing refers
 * to it afterwards.
 */
class ExampleBuffer {
public:
    explicit ExampleBuffer(const ExampleLayout& layout);

    void* data() { return storage_.data(); }
    const void* data() const { return storage_.data(); }
    std::size_t size() const { return layout_.size(); }

    // Copy all fields out of the buffer
    Example to_example() const;

private:
    int32_t read_int(std::size_t offset) const;

    const ExampleLayout& layout_;
    std::vector<uint32_t> storage_;  // uint32_t words keep float/int alignment
};

} // namespace dg
