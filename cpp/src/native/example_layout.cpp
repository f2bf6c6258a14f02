#include "native/example_layout.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

namespace dg {

namespace {

std::size_t align_up(std::size_t offset, std::size_t alignment) {
    return (offset + alignment - 1) / alignment * alignment;
}

} // namespace

ExampleLayout::ExampleLayout(int num_features)
    : num_features_(num_features) {

    if (num_features_ <= 0) {
        throw std::invalid_argument("num_features must be positive, got " +
                                    std::to_string(num_features_));
    }

    feature_count_ = static_cast<std::size_t>(num_features_) * kBoardPoints;

    std::size_t offset = feature_bytes();
    index_offset_ = align_up(offset, alignof(int32_t));
    color_offset_ = index_offset_ + sizeof(int32_t);
    policy_offset_ = color_offset_ + sizeof(int32_t);

    // char[905] leaves the next int misaligned by 3 bytes
    offset = policy_offset_ + kPolicySize;
    winner_offset_ = align_up(offset, alignof(int32_t));
    number_offset_ = winner_offset_ + sizeof(int32_t);

    size_ = align_up(number_offset_ + sizeof(int32_t), alignment());
}

ExampleBuffer::ExampleBuffer(const ExampleLayout& layout)
    : layout_(layout),
      storage_((layout.size() + sizeof(uint32_t) - 1) / sizeof(uint32_t), 0u) {}

int32_t ExampleBuffer::read_int(std::size_t offset) const {
    int32_t value;
    std::memcpy(&value, reinterpret_cast<const char*>(data()) + offset, sizeof(value));
    return value;
}

Example ExampleBuffer::to_example() const {
    const char* base = reinterpret_cast<const char*>(data());

    Example example;
    example.features.resize(layout_.feature_count());
    std::memcpy(example.features.data(), base + layout_.features_offset(), layout_.feature_bytes());

    example.index = read_int(layout_.index_offset());
    example.color = read_int(layout_.color_offset());
    example.winner = read_int(layout_.winner_offset());
    example.number = read_int(layout_.number_offset());

    // Policy is NUL-terminated unless it fills the whole field
    const char* policy = base + layout_.policy_offset();
    const void* terminator = std::memchr(policy, '\0', kPolicySize);
    std::size_t length = terminator
        ? static_cast<std::size_t>(static_cast<const char*>(terminator) - policy)
        : kPolicySize;
    example.policy.assign(policy, length);

    return example;
}

} // namespace dg
