#include "largest/finder/core.hpp"

#include <format>

namespace largest {
namespace finder {

empty_sequence_error::empty_sequence_error(const std::string &flavor)
    : std::invalid_argument(
          std::format("{}: cannot find the largest of an empty sequence",
                      flavor)) {
}

auto largest_i32(std::span<const int32_t> list) -> int32_t {
    std::optional<size_t> i = largest_index(list);
    if (!i.has_value()) {
        throw empty_sequence_error("largest_i32");
    }
    return list[*i];
}

auto largest_char_copy(std::span<const char> list) -> char {
    std::optional<size_t> i = largest_index(list);
    if (!i.has_value()) {
        throw empty_sequence_error("largest_char_copy");
    }
    return list[*i];
}

auto largest_char_ref(std::span<const char> list) -> const char & {
    std::optional<size_t> i = largest_index(list);
    if (!i.has_value()) {
        throw empty_sequence_error("largest_char_ref");
    }
    return list[*i];
}

}  // namespace finder
}  // namespace largest
