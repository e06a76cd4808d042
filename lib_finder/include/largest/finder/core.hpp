#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>

namespace largest {
namespace finder {

// Thrown by every flavor below when handed an empty sequence.
class empty_sequence_error : public std::invalid_argument {
   public:
    explicit empty_sequence_error(const std::string &flavor);
};

template <typename T>
concept Ordered = requires(const T &a, const T &b) {
    { a > b } -> std::convertible_to<bool>;
};

template <typename T>
concept Duplicable = Ordered<T> && std::copyable<T>;

// Position of the first element that no later element is strictly greater
// than, or nullopt for an empty sequence.
// Example:
//    std::vector<int> v{3, 9, 9, 1};
//    largest_index(std::span<const int>(v));  // 1
template <Ordered T>
auto largest_index(std::span<const T> list) -> std::optional<std::size_t> {
    if (list.empty()) {
        return std::nullopt;
    }
    std::size_t largest = 0;
    for (std::size_t i = 1; i < list.size(); ++i) {
        if (list[i] > list[largest]) {
            largest = i;
        }
    }
    return largest;
}

auto largest_i32(std::span<const std::int32_t> list) -> std::int32_t;

auto largest_char_copy(std::span<const char> list) -> char;

// The returned reference points into list.
auto largest_char_ref(std::span<const char> list) -> const char &;

// The returned reference points into list and is valid as long as the
// underlying storage is.
template <Ordered T>
auto largest_generic(std::span<const T> list) -> const T & {
    std::optional<std::size_t> i = largest_index(list);
    if (!i.has_value()) {
        throw empty_sequence_error("largest_generic");
    }
    return list[*i];
}

template <Duplicable T>
auto largest_generic_copy(std::span<const T> list) -> T {
    std::optional<std::size_t> i = largest_index(list);
    if (!i.has_value()) {
        throw empty_sequence_error("largest_generic_copy");
    }
    return list[*i];
}

// Deduces the element type from a vector, array or other contiguous range.
// Temporaries are rejected because the result would dangle.
template <std::ranges::contiguous_range R>
    requires std::ranges::borrowed_range<R> &&
             Ordered<std::ranges::range_value_t<R>>
auto largest_generic(R &&list) -> const std::ranges::range_value_t<R> & {
    using T = std::ranges::range_value_t<R>;
    return largest_generic(std::span<const T>(list));
}

template <std::ranges::contiguous_range R>
    requires Duplicable<std::ranges::range_value_t<R>>
auto largest_generic_copy(const R &list) -> std::ranges::range_value_t<R> {
    using T = std::ranges::range_value_t<R>;
    return largest_generic_copy(std::span<const T>(list));
}

}  // namespace finder
}  // namespace largest
