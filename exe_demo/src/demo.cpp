#include "demo.hpp"

#include <cstdint>
#include <format>
#include <largest/finder/core.hpp>
#include <largest/logging/core.hpp>
#include <string_view>
#include <vector>

namespace lg = largest::logging;

namespace largest {
namespace demo {
namespace {
template <typename T>
void report(std::ostream &out, std::string_view flavor, const T &result) {
    out << std::format("{} is {}", flavor, result) << std::endl;
}

void trace_call(std::string_view flavor, size_t size) {
    lg::write(lg::level::debug, "[CALL] Flavor={} Size={}", flavor, size);
}
}  // namespace

void run(std::ostream &out) {
    // Using primitives
    const std::vector<int32_t> number_list{34, 50, 25, 100, 65};
    const std::vector<char> char_list{'y', 'm', 'a', 'q'};

    trace_call("largest_i32", number_list.size());
    int32_t number = finder::largest_i32(number_list);
    report(out, "largest_i32", number);

    trace_call("largest_char_copy", char_list.size());
    char c = finder::largest_char_copy(char_list);
    report(out, "largest_char_copy", c);

    trace_call("largest_char_ref", char_list.size());
    const char &c_ref = finder::largest_char_ref(char_list);
    report(out, "largest_char_ref", c_ref);

    // Using generics
    trace_call("largest_generic", char_list.size());
    const char &generic_c_ref = finder::largest_generic(char_list);
    report(out, "largest_generic", generic_c_ref);

    trace_call("largest_generic", number_list.size());
    const int32_t &generic_number_ref = finder::largest_generic(number_list);
    report(out, "largest_generic", generic_number_ref);

    // Using generics with copies
    trace_call("largest_generic_copy", char_list.size());
    char generic_c = finder::largest_generic_copy(char_list);
    report(out, "largest_generic", generic_c);

    trace_call("largest_generic_copy", number_list.size());
    int32_t generic_number = finder::largest_generic_copy(number_list);
    report(out, "largest_generic", generic_number);
}
}  // namespace demo
}  // namespace largest
