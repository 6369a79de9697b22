#pragma once
#include <string>
#include <string_view>

namespace loa_ai {

enum class PolicyChoice { Random, AlphaBeta };

std::string to_lower_copy(std::string_view text);
bool is_number_string(std::string_view text);
// Positive int from a digit string; std::invalid_argument names WHAT on failure,
// including values too large for an int.
int parse_positive(std::string_view text, const char* what);
PolicyChoice parse_policy_choice(std::string_view text);

} // namespace loa_ai
