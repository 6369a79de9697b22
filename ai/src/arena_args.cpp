#include "arena_args.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace loa_ai {

std::string to_lower_copy(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return lowered;
}

bool is_number_string(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch); });
}

int parse_positive(std::string_view text, const char* what) {
  if (!is_number_string(text)) {
    throw std::invalid_argument(std::string(what) + " must be a positive integer: " + std::string(text));
  }
  int value = 0;
  try {
    value = std::stoi(std::string(text));
  } catch (const std::out_of_range&) {
    throw std::invalid_argument(std::string(what) + " is out of range: " + std::string(text));
  }
  if (value < 1) {
    throw std::invalid_argument(std::string(what) + " must be at least 1");
  }
  return value;
}

PolicyChoice parse_policy_choice(std::string_view text) {
  const std::string lowered = to_lower_copy(text);
  if (lowered == "random" || lowered == "rand") {
    return PolicyChoice::Random;
  }
  if (lowered == "alphabeta" || lowered == "ab") {
    return PolicyChoice::AlphaBeta;
  }
  throw std::invalid_argument("Unsupported policy type: " + std::string(text));
}

} // namespace loa_ai
