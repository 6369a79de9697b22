#include "loa/move.hpp"

namespace loa {

std::string to_string(const Move& m) {
  return to_string(m.from) + "-" + to_string(m.to);
}

} // namespace loa
