#include "rxrecon/domain/identifier.h"

#include <type_traits>

namespace rxrecon::domain {

std::string CanonicalIdentifier::key() const {
  return std::visit(
      [](const auto& id) -> std::string {
        using T = std::decay_t<decltype(id)>;
        if constexpr (std::is_same_v<T, Ndc>) {
          return id.to_string();
        } else if constexpr (std::is_same_v<T, Gtin>) {
          return id.ndc.to_string();
        } else {
          return id.raw;
        }
      },
      value);
}

const char* CanonicalIdentifier::kind_name() const {
  switch (value.index()) {
    case 0:
      return "ndc";
    case 1:
      return "gtin";
    default:
      return "unknown";
  }
}

}  // namespace rxrecon::domain
