#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace quotecast::model {

enum class DeliveryMethod : std::uint8_t {
  kNotification = 0,
  kWidget       = 1,
  kBoth         = 2,
};

constexpr std::string_view ToString(DeliveryMethod method) {
  switch (method) {
    case DeliveryMethod::kNotification:
      return "notification";
    case DeliveryMethod::kWidget:
      return "widget";
    case DeliveryMethod::kBoth:
    default:
      return "both";
  }
}

constexpr std::optional<DeliveryMethod> DeliveryMethodFromString(std::string_view name) {
  if (name == "notification") return DeliveryMethod::kNotification;
  if (name == "widget") return DeliveryMethod::kWidget;
  if (name == "both") return DeliveryMethod::kBoth;
  return std::nullopt;
}

constexpr bool UsesNotification(DeliveryMethod method) {
  return method == DeliveryMethod::kNotification || method == DeliveryMethod::kBoth;
}

constexpr bool UsesWidget(DeliveryMethod method) {
  return method == DeliveryMethod::kWidget || method == DeliveryMethod::kBoth;
}

} // namespace quotecast::model
