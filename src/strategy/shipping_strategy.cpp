#include "strategy/shipping_strategy.hpp"

namespace shipping {

double GroundShipping::CalculateShippingCost(double weight_kg) const {
  return weight_kg * kRatePerKg;
}

std::string GroundShipping::ModeName() const {
  return "Ground";
}

double AirShipping::CalculateShippingCost(double weight_kg) const {
  return weight_kg * kRatePerKg;
}

std::string AirShipping::ModeName() const {
  return "Air";
}

} // namespace shipping
