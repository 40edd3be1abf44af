#include "service/shipping_service.hpp"

#include <stdexcept>
#include <utility>

namespace shipping {

static StrategyPtr RequireStrategy(StrategyPtr strategy) {
  if (!strategy) {
    throw std::invalid_argument("ShippingService: strategy must not be null");
  }
  return strategy;
}

ShippingService::ShippingService(StrategyPtr strategy)
    : strategy_(RequireStrategy(std::move(strategy))) {}

void ShippingService::SetStrategy(StrategyPtr strategy) {
  strategy_ = RequireStrategy(std::move(strategy));
}

double ShippingService::CalculateCost(double weight_kg) const {
  return strategy_->CalculateShippingCost(weight_kg);
}

std::string ShippingService::ModeName() const {
  return strategy_->ModeName();
}

} // namespace shipping
