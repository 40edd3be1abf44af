#include "strategy/strategy_factory.hpp"

#include <functional>
#include <map>
#include <memory>

namespace shipping {

using Creator = std::function<StrategyPtr()>;

template <typename StrategyT>
static Creator MakeCreator() {
  return [] { return std::make_shared<const StrategyT>(); };
}

static const std::map<std::string, Creator>& Registry() {
  static const std::map<std::string, Creator> registry = {
      {"Ground", MakeCreator<GroundShipping>()},
      {"Air", MakeCreator<AirShipping>()},
  };
  return registry;
}

InvalidModeError::InvalidModeError(const std::string& mode)
    : std::invalid_argument("Invalid shipping type: " + mode), mode_(mode) {}

StrategyPtr ShippingStrategyFactory::CreateStrategy(const std::string& mode) {
  const auto& registry = Registry();
  auto it = registry.find(mode);
  if (it == registry.end()) {
    throw InvalidModeError(mode);
  }
  return it->second();
}

bool ShippingStrategyFactory::IsKnownMode(const std::string& mode) {
  return Registry().count(mode) != 0;
}

std::vector<std::string> ShippingStrategyFactory::KnownModes() {
  std::vector<std::string> out;
  for (const auto& kv : Registry()) out.push_back(kv.first);
  return out;
}

} // namespace shipping
