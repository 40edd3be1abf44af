#include "io/demo_printer.hpp"

#include <iomanip>
#include <memory>

#include "service/shipping_service.hpp"
#include "strategy/shipping_strategy.hpp"
#include "strategy/strategy_factory.hpp"

namespace shipping::io {

static constexpr double kDemoWeightKg = 10.0;

void PrintDemo(std::ostream& os) {
  os << std::fixed << std::setprecision(1);

  // 1) 直接创建策略 + 运行时 SetStrategy
  os << "Strategy Pattern without Factory:\n";

  ShippingService service(std::make_shared<const GroundShipping>());
  os << "Ground shipping cost: " << service.CalculateCost(kDemoWeightKg) << "\n";

  service.SetStrategy(std::make_shared<const AirShipping>());
  os << "Air shipping cost: " << service.CalculateCost(kDemoWeightKg) << "\n";

  // 2) 通过工厂按字符串创建策略
  os << "\nStrategy Pattern with Factory:\n";

  ShippingService factory_service(ShippingStrategyFactory::CreateStrategy("Ground"));
  os << "Factory-created Ground shipping cost: " << factory_service.CalculateCost(kDemoWeightKg) << "\n";

  factory_service.SetStrategy(ShippingStrategyFactory::CreateStrategy("Air"));
  os << "Factory-created Air shipping cost: " << factory_service.CalculateCost(kDemoWeightKg) << "\n";
}

} // namespace shipping::io
