#pragma once
#include <string>

#include "strategy/shipping_strategy.hpp"

namespace shipping {

// ShippingService 是 Strategy 模式里的 context：
// 持有且只持有一个当前策略，计算时直接转发给它。
//
// 约束：
//   - 构造后永远有一个非空策略（传 nullptr 会抛 std::invalid_argument）
//   - SetStrategy 立即生效，只影响之后的 CalculateCost
//   - 本类不加锁；多线程下 SetStrategy/CalculateCost 需要调用方自己互斥
class ShippingService {
public:
  explicit ShippingService(StrategyPtr strategy);

  void SetStrategy(StrategyPtr strategy);

  // weight_kg >= 0 由调用方保证
  double CalculateCost(double weight_kg) const;

  std::string ModeName() const;

private:
  StrategyPtr strategy_;
};

} // namespace shipping
