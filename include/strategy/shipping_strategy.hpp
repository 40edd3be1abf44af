#pragma once
#include <memory>
#include <string>

namespace shipping {

// 运费策略接口：每种运输方式实现一个 Strategy。
// ShippingService 只依赖这个接口，所以可以随时替换具体的计价算法。
// 策略对象本身无状态，创建后不可变，可以被多个 service 共享。
class IShippingStrategy {
public:
  virtual ~IShippingStrategy() = default;

  // weight -> cost，纯函数
  virtual double CalculateShippingCost(double weight_kg) const = 0;

  // 工厂里注册用的名字（"Ground" / "Air"）
  virtual std::string ModeName() const = 0;
};

// 陆运：cost = weight * 1.5
class GroundShipping final : public IShippingStrategy {
public:
  static constexpr double kRatePerKg = 1.5;

  double CalculateShippingCost(double weight_kg) const override;
  std::string ModeName() const override;
};

// 空运：cost = weight * 3.0
class AirShipping final : public IShippingStrategy {
public:
  static constexpr double kRatePerKg = 3.0;

  double CalculateShippingCost(double weight_kg) const override;
  std::string ModeName() const override;
};

// 策略在 service 之间共享，且只读
using StrategyPtr = std::shared_ptr<const IShippingStrategy>;

} // namespace shipping
