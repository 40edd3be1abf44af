#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "strategy/shipping_strategy.hpp"

namespace shipping {

// 工厂收到无法识别的运输方式时抛出。
// 这是整个工程唯一的业务错误，直接抛给调用方，不做重试/恢复。
class InvalidModeError : public std::invalid_argument {
public:
  explicit InvalidModeError(const std::string& mode);

  const std::string& mode() const noexcept { return mode_; }

private:
  std::string mode_;
};

// ======================
// 策略工厂：mode 字符串 -> 策略实例
//
// 已注册：
//   "Ground" -> GroundShipping
//   "Air"    -> AirShipping
//
// 大小写敏感；其它任何字符串（包括空串）都会抛 InvalidModeError。
// 内部是一张 name -> creator 的查找表，新增运输方式只需要往表里加一行。
// ======================
class ShippingStrategyFactory {
public:
  static StrategyPtr CreateStrategy(const std::string& mode);

  // 查询接口：不创建策略，只判断/列出已注册的 mode。
  // QuotePipeline 用 IsKnownMode 在计算前先校验整批请求。
  static bool IsKnownMode(const std::string& mode);

  // 按字典序返回所有已注册的 mode
  static std::vector<std::string> KnownModes();
};

} // namespace shipping
