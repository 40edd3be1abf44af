#pragma once
#include <vector>
#include "common/types.hpp"

namespace shipping {

// QuotePipeline 把“工厂 -> service -> 计算”这条流程串起来，批量处理请求：
//   1) 第一个请求的 mode 交给工厂，用得到的策略构造 ShippingService
//   2) 之后每个请求都通过 SetStrategy 换策略，再计算
//   3) 每个请求对应一条 ShippingQuote，顺序与输入一致
//
// 任何一个 mode 非法都会抛 InvalidModeError，不返回部分结果。
class QuotePipeline {
public:
  std::vector<ShippingQuote> Run(const std::vector<QuoteRequest>& requests) const;
};

} // namespace shipping
