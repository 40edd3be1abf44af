#pragma once
#include <string>

namespace shipping {

// ========================
// 运费计算的基础值类型
// ========================

// 单次报价请求：运输方式 + 重量
// mode 就是工厂用的字符串判别量（"Ground" / "Air"）
struct QuoteRequest {
  std::string mode;
  double weight_kg{0.0}; // 调用方保证 >= 0，这里不做校验
};

// 单次报价结果（QuotePipeline 的输出，也是 JSON 输出的一项）
struct ShippingQuote {
  std::string mode;
  double weight_kg{0.0};
  double cost{0.0};
};

} // namespace shipping
