#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/types.hpp"

namespace shipping::io {

// JSON 字段约定：
//   QuoteRequest  -> {"mode": "Ground", "weight": 10.0}
//   ShippingQuote -> {"mode": "Ground", "weight": 10.0, "cost": 15.0}
//
// to_json/from_json 放在 shipping 命名空间里（见下方），nlohmann 通过 ADL 找到。

// 解析请求数组，例如：
//   [{"mode": "Ground", "weight": 10}, {"mode": "Air", "weight": 10}]
// JSON 格式错误、不是数组、字段缺失或类型不对，都会抛 std::runtime_error。
std::vector<QuoteRequest> ParseRequests(const std::string& text);

// 把报价序列化成 JSON 数组；indent < 0 时输出紧凑格式
// weight 或 cost 不是有限值（inf/nan，比如超大重量溢出）时抛 std::runtime_error
std::string DumpQuotes(const std::vector<ShippingQuote>& quotes, int indent = 2);

} // namespace shipping::io

namespace shipping {

void to_json(nlohmann::json& j, const QuoteRequest& r);
void from_json(const nlohmann::json& j, QuoteRequest& r);

void to_json(nlohmann::json& j, const ShippingQuote& q);
void from_json(const nlohmann::json& j, ShippingQuote& q);

} // namespace shipping
