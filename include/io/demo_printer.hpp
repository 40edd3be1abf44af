#pragma once
#include <ostream>

namespace shipping::io {

// shipping_demo 的固定输出（6 行，金额保留 1 位小数）：
//   Strategy Pattern without Factory:
//   Ground shipping cost: 15.0
//   Air shipping cost: 30.0
//
//   Strategy Pattern with Factory:
//   Factory-created Ground shipping cost: 15.0
//   Factory-created Air shipping cost: 30.0
//
// 写到 os 里而不是直接写 std::cout，测试可以传 ostringstream 进来。
// os 的格式状态（fixed/precision）会被修改。
void PrintDemo(std::ostream& os);

} // namespace shipping::io
