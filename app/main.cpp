#include <exception>
#include <iostream>

#include "io/demo_printer.hpp"

int main() {
  // 无参数，输出固定（见 io/demo_printer.hpp）：
  //   1) 直接创建策略 + 运行时 SetStrategy
  //   2) 通过工厂按字符串创建策略
  try {
    shipping::io::PrintDemo(std::cout);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
