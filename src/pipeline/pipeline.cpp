#include "pipeline/pipeline.hpp"

#include <optional>
#include <utility>

#include "service/shipping_service.hpp"
#include "strategy/strategy_factory.hpp"

namespace shipping {

std::vector<ShippingQuote> QuotePipeline::Run(const std::vector<QuoteRequest>& requests) const {
  // 先整体校验，任何一个 mode 不认识就直接抛，不做任何计算
  for (const auto& req : requests) {
    if (!ShippingStrategyFactory::IsKnownMode(req.mode)) {
      throw InvalidModeError(req.mode);
    }
  }

  std::vector<ShippingQuote> quotes;
  quotes.reserve(requests.size());

  // service 要等第一个策略解析出来才能构造
  std::optional<ShippingService> service;

  for (const auto& req : requests) {
    StrategyPtr strategy = ShippingStrategyFactory::CreateStrategy(req.mode);
    if (!service) {
      service.emplace(std::move(strategy));
    } else {
      service->SetStrategy(std::move(strategy));
    }

    ShippingQuote q;
    q.mode = service->ModeName();
    q.weight_kg = req.weight_kg;
    q.cost = service->CalculateCost(req.weight_kg);
    quotes.push_back(q);
  }
  return quotes;
}

} // namespace shipping
