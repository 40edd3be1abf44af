#include "io/quote_json.hpp"

#include <cmath>
#include <stdexcept>

namespace shipping {

void to_json(nlohmann::json& j, const QuoteRequest& r) {
  j = nlohmann::json{{"mode", r.mode}, {"weight", r.weight_kg}};
}

void from_json(const nlohmann::json& j, QuoteRequest& r) {
  j.at("mode").get_to(r.mode);
  j.at("weight").get_to(r.weight_kg);
}

void to_json(nlohmann::json& j, const ShippingQuote& q) {
  j = nlohmann::json{{"mode", q.mode}, {"weight", q.weight_kg}, {"cost", q.cost}};
}

void from_json(const nlohmann::json& j, ShippingQuote& q) {
  j.at("mode").get_to(q.mode);
  j.at("weight").get_to(q.weight_kg);
  j.at("cost").get_to(q.cost);
}

} // namespace shipping

namespace shipping::io {

static nlohmann::json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return nlohmann::json::parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

std::vector<QuoteRequest> ParseRequests(const std::string& text) {
  const nlohmann::json j = ParseJson(text, "quote requests");
  if (!j.is_array()) {
    throw std::runtime_error("quote requests: expected a JSON array");
  }

  std::vector<QuoteRequest> out;
  out.reserve(j.size());
  for (std::size_t i = 0; i < j.size(); ++i) {
    try {
      out.push_back(j[i].get<QuoteRequest>());
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error("quote requests[" + std::to_string(i) + "]: " + std::string(e.what()));
    }
  }
  return out;
}

std::string DumpQuotes(const std::vector<ShippingQuote>& quotes, int indent) {
  // nlohmann 会把 inf/nan 写成 null，读回来就不是数字了
  for (std::size_t i = 0; i < quotes.size(); ++i) {
    if (!std::isfinite(quotes[i].weight_kg) || !std::isfinite(quotes[i].cost)) {
      throw std::runtime_error("quotes[" + std::to_string(i) + "]: weight/cost must be finite");
    }
  }
  const nlohmann::json j = quotes;
  return j.dump(indent);
}

} // namespace shipping::io
