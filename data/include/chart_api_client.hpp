#pragma once

#include <string>
#include "config.hpp"
#include "datatypes.hpp"

namespace data {

// Blocking REST client for the dashboard backend.
class ChartApiClient {
public:
    explicit ChartApiClient(const core::EngineConfig& config);

    // GET {base}/api/stock/{symbol}/chart?timeframe=..&limit=..
    // Returns bars oldest-first.
    // Throws core::ApiRequestException (network, timeout, non-2xx) or core::ParseException.
    core::BarSeries getChartBars(const std::string& symbol, core::Resolution resolution) const;

    // GET {base}/market/status -> {"isMarketOpen": bool}
    // Throws core::ApiRequestException or core::ParseException.
    bool getMarketOpen() const;

    std::string chartEndpoint(const std::string& symbol) const;
    std::string timeframeFor(core::Resolution resolution) const;

private:
    core::EngineConfig config_;

    // Performs the GET and returns the body of a 2xx response
    std::string performGetRequest(const std::string& url,
                                  const std::vector<std::pair<std::string, std::string>>& params) const;
};

} // namespace data
