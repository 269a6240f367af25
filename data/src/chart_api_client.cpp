#include "chart_api_client.hpp"
#include "bar_parser.hpp"
#include "logging.hpp"
#include "exceptions.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

namespace data {

ChartApiClient::ChartApiClient(const core::EngineConfig& config)
    : config_(config)
{
    core::logging::getLogger()->debug("ChartApiClient created for {}", config_.api_base_url);
}

std::string ChartApiClient::chartEndpoint(const std::string& symbol) const {
    // Index symbols like ^GSPC must be encoded
    const std::string encoded_symbol = cpr::util::urlEncode(symbol).c_str();
    return fmt::format("{}/api/stock/{}/chart", config_.api_base_url, encoded_symbol);
}

std::string ChartApiClient::timeframeFor(core::Resolution resolution) const {
    return resolution == core::Resolution::Intraday ? config_.intraday_timeframe : config_.eod_timeframe;
}

std::string ChartApiClient::performGetRequest(const std::string& url,
                                              const std::vector<std::pair<std::string, std::string>>& params) const
{
    auto logger = core::logging::getLogger();

    cpr::Parameters parameters;
    for (const auto& param : params) {
        parameters.Add(cpr::Parameter{param.first, param.second});
    }

    cpr::Header headers = {
        {"Accept", "application/json"}
    };

    logger->debug("Requesting URL: {}", url);
    cpr::Response response = cpr::Get(cpr::Url{url}, parameters, headers,
                                      cpr::Timeout{config_.request_timeout});

    logger->debug("Response Status: {}, Body size: {}", response.status_code, response.text.length());

    if (response.error) {
        throw core::ApiRequestException(fmt::format("Request to {} failed: {} (code {})",
                                                    url, response.error.message,
                                                    static_cast<int>(response.error.code)));
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw core::ApiRequestException(fmt::format("Request to {} failed with HTTP status {}",
                                                    url, response.status_code));
    }
    return response.text;
}

core::BarSeries ChartApiClient::getChartBars(const std::string& symbol, core::Resolution resolution) const {
    auto logger = core::logging::getLogger();
    std::string body = performGetRequest(chartEndpoint(symbol), {
        {"timeframe", timeframeFor(resolution)},
        {"limit", std::to_string(config_.bar_limit)}
    });

    core::BarSeries bars = parseBars(body);
    logger->info("Received {} {} bars for {}.", bars.size(), core::toString(resolution), symbol);
    return bars;
}

bool ChartApiClient::getMarketOpen() const {
    std::string body = performGetRequest(config_.api_base_url + "/market/status", {});

    try {
        nlohmann::json json_response = nlohmann::json::parse(body);
        if (!json_response.is_object() || !json_response.contains("isMarketOpen")
            || !json_response["isMarketOpen"].is_boolean()) {
            throw core::ParseException("Market status response has no boolean 'isMarketOpen'");
        }
        return json_response["isMarketOpen"].get<bool>();
    } catch (const nlohmann::json::exception& e) {
        throw core::ParseException(fmt::format("Failed to parse market status response: {}", e.what()));
    }
}

} // namespace data
