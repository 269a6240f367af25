#include "bar_parser.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>

namespace data {

namespace {

    using json = nlohmann::json;

    // Numeric field or 0; bumps `defaulted` when the fallback is used
    double numericOrZero(const json& json_bar, const char* key, int& defaulted) {
        auto it = json_bar.find(key);
        if (it == json_bar.end() || !it->is_number()) {
            ++defaulted;
            return 0.0;
        }
        return it->get<double>();
    }

} // namespace

core::BarSeries parseBars(const std::string& json_text) {
    auto logger = core::logging::getLogger();
    core::BarSeries bars;

    json json_response;
    try {
        json_response = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw core::ParseException(fmt::format("Failed to parse chart response: {}", e.what()));
    }

    if (!json_response.is_array()) {
        throw core::ParseException(fmt::format("Unexpected chart response: expected an array, got {}",
                                               json_response.type_name()));
    }

    bars.reserve(json_response.size());
    int defaulted_fields = 0;
    int skipped_bars = 0;

    for (const auto& json_bar : json_response) {
        if (!json_bar.is_object()) {
            ++skipped_bars;
            continue;
        }

        auto date_it = json_bar.find("date");
        if (date_it == json_bar.end() || !date_it->is_string()) {
            ++skipped_bars;
            continue;
        }

        core::Bar bar;
        try {
            bar.date = date_it->get<std::string>();
            bar.timestamp = core::utils::parseBarDate(bar.date);
        } catch (const core::ParseException& e) {
            logger->debug("Skipping bar with unusable date: {}", e.what());
            ++skipped_bars;
            continue;
        }

        bar.open   = numericOrZero(json_bar, "open", defaulted_fields);
        bar.high   = numericOrZero(json_bar, "high", defaulted_fields);
        bar.low    = numericOrZero(json_bar, "low", defaulted_fields);
        bar.close  = numericOrZero(json_bar, "close", defaulted_fields);
        bar.volume = numericOrZero(json_bar, "volume", defaulted_fields);

        bars.push_back(std::move(bar));
    }

    if (defaulted_fields > 0 || skipped_bars > 0) {
        logger->warn("Chart payload had {} defaulted numeric fields and {} skipped bars.",
                     defaulted_fields, skipped_bars);
    }

    // Backend order is newest first
    if (bars.size() > 1 && bars.front().timestamp > bars.back().timestamp) {
        std::reverse(bars.begin(), bars.end());
    }
    if (!std::is_sorted(bars.begin(), bars.end())) {
        logger->warn("Chart payload was not monotonic in time; sorting {} bars.", bars.size());
        std::stable_sort(bars.begin(), bars.end());
    }

    return bars;
}

} // namespace data
