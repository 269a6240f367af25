#include "bar_store.hpp"
#include "logging.hpp"

#include <chrono>

namespace data {

BarStore::BarStore(IBarSource& source, Clock clock)
    : source_(source),
      clock_(clock ? std::move(clock) : Clock([]{ return std::chrono::system_clock::now(); })),
      alive_(std::make_shared<bool>(true))
{
}

BarStore::~BarStore() = default;

std::size_t BarStore::slot(core::Resolution resolution) {
    return resolution == core::Resolution::Intraday ? 0 : 1;
}

bool BarStore::setActiveSymbol(const std::string& symbol) {
    if (symbol == active_symbol_) {
        return false;
    }

    auto logger = core::logging::getLogger();
    logger->debug("Active symbol changed: '{}' -> '{}'", active_symbol_, symbol);

    active_symbol_ = symbol;
    ++activation_;

    // Retained bars stay readable but must be fetched again
    auto it = caches_.find(symbol);
    if (it != caches_.end()) {
        it->second.current = {false, false};
    }
    return true;
}

void BarStore::fetch(const std::string& symbol, core::Resolution resolution, FetchCompletion done) {
    const std::uint64_t request_id = ++next_request_id_;
    const std::uint64_t activation = activation_;
    ++in_flight_;

    core::logging::getLogger()->debug("Fetch #{} issued: {} {}", request_id, symbol, core::toString(resolution));

    std::weak_ptr<bool> alive = alive_;
    source_.fetchBars(symbol, resolution,
        [this, alive, request_id, activation, done = std::move(done)](FetchResult result) {
            if (alive.expired()) {
                return; // Store torn down while the request was in flight
            }
            complete(request_id, activation, std::move(result), done);
        });
}

void BarStore::complete(std::uint64_t request_id, std::uint64_t activation, FetchResult result,
                        const FetchCompletion& done)
{
    auto logger = core::logging::getLogger();
    --in_flight_;

    FetchOutcome outcome;
    outcome.symbol = result.symbol;
    outcome.resolution = result.resolution;

    const std::size_t index = slot(result.resolution);

    if (result.symbol != active_symbol_ || activation != activation_) {
        // Issued for a symbol that is no longer displayed
        logger->warn("Discarding fetch #{} for '{}' ({}): active symbol is now '{}'.",
                     request_id, result.symbol, core::toString(result.resolution), active_symbol_);
        outcome.status = FetchStatus::Discarded;
    } else if (!result.ok) {
        logger->error("Fetch #{} for {} ({}) failed, keeping cached bars: {}",
                      request_id, result.symbol, core::toString(result.resolution), result.error);
        outcome.status = FetchStatus::Failed;
        outcome.error = result.error;
    } else {
        SymbolCache& cache = caches_[result.symbol];
        if (cache.current[index] && cache.applied_request[index] > request_id) {
            // A newer response for this key already landed
            logger->warn("Discarding fetch #{} for {} ({}): newer fetch #{} already applied.",
                         request_id, result.symbol, core::toString(result.resolution), cache.applied_request[index]);
            outcome.status = FetchStatus::Discarded;
        } else {
            const std::size_t count = result.bars.size();
            cache.series[index] = std::make_shared<const core::BarSeries>(std::move(result.bars));
            cache.current[index] = true;
            cache.applied_request[index] = request_id;
            last_updated_ = clock_();
            logger->debug("Cache replaced for {} ({}): {} bars from fetch #{}",
                          outcome.symbol, core::toString(outcome.resolution), count, request_id);
            outcome.status = FetchStatus::Applied;
        }
    }

    if (done) {
        done(outcome);
    }
}

core::BarSeriesPtr BarStore::get(const std::string& symbol, core::Resolution resolution) const {
    auto it = caches_.find(symbol);
    if (it == caches_.end()) {
        return nullptr;
    }
    return it->second.series[slot(resolution)];
}

bool BarStore::needsFetch(const std::string& symbol, core::Resolution resolution) const {
    if (symbol != active_symbol_) {
        return true;
    }
    auto it = caches_.find(symbol);
    return it == caches_.end() || !it->second.current[slot(resolution)];
}

} // namespace data
