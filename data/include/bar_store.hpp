#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "bar_source.hpp"
#include "datatypes.hpp"

namespace data {

    enum class FetchStatus {
        Applied,   // Cache entry replaced
        Failed,    // FetchError, previous contents kept
        Discarded  // Stale response (symbol changed or newer data already applied)
    };

    struct FetchOutcome {
        std::string symbol;
        core::Resolution resolution = core::Resolution::Intraday;
        FetchStatus status = FetchStatus::Failed;
        std::string error;
    };

    using FetchCompletion = std::function<void(const FetchOutcome&)>;

    // Cached bars for one symbol, one slot per resolution
    struct SymbolCache {
        std::array<core::BarSeriesPtr, 2> series;
        // Populated during the current activation of the symbol
        std::array<bool, 2> current = {false, false};
        // Request id of the snapshot in `series`
        std::array<std::uint64_t, 2> applied_request = {0, 0};
    };

    // Per-symbol, per-resolution bar cache.
    //
    // Single-threaded: every method, and every completion it receives from the
    // IBarSource, runs on the event-loop thread. Entries are replaced whole on
    // a successful fetch and never appended to.
    class BarStore {
    public:
        using Clock = std::function<core::Timestamp()>;

        explicit BarStore(IBarSource& source, Clock clock = nullptr);
        ~BarStore();

        BarStore(const BarStore&) = delete;
        BarStore& operator=(const BarStore&) = delete;

        // Makes `symbol` the active one. Returns true if it changed; both of its
        // resolutions then need a fresh fetch. Older symbols' bars are retained.
        bool setActiveSymbol(const std::string& symbol);
        const std::string& activeSymbol() const { return active_symbol_; }

        // Starts an asynchronous fetch; `done` (optional) fires once it settles
        void fetch(const std::string& symbol, core::Resolution resolution, FetchCompletion done = nullptr);

        // Snapshot or nullptr when nothing was ever fetched
        core::BarSeriesPtr get(const std::string& symbol, core::Resolution resolution) const;

        // True if no fetch for this resolution has landed since `symbol` became active
        bool needsFetch(const std::string& symbol, core::Resolution resolution) const;

        // Number of requests issued and not yet settled
        std::size_t inFlight() const { return in_flight_; }

        std::optional<core::Timestamp> lastUpdated() const { return last_updated_; }

    private:
        static std::size_t slot(core::Resolution resolution);

        void complete(std::uint64_t request_id, std::uint64_t activation, FetchResult result, const FetchCompletion& done);

        IBarSource& source_;
        Clock clock_;
        std::unordered_map<std::string, SymbolCache> caches_;
        std::string active_symbol_;
        std::uint64_t activation_ = 0;      // Bumped on every symbol change
        std::uint64_t next_request_id_ = 0;
        std::size_t in_flight_ = 0;
        std::optional<core::Timestamp> last_updated_;

        // Completions arriving after destruction see an expired token
        std::shared_ptr<bool> alive_;
    };

} // namespace data
