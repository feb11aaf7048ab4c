#pragma once

#include "sigrisk/config/engine_config.hpp"
#include "sigrisk/data/i_market_data_source.hpp"
#include "sigrisk/data/rate_limiter.hpp"
#include "sigrisk/domain/candle.hpp"
#include "sigrisk/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// MarketDataCache: TTL-bound in-memory candle store with coalesced fetches
// -----------------------------------------------------------------------------
//
// @brief  Serves fixed-length candle windows per (symbol, timeframe) and
//         shields the pipeline from the rate-limited upstream source.
//
// @details
// Each (symbol, timeframe) pair has its own Entry: a deque of at most
// max_candles candles ordered by open time (oldest dropped on overflow),
// the last time a caller read it, and the bookkeeping for the fetch that
// may currently be in flight.
//
// get_window(symbol, tf, length):
//   1. Hit: the entry holds >= length candles and its last candle is not
//      stale (now - last.open_time <= timeframe duration). Return the
//      newest `length` candles.
//   2. Miss with a fetch already in flight: wait for it and share its
//      outcome. At most one upstream call per pair is ever in flight.
//   3. Miss: this caller becomes the fetcher. It takes a token from the
//      RateLimiter (denied → RateLimited without calling the source), then
//      calls the source without holding the entry lock. Incremental fetches
//      start at the last cached open time; cold fetches start
//      max(length, max_candles) periods back. Fetched candles are merged by
//      open time; an equal open time replaces the cached candle (the
//      forming candle is updated in place).
//   4. After a failed fetch, the entry is served anyway if it holds enough
//      candles and the last one is within stale_tolerance of the staleness
//      bound. Otherwise the failure propagates as DataUnavailable (or
//      RateLimited, which is-a DataUnavailable).
//   5. Still fewer than `length` candles after a successful fetch →
//      InsufficientHistory.
//
// Deadlines: get_window() optionally takes the caller's run deadline. The
// upstream timeout is min(fetch_timeout, deadline - now); a run already
// past its deadline gets RunCancelled instead of a fetch.
//
// Eviction: evict_idle() drops entries nobody has read for longer than
// ttl_ms. The owner calls it periodically (the scheduler does so once per
// tick).
//
// Thread model:
//   entries_mutex_ (shared_mutex) guards the map only: lookups take a shared
//   lock, insertion and eviction a unique lock. Each Entry has its own mutex,
//   so reads and fetches for different symbols never contend. The map lock
//   is never held while an Entry lock is being waited on by a fetcher, and
//   no lock at all is held across the upstream call.
//
// Ownership:
//   Owned by SignalRiskEngine via std::unique_ptr. Holds non-owning
//   references to the source and the clock; owns its RateLimiter.
// -----------------------------------------------------------------------------
class MarketDataCache {
 public:
  struct Stats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t fetches{0};
    std::uint64_t fetch_failures{0};
    std::uint64_t coalesced_waits{0};
    std::uint64_t stale_serves{0};
    std::uint64_t evictions{0};
  };

  MarketDataCache(IMarketDataSource& source, const ITimeProvider& clock,
                  CacheConfig config);

  MarketDataCache(const MarketDataCache&) = delete;
  MarketDataCache& operator=(const MarketDataCache&) = delete;
  MarketDataCache(MarketDataCache&&) = delete;
  MarketDataCache& operator=(MarketDataCache&&) = delete;

  // -------------------------------------------------------------------------
  // get_window(symbol, timeframe, length, deadline_ms)
  // -------------------------------------------------------------------------
  // @brief  Returns exactly `length` candles, most recent last.
  //
  // @param  deadline_ms  Epoch ms after which the caller's run is void; 0
  //                      means no deadline.
  //
  // @throws InsufficientHistory, DataUnavailable, RateLimited, RunCancelled.
  //
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  std::vector<domain::Candle> get_window(const std::string& symbol,
                                         domain::Timeframe timeframe,
                                         std::size_t length,
                                         std::int64_t deadline_ms = 0);

  // -------------------------------------------------------------------------
  // upsert_candle(candle)
  // -------------------------------------------------------------------------
  // @brief  Merges one candle pushed by a real-time feed. A candle with the
  //         open time of the last cached candle replaces it in place.
  // -------------------------------------------------------------------------
  void upsert_candle(const domain::Candle& candle);

  // Drops entries unread for longer than ttl_ms. Entries with a fetch in
  // flight are kept. Returns the number of entries removed.
  std::size_t evict_idle();

  // Removes every entry of the symbol (all timeframes).
  void clear(const std::string& symbol);

  std::size_t candle_count(const std::string& symbol,
                           domain::Timeframe timeframe) const;
  std::size_t entry_count() const;
  Stats stats() const;

 private:
  struct Entry {
    std::mutex mutex;
    std::condition_variable fetch_done;
    std::deque<domain::Candle> candles;
    std::int64_t last_access_ms{0};
    bool fetching{false};
    std::uint64_t fetch_generation{0};
    std::exception_ptr last_fetch_error;
  };

  static std::string key_of(const std::string& symbol,
                            domain::Timeframe timeframe);

  std::shared_ptr<Entry> find_entry(const std::string& key) const;
  std::shared_ptr<Entry> find_or_create_entry(const std::string& key);

  bool is_fresh_locked(const Entry& entry, domain::Timeframe timeframe,
                       std::size_t length, std::int64_t now_ms) const;
  bool is_servable_stale_locked(const Entry& entry, domain::Timeframe timeframe,
                                std::size_t length, std::int64_t now_ms) const;
  void merge_locked(Entry& entry, const std::vector<domain::Candle>& candles);
  static std::vector<domain::Candle> tail_locked(const Entry& entry,
                                                 std::size_t length);

  // Performs the upstream call for a caller that won the fetch slot.
  // Returns the failure, if any, as an exception_ptr.
  std::exception_ptr fetch_from_source(const std::string& symbol,
                                       domain::Timeframe timeframe,
                                       std::int64_t since_ms,
                                       std::int64_t timeout_ms,
                                       std::vector<domain::Candle>& out);

  IMarketDataSource& source_;
  const ITimeProvider& clock_;
  const CacheConfig config_;
  RateLimiter limiter_;

  mutable std::shared_mutex entries_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> fetches_{0};
  std::atomic<std::uint64_t> fetch_failures_{0};
  std::atomic<std::uint64_t> coalesced_waits_{0};
  std::atomic<std::uint64_t> stale_serves_{0};
  std::atomic<std::uint64_t> evictions_{0};
};

}  // namespace sigrisk
