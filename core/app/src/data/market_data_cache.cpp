#include "sigrisk/data/market_data_cache.hpp"
#include "sigrisk/domain/errors.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace sigrisk {

MarketDataCache::MarketDataCache(IMarketDataSource& source,
                                 const ITimeProvider& clock,
                                 CacheConfig config)
    : source_(source),
      clock_(clock),
      config_(std::move(config)),
      limiter_(clock, config_.rate_limit_per_second, config_.rate_limit_burst) {}

std::string MarketDataCache::key_of(const std::string& symbol,
                                    domain::Timeframe timeframe) {
  return symbol + "|" + domain::to_string(timeframe);
}

std::shared_ptr<MarketDataCache::Entry> MarketDataCache::find_entry(
    const std::string& key) const {
  std::shared_lock lock(entries_mutex_);
  auto it = entries_.find(key);
  return (it != entries_.end()) ? it->second : nullptr;
}

// -----------------------------------------------------------------------------
// find_or_create_entry(): shared lock for the common hit, unique lock only
// when the pair is seen for the first time.
// -----------------------------------------------------------------------------
std::shared_ptr<MarketDataCache::Entry> MarketDataCache::find_or_create_entry(
    const std::string& key) {
  if (auto existing = find_entry(key)) {
    return existing;
  }
  std::unique_lock lock(entries_mutex_);
  auto& slot = entries_[key];
  if (!slot) {
    slot = std::make_shared<Entry>();
    slot->last_access_ms = clock_.now_ms();
  }
  return slot;
}

// -----------------------------------------------------------------------------
// get_window()
// -----------------------------------------------------------------------------
std::vector<domain::Candle> MarketDataCache::get_window(
    const std::string& symbol, domain::Timeframe timeframe,
    std::size_t length, std::int64_t deadline_ms) {
  if (length == 0) {
    return {};
  }

  std::shared_ptr<Entry> entry = find_or_create_entry(key_of(symbol, timeframe));
  const std::int64_t now = clock_.now_ms();

  std::unique_lock lock(entry->mutex);
  entry->last_access_ms = now;

  if (is_fresh_locked(*entry, timeframe, length, now)) {
    hits_.fetch_add(1);
    return tail_locked(*entry, length);
  }
  misses_.fetch_add(1);

  std::exception_ptr error;

  if (entry->fetching) {
    // Another caller is already talking to upstream for this pair.
    coalesced_waits_.fetch_add(1);
    const std::uint64_t generation = entry->fetch_generation;
    entry->fetch_done.wait(
        lock, [&] { return entry->fetch_generation != generation; });
    error = entry->last_fetch_error;
  } else {
    std::int64_t timeout_ms = config_.fetch_timeout_ms;
    if (deadline_ms > 0) {
      timeout_ms = std::min(timeout_ms, deadline_ms - now);
      if (timeout_ms <= 0) {
        throw RunCancelled("Deadline passed before fetching " + symbol);
      }
    }

    const std::int64_t tf_ms = domain::timeframe_ms(timeframe);
    std::int64_t since_ms = 0;
    if (entry->candles.empty()) {
      const auto periods = static_cast<std::int64_t>(
          std::max(length, config_.max_candles));
      since_ms = now - periods * tf_ms;
    } else {
      since_ms = entry->candles.back().open_time_ms;
    }

    entry->fetching = true;
    lock.unlock();

    std::vector<domain::Candle> fetched;
    error = fetch_from_source(symbol, timeframe, since_ms, timeout_ms, fetched);

    lock.lock();
    if (!error) {
      merge_locked(*entry, fetched);
    }
    entry->last_fetch_error = error;
    entry->fetching = false;
    ++entry->fetch_generation;
    entry->fetch_done.notify_all();
  }

  if (error) {
    if (is_servable_stale_locked(*entry, timeframe, length, clock_.now_ms())) {
      stale_serves_.fetch_add(1);
      return tail_locked(*entry, length);
    }
    std::rethrow_exception(error);
  }

  if (entry->candles.size() < length) {
    throw InsufficientHistory(symbol + " " + domain::to_string(timeframe) +
                              ": have " +
                              std::to_string(entry->candles.size()) +
                              " candles, need " + std::to_string(length));
  }
  return tail_locked(*entry, length);
}

// -----------------------------------------------------------------------------
// fetch_from_source(): the only place the upstream source is called.
// Failures are normalized into the DataUnavailable family.
// -----------------------------------------------------------------------------
std::exception_ptr MarketDataCache::fetch_from_source(
    const std::string& symbol, domain::Timeframe timeframe,
    std::int64_t since_ms, std::int64_t timeout_ms,
    std::vector<domain::Candle>& out) {
  if (!limiter_.try_acquire()) {
    fetch_failures_.fetch_add(1);
    return std::make_exception_ptr(
        RateLimited("Local rate limit reached fetching " + symbol));
  }

  fetches_.fetch_add(1);
  try {
    out = source_.fetch_candles(symbol, timeframe, since_ms, timeout_ms);
    return nullptr;
  } catch (const DataUnavailable& e) {
    fetch_failures_.fetch_add(1);
    std::cerr << "[MarketDataCache] fetch " << symbol << " "
              << domain::to_string(timeframe) << " failed: " << e.what()
              << "\n";
    return std::current_exception();
  } catch (const std::exception& e) {
    fetch_failures_.fetch_add(1);
    std::cerr << "[MarketDataCache] fetch " << symbol << " "
              << domain::to_string(timeframe) << " failed: " << e.what()
              << "\n";
    return std::make_exception_ptr(DataUnavailable(
        "Upstream failure fetching " + symbol + ": " + e.what()));
  }
}

bool MarketDataCache::is_fresh_locked(const Entry& entry,
                                      domain::Timeframe timeframe,
                                      std::size_t length,
                                      std::int64_t now_ms) const {
  if (entry.candles.size() < length) {
    return false;
  }
  const std::int64_t age = now_ms - entry.candles.back().open_time_ms;
  return age <= domain::timeframe_ms(timeframe);
}

bool MarketDataCache::is_servable_stale_locked(const Entry& entry,
                                               domain::Timeframe timeframe,
                                               std::size_t length,
                                               std::int64_t now_ms) const {
  if (entry.candles.size() < length) {
    return false;
  }
  const std::int64_t age = now_ms - entry.candles.back().open_time_ms;
  return age <= domain::timeframe_ms(timeframe) + config_.stale_tolerance_ms;
}

// -----------------------------------------------------------------------------
// merge_locked(): keep candles ordered and unique by open time. The common
// case (strictly newer candles) is a push_back; equal open times replace.
// -----------------------------------------------------------------------------
void MarketDataCache::merge_locked(Entry& entry,
                                   const std::vector<domain::Candle>& candles) {
  auto& series = entry.candles;
  for (const auto& candle : candles) {
    if (series.empty() || candle.open_time_ms > series.back().open_time_ms) {
      series.push_back(candle);
      continue;
    }
    auto it = std::lower_bound(
        series.begin(), series.end(), candle.open_time_ms,
        [](const domain::Candle& c, std::int64_t t) {
          return c.open_time_ms < t;
        });
    if (it != series.end() && it->open_time_ms == candle.open_time_ms) {
      *it = candle;
    } else {
      series.insert(it, candle);
    }
  }
  while (series.size() > config_.max_candles) {
    series.pop_front();
  }
}

std::vector<domain::Candle> MarketDataCache::tail_locked(const Entry& entry,
                                                         std::size_t length) {
  const auto& series = entry.candles;
  return std::vector<domain::Candle>(
      series.end() - static_cast<std::ptrdiff_t>(length), series.end());
}

void MarketDataCache::upsert_candle(const domain::Candle& candle) {
  auto entry = find_or_create_entry(key_of(candle.symbol, candle.timeframe));
  std::lock_guard lock(entry->mutex);
  merge_locked(*entry, {candle});
}

// -----------------------------------------------------------------------------
// evict_idle(): lock order is map then entry. get_window() never holds an
// entry lock while taking the map lock, so this cannot deadlock with it.
// -----------------------------------------------------------------------------
std::size_t MarketDataCache::evict_idle() {
  const std::int64_t now = clock_.now_ms();
  std::size_t removed = 0;

  std::unique_lock lock(entries_mutex_);
  for (auto it = entries_.begin(); it != entries_.end();) {
    bool idle = false;
    {
      std::lock_guard entry_lock(it->second->mutex);
      idle = !it->second->fetching &&
             (now - it->second->last_access_ms) > config_.ttl_ms;
    }
    if (idle) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }

  if (removed > 0) {
    evictions_.fetch_add(removed);
    std::cout << "[MarketDataCache] evicted " << removed
              << " idle entr" << (removed == 1 ? "y" : "ies") << "\n";
  }
  return removed;
}

void MarketDataCache::clear(const std::string& symbol) {
  const std::string prefix = symbol + "|";
  std::unique_lock lock(entries_mutex_);
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->first.compare(0, prefix.size(), prefix) == 0) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t MarketDataCache::candle_count(const std::string& symbol,
                                          domain::Timeframe timeframe) const {
  auto entry = find_entry(key_of(symbol, timeframe));
  if (!entry) {
    return 0;
  }
  std::lock_guard lock(entry->mutex);
  return entry->candles.size();
}

std::size_t MarketDataCache::entry_count() const {
  std::shared_lock lock(entries_mutex_);
  return entries_.size();
}

MarketDataCache::Stats MarketDataCache::stats() const {
  Stats s;
  s.hits = hits_.load();
  s.misses = misses_.load();
  s.fetches = fetches_.load();
  s.fetch_failures = fetch_failures_.load();
  s.coalesced_waits = coalesced_waits_.load();
  s.stale_serves = stale_serves_.load();
  s.evictions = evictions_.load();
  return s;
}

}  // namespace sigrisk
