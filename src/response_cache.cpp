#include "routegate/response_cache.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

#if defined(ROUTEGATE_WITH_ZSTD)
#include <zstd.h>
#endif

#include "routegate/hash.hpp"
#include "routegate/jsonlite.hpp"

namespace routegate {

namespace {

namespace jl = jsonlite;

#if defined(ROUTEGATE_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}
#endif

}  // namespace

std::string normalize_prompt(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out += ' ';
    pending_space = false;
    out += c;
  }
  return out;
}

std::string cache_key_material_json(const CacheKeyMaterial& m) {
  // Keys in sorted order; this is already canonical form.
  std::ostringstream o;
  o << "{\"max_tokens\":" << m.max_tokens
    << ",\"model\":\"" << jl::escape(m.ref.model) << "\""
    << ",\"prompt\":\"" << jl::escape(normalize_prompt(m.prompt)) << "\""
    << ",\"provider\":\"" << jl::escape(m.ref.provider) << "\""
    << ",\"system_prompt\":\"" << jl::escape(normalize_prompt(m.system_prompt)) << "\""
    << ",\"temperature\":" << jl::format_double(m.temperature) << "}";
  return o.str();
}

std::string compute_cache_key(const CacheKeyMaterial& m) {
  return cache_key_hash(cache_key_material_json(m));
}

std::string CacheEntry::to_json(bool include_completion) const {
  std::ostringstream o;
  o << "{\"key\":\"" << key << "\""
    << ",\"provider\":\"" << jl::escape(ref.provider) << "\""
    << ",\"model\":\"" << jl::escape(ref.model) << "\""
    << ",\"encoding\":\"" << encoding << "\""
    << ",\"original_size\":" << original_size
    << ",\"stored_size\":" << stored_size
    << ",\"cost_usd\":" << jl::format_double(cost_usd)
    << ",\"hit_count\":" << hit_count
    << ",\"created_at\":\"" << unix_ms_to_iso(created_unix_ms) << "\""
    << ",\"last_accessed\":\"" << unix_ms_to_iso(last_accessed_unix_ms) << "\""
    << ",\"ttl_ms\":" << ttl_ms;
  if (include_completion) o << ",\"completion\":\"" << jl::escape(completion) << "\"";
  o << "}";
  return o.str();
}

double CacheStats::hit_rate() const {
  return lookups ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0;
}

std::string CacheStats::to_json() const {
  std::ostringstream o;
  o << "{\"entries\":" << entries
    << ",\"bytes\":" << bytes
    << ",\"lookups\":" << lookups
    << ",\"hits\":" << hits
    << ",\"misses\":" << misses
    << ",\"hit_rate\":" << jl::format_double(hit_rate())
    << ",\"stores\":" << stores
    << ",\"evictions\":" << evictions
    << ",\"expirations\":" << expirations
    << ",\"estimated_savings_usd\":" << jl::format_double(estimated_savings_usd) << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// ResponseCache
// ---------------------------------------------------------------------------

ResponseCache::ResponseCache(CacheConfig cfg, std::shared_ptr<Clock> clock)
    : cfg_(cfg), clock_(clock ? std::move(clock) : system_clock()) {}

bool ResponseCache::expired(const Slot& s, uint64_t now_mono) const {
  return now_mono >= s.created_mono_ms + s.entry.ttl_ms;
}

void ResponseCache::erase_locked(std::unordered_map<std::string, Slot>::iterator it) {
  bytes_ -= std::min<uint64_t>(bytes_, it->second.entry.stored_size);
  slots_.erase(it);
}

CacheEntry ResponseCache::decoded(const Slot& s) const {
  CacheEntry e = s.entry;
#if defined(ROUTEGATE_WITH_ZSTD)
  if (e.encoding == "zstd") e.completion = decompress_zstd(e.completion, e.original_size);
#endif
  return e;
}

void ResponseCache::make_room_locked(uint64_t incoming_bytes, uint64_t now_mono) {
  auto over = [&]() {
    return slots_.size() + 1 > cfg_.max_entries || bytes_ + incoming_bytes > cfg_.max_bytes;
  };
  if (!over()) return;

  for (auto it = slots_.begin(); it != slots_.end();) {
    if (expired(it->second, now_mono)) {
      auto next = std::next(it);
      erase_locked(it);
      ++counters_.expirations;
      it = next;
    } else {
      ++it;
    }
  }

  while (over() && !slots_.empty()) {
    auto victim = slots_.end();
    auto lru = slots_.end();
    for (auto it = slots_.begin(); it != slots_.end(); ++it) {
      const Slot& s = it->second;
      auto older = [&](decltype(it) cur) {
        return cur == slots_.end() || s.accessed_mono_ms < cur->second.accessed_mono_ms ||
               (s.accessed_mono_ms == cur->second.accessed_mono_ms && it->first < cur->first);
      };
      if (older(lru)) lru = it;
      if (s.entry.hit_count >= cfg_.eviction_min_hits && older(victim)) victim = it;
    }
    if (victim == slots_.end()) victim = lru;
    erase_locked(victim);
    ++counters_.evictions;
  }
}

std::optional<CacheEntry> ResponseCache::lookup(const std::string& key) {
  if (!cfg_.enabled) return std::nullopt;
  const uint64_t now_mono = clock_->monotonic_ms();
  std::lock_guard<std::mutex> lk(mu_);
  ++counters_.lookups;
  auto it = slots_.find(key);
  if (it == slots_.end()) {
    ++counters_.misses;
    return std::nullopt;
  }
  if (expired(it->second, now_mono)) {
    erase_locked(it);
    ++counters_.expirations;
    ++counters_.misses;
    return std::nullopt;
  }
  Slot& s = it->second;
  ++s.entry.hit_count;
  s.entry.last_accessed_unix_ms = clock_->unix_ms();
  s.accessed_mono_ms = now_mono;
  ++counters_.hits;
  return decoded(s);
}

std::optional<CacheEntry> ResponseCache::peek(const std::string& key) const {
  const uint64_t now_mono = clock_->monotonic_ms();
  std::lock_guard<std::mutex> lk(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end() || expired(it->second, now_mono)) return std::nullopt;
  return decoded(it->second);
}

bool ResponseCache::store(const std::string& key, const ModelRef& ref, const std::string& completion,
                          double cost_usd, std::optional<uint64_t> ttl_ms) {
  if (!cfg_.enabled || key.empty()) return false;
  const uint64_t now_mono = clock_->monotonic_ms();
  const uint64_t now_unix = clock_->unix_ms();

  Slot slot;
  slot.entry.key = key;
  slot.entry.ref = ref;
  slot.entry.cost_usd = std::max(0.0, cost_usd);
  slot.entry.original_size = completion.size();
  slot.entry.created_unix_ms = now_unix;
  slot.entry.last_accessed_unix_ms = now_unix;
  slot.entry.ttl_ms = ttl_ms.value_or(cfg_.ttl_ms);
  slot.created_mono_ms = now_mono;
  slot.accessed_mono_ms = now_mono;
  slot.entry.completion = completion;
#if defined(ROUTEGATE_WITH_ZSTD)
  if (completion.size() > cfg_.compress_threshold_bytes) {
    std::string packed = compress_zstd(completion);
    if (!packed.empty() && packed.size() < completion.size()) {
      slot.entry.completion = std::move(packed);
      slot.entry.encoding = "zstd";
    }
  }
#endif
  slot.entry.stored_size = slot.entry.completion.size();
  if (slot.entry.stored_size > cfg_.max_bytes) return false;

  std::lock_guard<std::mutex> lk(mu_);
  auto it = slots_.find(key);
  if (it != slots_.end()) {
    if (!expired(it->second, now_mono)) return false;
    erase_locked(it);
    ++counters_.expirations;
  }
  make_room_locked(slot.entry.stored_size, now_mono);
  bytes_ += slot.entry.stored_size;
  slots_.emplace(key, std::move(slot));
  ++counters_.stores;
  return true;
}

bool ResponseCache::invalidate(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end()) return false;
  erase_locked(it);
  return true;
}

size_t ResponseCache::invalidate_model(const ModelRef& ref) {
  std::lock_guard<std::mutex> lk(mu_);
  size_t removed = 0;
  for (auto it = slots_.begin(); it != slots_.end();) {
    if (it->second.entry.ref == ref) {
      auto next = std::next(it);
      erase_locked(it);
      ++removed;
      it = next;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t ResponseCache::cleanup_expired() {
  const uint64_t now_mono = clock_->monotonic_ms();
  std::lock_guard<std::mutex> lk(mu_);
  size_t removed = 0;
  for (auto it = slots_.begin(); it != slots_.end();) {
    if (expired(it->second, now_mono)) {
      auto next = std::next(it);
      erase_locked(it);
      ++removed;
      it = next;
    } else {
      ++it;
    }
  }
  counters_.expirations += removed;
  return removed;
}

size_t ResponseCache::warm(const std::vector<WarmEntry>& entries) {
  size_t stored = 0;
  for (const auto& w : entries) {
    if (store(compute_cache_key(w.material), w.material.ref, w.completion, w.cost_usd)) ++stored;
  }
  return stored;
}

CacheStats ResponseCache::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  CacheStats s = counters_;
  s.entries = slots_.size();
  s.bytes = bytes_;
  s.estimated_savings_usd = 0.0;
  for (const auto& [key, slot] : slots_) {
    s.estimated_savings_usd += slot.entry.cost_usd * static_cast<double>(slot.entry.hit_count);
  }
  return s;
}

std::vector<CacheEntry> ResponseCache::hot_entries(size_t limit) const {
  std::vector<CacheEntry> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    out.reserve(slots_.size());
    for (const auto& [key, slot] : slots_) {
      CacheEntry e = slot.entry;
      e.completion.clear();
      out.push_back(std::move(e));
    }
  }
  std::sort(out.begin(), out.end(), [](const CacheEntry& a, const CacheEntry& b) {
    if (a.hit_count != b.hit_count) return a.hit_count > b.hit_count;
    if (a.last_accessed_unix_ms != b.last_accessed_unix_ms) {
      return a.last_accessed_unix_ms > b.last_accessed_unix_ms;
    }
    return a.key < b.key;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

size_t ResponseCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return slots_.size();
}

}  // namespace routegate
