#pragma once

// routegate/response_cache.hpp — Content-addressed cache of prior completions.
//
// DESIGN INVARIANTS:
//   1. KEY = BLAKE3("cache:" + canonical JSON of {max_tokens, model, prompt,
//      provider, system_prompt, temperature}) where prompt and system prompt
//      are normalized first (whitespace runs collapsed to one space, ends
//      trimmed). Incidental formatting never changes the key.
//   2. IMMUTABLE PAYLOAD: once stored, an entry's completion and metadata never
//      change. Only hit_count and last_accessed move. A store() for a key that
//      already holds a live entry is a no-op.
//   3. EXPIRY: an entry older than its TTL (monotonic clock) is never served;
//      it is dropped lazily on lookup or by cleanup_expired().
//   4. CAPACITY: when entries or bytes exceed the ceiling, expired entries go
//      first, then the least recently accessed entry among those with
//      hit_count >= eviction_min_hits, then plain LRU.
//
// STORAGE ENCODING:
//   With ROUTEGATE_WITH_ZSTD, completions above compress_threshold_bytes are
//   stored zstd-compressed (level 3); entry.encoding records "identity" or
//   "zstd". Lookups always return the original bytes.
//
// EXTENSION_POINT: distributed_cache
//   Replace the in-process map with a shared key-value store. The key scheme
//   is versioned by version::CACHE_KEY_VERSION; changing normalization or the
//   material fields requires bumping it.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "routegate/clock.hpp"
#include "routegate/config.hpp"
#include "routegate/types.hpp"

namespace routegate {

std::string normalize_prompt(const std::string& text);

struct CacheKeyMaterial {
  std::string prompt;
  std::string system_prompt;
  ModelRef    ref;
  double      temperature{0.7};
  uint64_t    max_tokens{2000};
};

// Canonical JSON the key is hashed from (normalization applied).
std::string cache_key_material_json(const CacheKeyMaterial& m);
std::string compute_cache_key(const CacheKeyMaterial& m);

struct CacheEntry {
  std::string key;
  ModelRef    ref;
  std::string completion;          // original bytes (decoded on lookup)
  std::string encoding{"identity"};
  uint64_t    original_size{0};
  uint64_t    stored_size{0};
  double      cost_usd{0.0};       // cost of the provider call that produced it
  uint64_t    hit_count{0};
  uint64_t    created_unix_ms{0};
  uint64_t    last_accessed_unix_ms{0};
  uint64_t    ttl_ms{0};

  std::string to_json(bool include_completion = false) const;
};

struct CacheStats {
  uint64_t entries{0};
  uint64_t bytes{0};
  uint64_t lookups{0};
  uint64_t hits{0};
  uint64_t misses{0};
  uint64_t stores{0};
  uint64_t evictions{0};
  uint64_t expirations{0};
  double   estimated_savings_usd{0.0};   // sum of cost * hits over live entries

  double hit_rate() const;
  std::string to_json() const;
};

struct WarmEntry {
  CacheKeyMaterial material;
  std::string      completion;
  double           cost_usd{0.0};
};

class ResponseCache {
 public:
  explicit ResponseCache(CacheConfig cfg = {}, std::shared_ptr<Clock> clock = nullptr);

  bool enabled() const { return cfg_.enabled; }

  // Hit: increments hit_count, updates last_accessed, returns a copy with the
  // original completion bytes.
  std::optional<CacheEntry> lookup(const std::string& key);

  // Like lookup() without counting an access.
  std::optional<CacheEntry> peek(const std::string& key) const;

  // false when the cache is disabled or a live entry already holds the key.
  bool store(const std::string& key, const ModelRef& ref, const std::string& completion,
             double cost_usd, std::optional<uint64_t> ttl_ms = std::nullopt);

  bool invalidate(const std::string& key);
  size_t invalidate_model(const ModelRef& ref);
  size_t cleanup_expired();
  size_t warm(const std::vector<WarmEntry>& entries);

  CacheStats stats() const;
  // Most-hit entries first (ties: most recently accessed), completions omitted.
  std::vector<CacheEntry> hot_entries(size_t limit) const;

  size_t size() const;

 private:
  struct Slot {
    CacheEntry entry;          // entry.completion holds the stored (possibly compressed) bytes
    uint64_t created_mono_ms{0};
    uint64_t accessed_mono_ms{0};
  };

  bool expired(const Slot& s, uint64_t now_mono) const;
  void erase_locked(std::unordered_map<std::string, Slot>::iterator it);
  void make_room_locked(uint64_t incoming_bytes, uint64_t now_mono);
  CacheEntry decoded(const Slot& s) const;

  CacheConfig cfg_;
  std::shared_ptr<Clock> clock_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Slot> slots_;
  uint64_t bytes_{0};
  mutable CacheStats counters_;   // lookups/hits/misses/stores/evictions/expirations
};

}  // namespace routegate
