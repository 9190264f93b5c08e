#pragma once

#include <catalog/product.hpp>
#include <catalog/status.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace catalog {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., creates, conflicts). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., number of live products).
   *  Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/** Options for the product store. */
struct StoreOptions {
  // Start with the three sample products (ids 1-3).
  bool seed_sample_data = false;

  // Observability hook (optional). Mutations emit counters and the
  // catalog.store.products gauge.
  std::shared_ptr<MetricsSink> metrics;
};

/**
 * catalog::ProductStore
 *
 * An ordered in-memory collection of products plus a monotonic id
 * generator. Iteration order is insertion order. Ids are never reused.
 *
 * Thread-safe: reads take a shared lock and return copies; mutations take
 * an exclusive lock that also spans the duplicate-name check, so two
 * concurrent creates can never admit the same name.
 */
class ProductStore {
 public:
  explicit ProductStore(const StoreOptions& opt = StoreOptions{});

  ProductStore(const ProductStore&) = delete;
  ProductStore& operator=(const ProductStore&) = delete;

  /** All products in insertion order. */
  std::vector<Product> List() const;

  /** Look up a product by id. NotFound if absent. */
  Status Get(int64_t id, Product* out) const;

  /** Position of a product in insertion order. NotFound if absent. */
  Status IndexOf(int64_t id, size_t* index_out) const;

  /**
   * Append a new product with the next id.
   * Strings are trimmed. Conflict if another product has the same name
   * (trimmed, case-insensitive).
   */
  Status Create(const ProductDraft& draft, Product* out);

  /**
   * Apply the fields present in patch to product id.
   * NotFound if absent; Conflict if the new name collides with a different
   * product. An empty patch is a no-op that still returns the record.
   */
  Status Update(int64_t id, const ProductPatch& patch, Product* out);

  /** Remove product id and return the removed record. */
  Status Delete(int64_t id, Product* removed_out);

  size_t Size() const;

  /** Id that the next Create() will assign. */
  int64_t NextId() const;

 private:
  // Caller must hold mu_ (shared or exclusive).
  std::vector<Product>::const_iterator FindLocked(int64_t id) const;
  bool NameTakenLocked(std::string_view name, int64_t exclude_id) const;
  void EmitSizeLocked() const;

  StoreOptions opt_;

  mutable std::shared_mutex mu_;
  std::vector<Product> products_;
  int64_t next_id_ = 1;
};

/** The sample catalog the service starts with. */
std::vector<ProductDraft> SampleProducts();

/** Status message used for a missing product id. */
std::string ProductNotFoundMessage(int64_t id);

}  // namespace catalog
