#include <catalog/store.hpp>

#include <catalog/internal.hpp>

#include <algorithm>
#include <mutex>

namespace catalog {

namespace {

constexpr const char* kCreateTotal   = "catalog.store.create_total";
constexpr const char* kUpdateTotal   = "catalog.store.update_total";
constexpr const char* kDeleteTotal   = "catalog.store.delete_total";
constexpr const char* kConflictTotal = "catalog.store.conflict_total";
constexpr const char* kProductsGauge = "catalog.store.products";

// --------------------------
// Observability helpers
// --------------------------
inline void EmitCounter(const StoreOptions& opt,
                        std::string_view name,
                        uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitGauge(const StoreOptions& opt,
                      std::string_view name,
                      double value) {
  if (opt.metrics) opt.metrics->Gauge(name, value);
}

std::string DuplicateNameMessage(std::string_view name) {
  return "Product with name \"" + std::string(name) + "\" already exists";
}

}  // namespace

std::string ProductNotFoundMessage(int64_t id) {
  return "Product with ID " + std::to_string(id) + " not found";
}

std::vector<ProductDraft> SampleProducts() {
  return {
      {"Laptop Pro", "High-performance laptop", 1299.99, "Electronics", true},
      {"Wireless Mouse", "Ergonomic mouse", 24.50, "Accessories", true},
      {"Coffee Maker", "12-cup automatic brewer", 85.00, "Home Goods", false},
  };
}

ProductStore::ProductStore(const StoreOptions& opt) : opt_(opt) {
  if (opt_.seed_sample_data) {
    for (const auto& draft : SampleProducts()) {
      Product p;
      p.id = next_id_++;
      p.name = draft.name;
      p.description = draft.description;
      p.price = draft.price;
      p.category = draft.category;
      p.in_stock = draft.in_stock;
      products_.push_back(std::move(p));
    }
  }
  EmitSizeLocked();
}

std::vector<Product>::const_iterator ProductStore::FindLocked(int64_t id) const {
  return std::find_if(products_.begin(), products_.end(),
                      [id](const Product& p) { return p.id == id; });
}

bool ProductStore::NameTakenLocked(std::string_view name, int64_t exclude_id) const {
  const std::string key = internal::NameKey(name);
  return std::any_of(products_.begin(), products_.end(),
                     [&](const Product& p) {
                       return p.id != exclude_id && internal::NameKey(p.name) == key;
                     });
}

void ProductStore::EmitSizeLocked() const {
  EmitGauge(opt_, kProductsGauge, static_cast<double>(products_.size()));
}

std::vector<Product> ProductStore::List() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return products_;
}

Status ProductStore::Get(int64_t id, Product* out) const {
  if (!out) return Status::Internal("out is null");

  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = FindLocked(id);
  if (it == products_.end()) {
    return Status::NotFound(ProductNotFoundMessage(id));
  }
  *out = *it;
  return Status::OK();
}

Status ProductStore::IndexOf(int64_t id, size_t* index_out) const {
  if (!index_out) return Status::Internal("index_out is null");

  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = FindLocked(id);
  if (it == products_.end()) {
    return Status::NotFound(ProductNotFoundMessage(id));
  }
  *index_out = static_cast<size_t>(it - products_.begin());
  return Status::OK();
}

Status ProductStore::Create(const ProductDraft& draft, Product* out) {
  if (!out) return Status::Internal("out is null");

  std::unique_lock<std::shared_mutex> lock(mu_);

  // Ids start at 1, so 0 never excludes a live record.
  if (NameTakenLocked(draft.name, 0)) {
    EmitCounter(opt_, kConflictTotal);
    return Status::Conflict(DuplicateNameMessage(draft.name));
  }

  Product p;
  p.id = next_id_++;
  p.name = internal::Trim(draft.name);
  p.description = internal::Trim(draft.description);
  p.price = draft.price;
  p.category = internal::Trim(draft.category);
  p.in_stock = draft.in_stock;
  products_.push_back(p);

  EmitCounter(opt_, kCreateTotal);
  EmitSizeLocked();

  *out = std::move(p);
  return Status::OK();
}

Status ProductStore::Update(int64_t id, const ProductPatch& patch, Product* out) {
  if (!out) return Status::Internal("out is null");

  std::unique_lock<std::shared_mutex> lock(mu_);

  auto it = std::find_if(products_.begin(), products_.end(),
                         [id](const Product& p) { return p.id == id; });
  if (it == products_.end()) {
    return Status::NotFound(ProductNotFoundMessage(id));
  }

  if (patch.name && NameTakenLocked(*patch.name, id)) {
    EmitCounter(opt_, kConflictTotal);
    return Status::Conflict(DuplicateNameMessage(*patch.name));
  }

  if (patch.name) it->name = internal::Trim(*patch.name);
  if (patch.description) it->description = internal::Trim(*patch.description);
  if (patch.price) it->price = *patch.price;
  if (patch.category) it->category = internal::Trim(*patch.category);
  if (patch.in_stock) it->in_stock = *patch.in_stock;

  if (!patch.empty()) EmitCounter(opt_, kUpdateTotal);

  *out = *it;
  return Status::OK();
}

Status ProductStore::Delete(int64_t id, Product* removed_out) {
  if (!removed_out) return Status::Internal("removed_out is null");

  std::unique_lock<std::shared_mutex> lock(mu_);

  auto it = FindLocked(id);
  if (it == products_.end()) {
    return Status::NotFound(ProductNotFoundMessage(id));
  }

  *removed_out = *it;
  products_.erase(it);

  EmitCounter(opt_, kDeleteTotal);
  EmitSizeLocked();
  return Status::OK();
}

size_t ProductStore::Size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return products_.size();
}

int64_t ProductStore::NextId() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return next_id_;
}

}  // namespace catalog
