#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace catalog {

/** A single catalog record. */
struct Product {
  int64_t id = 0;
  std::string name;
  std::string description;
  double price = 0.0;
  std::string category;
  bool in_stock = false;

  bool operator==(const Product& other) const {
    return id == other.id && name == other.name &&
           description == other.description && price == other.price &&
           category == other.category && in_stock == other.in_stock;
  }
  bool operator!=(const Product& other) const { return !(*this == other); }
};

/** Validated payload for creating a product. The store assigns the id. */
struct ProductDraft {
  std::string name;
  std::string description;
  double price = 0.0;
  std::string category;
  bool in_stock = false;
};

/** Validated partial update. Unset fields are left untouched. */
struct ProductPatch {
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<double> price;
  std::optional<std::string> category;
  std::optional<bool> in_stock;

  bool empty() const {
    return !name && !description && !price && !category && !in_stock;
  }
};

}  // namespace catalog
