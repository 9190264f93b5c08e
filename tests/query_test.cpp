// Unit tests for catalog/query.hpp
// Tests: parameter coercion, pagination parsing, sort parsing, pagination metadata

#include <gtest/gtest.h>

#include <catalog/query.hpp>

#include <cstdint>
#include <limits>

namespace catalog::query {
namespace {

// =============================================================================
// Coercion
// =============================================================================

TEST(CoercionTest, ParseInt64) {
  EXPECT_EQ(ParseInt64("42"), 42);
  EXPECT_EQ(ParseInt64(" 7 "), 7);
  EXPECT_EQ(ParseInt64("-3"), -3);
  EXPECT_EQ(ParseInt64("+5"), 5);
  EXPECT_FALSE(ParseInt64(""));
  EXPECT_FALSE(ParseInt64("abc"));
  EXPECT_FALSE(ParseInt64("12abc"));
  EXPECT_FALSE(ParseInt64("1.5"));
  EXPECT_FALSE(ParseInt64("99999999999999999999"));
}

TEST(CoercionTest, ParseDouble) {
  EXPECT_DOUBLE_EQ(*ParseDouble("9.99"), 9.99);
  EXPECT_DOUBLE_EQ(*ParseDouble("50"), 50.0);
  EXPECT_DOUBLE_EQ(*ParseDouble("1e2"), 100.0);
  EXPECT_FALSE(ParseDouble(""));
  EXPECT_FALSE(ParseDouble("cheap"));
  EXPECT_FALSE(ParseDouble("50abc"));
  EXPECT_FALSE(ParseDouble("nan"));
  EXPECT_FALSE(ParseDouble("inf"));
}

TEST(CoercionTest, ParseBool) {
  EXPECT_EQ(ParseBool("true"), true);
  EXPECT_EQ(ParseBool("false"), false);
  EXPECT_FALSE(ParseBool("TRUE"));
  EXPECT_FALSE(ParseBool("1"));
  EXPECT_FALSE(ParseBool(""));
}

TEST(CoercionTest, GetParamDistinguishesAbsentFromEmpty) {
  Params params{{"category", ""}};
  EXPECT_TRUE(GetParam(params, "category").has_value());
  EXPECT_EQ(*GetParam(params, "category"), "");
  EXPECT_FALSE(GetParam(params, "inStock").has_value());
}

// =============================================================================
// ParsePagination
// =============================================================================

TEST(ParsePaginationTest, Defaults) {
  auto p = ParsePagination({});
  EXPECT_EQ(p.page, 1);
  EXPECT_EQ(p.limit, 10);
  EXPECT_EQ(p.skip, 0);
}

TEST(ParsePaginationTest, ComputesSkip) {
  auto p = ParsePagination({{"page", "3"}, {"limit", "5"}});
  EXPECT_EQ(p.page, 3);
  EXPECT_EQ(p.limit, 5);
  EXPECT_EQ(p.skip, 10);
}

TEST(ParsePaginationTest, NonPositivePageBecomesOne) {
  EXPECT_EQ(ParsePagination({{"page", "0"}}).page, 1);
  EXPECT_EQ(ParsePagination({{"page", "-4"}}).page, 1);
  EXPECT_EQ(ParsePagination({{"page", "abc"}}).page, 1);
}

TEST(ParsePaginationTest, LimitClampedToMaximum) {
  PaginationDefaults defaults;
  defaults.default_limit = 10;
  defaults.max_limit = 25;
  EXPECT_EQ(ParsePagination({{"limit", "1000"}}, defaults).limit, 25);
}

TEST(ParsePaginationTest, InvalidLimitFallsBackToDefault) {
  EXPECT_EQ(ParsePagination({{"limit", "0"}}).limit, 10);
  EXPECT_EQ(ParsePagination({{"limit", "-1"}}).limit, 10);
  EXPECT_EQ(ParsePagination({{"limit", "ten"}}).limit, 10);
}

TEST(ParsePaginationTest, HugePageDoesNotOverflow) {
  auto p = ParsePagination({{"page", "9223372036854775807"}, {"limit", "100"}});
  EXPECT_EQ(p.skip, std::numeric_limits<int64_t>::max());
}

// =============================================================================
// ParseSort
// =============================================================================

TEST(ParseSortTest, AbsentYieldsNothing) {
  EXPECT_FALSE(ParseSort({}).has_value());
  EXPECT_FALSE(ParseSort({{"sort", ""}}).has_value());
}

TEST(ParseSortTest, Ascending) {
  auto s = ParseSort({{"sort", "price"}});
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->field, "price");
  EXPECT_EQ(s->order, SortOrder::kAsc);
}

TEST(ParseSortTest, LeadingDashIsDescending) {
  auto s = ParseSort({{"sort", "-name"}});
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->field, "name");
  EXPECT_EQ(s->order, SortOrder::kDesc);
}

TEST(ParseSortTest, UnknownFieldIsIgnored) {
  EXPECT_FALSE(ParseSort({{"sort", "weight"}}).has_value());
  EXPECT_FALSE(ParseSort({{"sort", "-"}}).has_value());
}

TEST(ParseSortTest, OrderNames) {
  EXPECT_EQ(SortOrderName(SortOrder::kAsc), "asc");
  EXPECT_EQ(SortOrderName(SortOrder::kDesc), "desc");
}

// =============================================================================
// CreatePaginationMeta
// =============================================================================

TEST(PaginationMetaTest, MiddlePage) {
  auto m = CreatePaginationMeta(25, 2, 10);
  EXPECT_EQ(m.current_page, 2);
  EXPECT_EQ(m.total_pages, 3);
  EXPECT_EQ(m.total_items, 25);
  EXPECT_EQ(m.items_per_page, 10);
  EXPECT_TRUE(m.has_next_page);
  EXPECT_TRUE(m.has_prev_page);
  EXPECT_EQ(m.next_page, 3);
  EXPECT_EQ(m.prev_page, 1);
}

TEST(PaginationMetaTest, LastPageHasNoNext) {
  auto m = CreatePaginationMeta(20, 2, 10);
  EXPECT_EQ(m.total_pages, 2);
  EXPECT_FALSE(m.has_next_page);
  EXPECT_FALSE(m.next_page.has_value());
}

TEST(PaginationMetaTest, EmptyResult) {
  auto m = CreatePaginationMeta(0, 1, 10);
  EXPECT_EQ(m.total_pages, 0);
  EXPECT_FALSE(m.has_next_page);
  EXPECT_FALSE(m.has_prev_page);
  EXPECT_FALSE(m.prev_page.has_value());
}

TEST(PaginationMetaTest, NextPageMatchesCeilingForAllSmallInputs) {
  for (int64_t total = 0; total <= 30; ++total) {
    for (int64_t limit = 1; limit <= 7; ++limit) {
      for (int64_t page = 1; page <= 8; ++page) {
        auto m = CreatePaginationMeta(total, page, limit);
        int64_t pages = (total + limit - 1) / limit;
        EXPECT_EQ(m.total_pages, pages);
        EXPECT_EQ(m.has_next_page, page < pages);
        if (m.has_next_page) {
          EXPECT_EQ(m.next_page, page + 1);
        } else {
          EXPECT_FALSE(m.next_page.has_value());
        }
      }
    }
  }
}

}  // namespace
}  // namespace catalog::query
