#include <catch2/catch_all.hpp>

#include "normalize.hpp"

#include <string>

using namespace invoicemap;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("normalizeDate accepts common invoice formats", "[normalize]") {
  REQUIRE(normalizeDate("2024-03-15") == std::optional<std::string>("2024-03-15"));
  REQUIRE(normalizeDate("03/15/2024") == std::optional<std::string>("2024-03-15"));
  REQUIRE(normalizeDate("3-5-2024") == std::optional<std::string>("2024-03-05"));
  REQUIRE(normalizeDate("15.03.2024") == std::optional<std::string>("2024-03-15"));
  REQUIRE(normalizeDate("15 Mar 2024") == std::optional<std::string>("2024-03-15"));
  REQUIRE(normalizeDate("March 5, 2024") == std::optional<std::string>("2024-03-05"));
  REQUIRE(normalizeDate("Date: 2024-02-29") == std::optional<std::string>("2024-02-29"));
}

TEST_CASE("normalizeDate rejects impossible dates", "[normalize]") {
  REQUIRE_FALSE(normalizeDate("2023-02-29").has_value());
  REQUIRE_FALSE(normalizeDate("13/40/2024").has_value());
  REQUIRE_FALSE(normalizeDate("soon").has_value());
}

TEST_CASE("normalizeAmount handles symbols and separators", "[normalize]") {
  REQUIRE(normalizeAmount("$1,234.56") == std::optional<std::string>("1234.56"));
  REQUIRE(normalizeAmount("EUR 1.234,56") == std::optional<std::string>("1234.56"));
  REQUIRE(normalizeAmount("12,5") == std::optional<std::string>("12.50"));
  REQUIRE(normalizeAmount("1,234") == std::optional<std::string>("1234.00"));
  REQUIRE(normalizeAmount("-42") == std::optional<std::string>("-42.00"));
  REQUIRE_FALSE(normalizeAmount("n/a").has_value());
}

TEST_CASE("normalizeWeight drops the unit", "[normalize]") {
  REQUIRE(normalizeWeight("125.5 KG") == std::optional<std::string>("125.50"));
  REQUIRE(normalizeWeight("1,200 lbs") == std::optional<std::string>("1200.00"));
  REQUIRE_FALSE(normalizeWeight("kg").has_value());
}

TEST_CASE("normalizeValue follows the field data type", "[normalize]") {
  REQUIRE(normalizeValue("total_amount", " $1,234.56 ") == "1234.56");
  REQUIRE(normalizeValue("invoice_date", "03/15/2024") == "2024-03-15");
  REQUIRE(normalizeValue("gross_weight", "80 kg") == "80.00");
  REQUIRE(normalizeValue("invoice_number", "  INV-1 ") == "INV-1");
  // Values a normalizer cannot read stay as extracted
  REQUIRE(normalizeValue("invoice_date", "next week") == "next week");
  REQUIRE(normalizeValue("unknown_field", " x ") == "x");
}

TEST_CASE("validateValue anchors at the start of the value", "[normalize]") {
  REQUIRE(validateValue("USD", "^[A-Z]{3}$").isValid);

  ValidationResult bad = validateValue("usd", "^[A-Z]{3}$");
  REQUIRE_FALSE(bad.isValid);
  REQUIRE(bad.error.has_value());
  REQUIRE_THAT(*bad.error, ContainsSubstring("Value does not match pattern: ^[A-Z]{3}$"));

  REQUIRE(validateValue("INV-1", "INV").isValid);
  REQUIRE_FALSE(validateValue("xINV", "INV").isValid);
}

TEST_CASE("validateValue treats an unusable pattern as a pass", "[normalize]") {
  REQUIRE(validateValue("anything", "([").isValid);
  REQUIRE(validateValue("anything", "").isValid);
}
