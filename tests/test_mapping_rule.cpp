#include <catch2/catch_all.hpp>

#include "mapping_rule.hpp"

#include <string>
#include <variant>

using namespace invoicemap;

namespace {

const char* kCatalog = R"yaml(
rules:
  - id: inv-regex
    field: invoice_number
    priority: 20
    validation: '^INV-'
    pattern:
      method: regex
      pattern: 'Invoice\s*#\s*:\s*([A-Z0-9-]+)'
      flags: i
      group: 1
      preprocess: uppercase
  - id: total-keyword
    field: total_amount
    forwarder: dhl
    pattern:
      method: keyword
      keywords: [Total, Amount Due]
  - id: shipper-position
    field: shipper_name
    priority: 5
    active: false
    pattern:
      method: position
      selector: '1:3'
  - id: currency-service
    field: currency
    default: USD
    pattern:
      method: azure_field
      name: CurrencyCode
  - id: broken
    pattern:
      method: regex
      pattern: 'x'
  - id: unknown-method
    field: due_date
    pattern:
      method: telepathy
)yaml";

} // namespace

TEST_CASE("parseRuleCatalog reads every pattern kind", "[rules]") {
  auto rules = parseRuleCatalog(kCatalog);
  REQUIRE(rules.size() == 4);

  const MappingRule& regex = rules[0];
  REQUIRE(regex.id == "inv-regex");
  REQUIRE(regex.fieldName == "invoice_number");
  REQUIRE(regex.forwarderId.empty());
  REQUIRE(regex.priority == 20);
  REQUIRE(regex.validationPattern == std::optional<std::string>("^INV-"));
  const auto* rp = std::get_if<RegexPattern>(&regex.pattern);
  REQUIRE(rp != nullptr);
  REQUIRE(rp->pattern == R"(Invoice\s*#\s*:\s*([A-Z0-9-]+))");
  REQUIRE(rp->caseInsensitive);
  REQUIRE_FALSE(rp->multiline);
  REQUIRE(rp->group == 1);
  REQUIRE(rp->preprocess == Preprocessor::Uppercase);

  const auto* kp = std::get_if<KeywordPattern>(&rules[1].pattern);
  REQUIRE(kp != nullptr);
  REQUIRE(kp->labels == std::vector<std::string>{"Total", "Amount Due"});
  REQUIRE(rules[1].forwarderId == "dhl");

  REQUIRE(std::holds_alternative<PositionPattern>(rules[2].pattern));
  REQUIRE_FALSE(rules[2].isActive);

  const auto* pp = std::get_if<PretrainedFieldPattern>(&rules[3].pattern);
  REQUIRE(pp != nullptr);
  REQUIRE(pp->name == "CurrencyCode");
  REQUIRE(rules[3].defaultValue == std::optional<std::string>("USD"));
  REQUIRE(std::string(methodName(rules[3].pattern)) == "pretrained");
}

TEST_CASE("parseRuleCatalog fails on unreadable documents", "[rules]") {
  REQUIRE_THROWS_AS(parseRuleCatalog("rules: [unclosed"), std::runtime_error);
  REQUIRE_THROWS_AS(parseRuleCatalog("rules: 3"), std::runtime_error);
  REQUIRE(parseRuleCatalog("other: 1").empty());
  REQUIRE_THROWS_AS(loadRuleCatalog("/nonexistent/rules.yaml"), std::runtime_error);
}

TEST_CASE("rulesForForwarder keeps universal and matching active rules", "[rules]") {
  auto catalog = parseRuleCatalog(kCatalog);

  auto universal = rulesForForwarder(catalog, "");
  REQUIRE(universal.size() == 2);

  auto dhl = rulesForForwarder(catalog, "dhl");
  REQUIRE(dhl.size() == 3);

  auto other = rulesForForwarder(catalog, "kuehne");
  REQUIRE(other.size() == 2);
}

TEST_CASE("sortByPriority orders by priority then id", "[rules]") {
  std::vector<MappingRule> rules(3);
  rules[0].id = "b";
  rules[0].priority = 10;
  rules[1].id = "c";
  rules[1].priority = 50;
  rules[2].id = "a";
  rules[2].priority = 10;

  sortByPriority(rules);
  REQUIRE(rules[0].id == "c");
  REQUIRE(rules[1].id == "a");
  REQUIRE(rules[2].id == "b");
}

TEST_CASE("preprocessors transform extracted text", "[rules]") {
  REQUIRE(parsePreprocessor("trim") == Preprocessor::Trim);
  REQUIRE(parsePreprocessor("shout") == Preprocessor::None);
  REQUIRE(applyPreprocessor(Preprocessor::Trim, "  a b ") == "a b");
  REQUIRE(applyPreprocessor(Preprocessor::Uppercase, "abc") == "ABC");
  REQUIRE(applyPreprocessor(Preprocessor::Lowercase, "ABC") == "abc");
  REQUIRE(applyPreprocessor(Preprocessor::None, " x ") == " x ");
}

TEST_CASE("parseRuleCatalog reads boosts, dotAll and keyword lists", "[rules]") {
  auto rules = parseRuleCatalog(R"yaml(
rules:
  - id: notes
    field: service_type
    pattern:
      method: regex
      pattern: 'Notes:(.+)End'
      flags: si
      group: 1
      confidenceBoost: 5
  - id: consignee
    field: consignee_name
    pattern:
      method: keyword
      keyword: Consignee
      keywords: [Ship To, '  ', Deliver To]
      confidenceBoost: 10
  - id: vendor
    field: forwarder_name
    pattern:
      method: azure_field
      azureFieldName: VendorName
      confidenceBoost: 3
  - id: too-much
    field: invoice_number
    pattern:
      method: regex
      pattern: 'INV-\d+'
      confidenceBoost: 150
  - id: keywords-scalar
    field: invoice_number
    pattern:
      method: keyword
      keywords: Invoice
)yaml");
  REQUIRE(rules.size() == 3);

  const auto* rp = std::get_if<RegexPattern>(&rules[0].pattern);
  REQUIRE(rp != nullptr);
  REQUIRE(rp->dotAll);
  REQUIRE(rp->caseInsensitive);
  REQUIRE_FALSE(rp->multiline);
  REQUIRE(confidenceBoost(rules[0].pattern) == 5);

  const auto* kp = std::get_if<KeywordPattern>(&rules[1].pattern);
  REQUIRE(kp != nullptr);
  REQUIRE(kp->labels == std::vector<std::string>{"Consignee", "Ship To", "Deliver To"});
  REQUIRE(kp->confidenceBoost == 10);

  const auto* pp = std::get_if<PretrainedFieldPattern>(&rules[2].pattern);
  REQUIRE(pp != nullptr);
  REQUIRE(pp->name == "VendorName");
  REQUIRE(pp->confidenceBoost == 3);
}
