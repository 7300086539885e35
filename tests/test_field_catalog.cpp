#include <catch2/catch_all.hpp>

#include "field_catalog.hpp"

#include <set>
#include <string>

using namespace invoicemap;

TEST_CASE("standardFields lists every field once", "[catalog]") {
  const auto& fields = standardFields();
  REQUIRE(fields.size() == 90);

  std::set<std::string> names;
  for (const auto& f : fields) names.insert(f.name);
  REQUIRE(names.size() == fields.size());

  REQUIRE(fields.front().name == "invoice_number");
}

TEST_CASE("findField looks fields up by name", "[catalog]") {
  const StandardField* total = findField("total_amount");
  REQUIRE(total != nullptr);
  REQUIRE(total->dataType == FieldDataType::Currency);
  REQUIRE(total->category == FieldCategory::Charges);
  REQUIRE(total->isRequired);

  const StandardField* currency = findField("currency");
  REQUIRE(currency != nullptr);
  REQUIRE(currency->validationPattern == "^[A-Z]{3}$");

  REQUIRE(findField("no_such_field") == nullptr);
}

TEST_CASE("default critical fields are catalog fields", "[catalog]") {
  const auto& critical = defaultCriticalFields();
  REQUIRE(critical.size() == 6);
  for (const auto& name : critical) {
    REQUIRE(findField(name) != nullptr);
    REQUIRE(isCriticalField(name, critical));
  }
  REQUIRE_FALSE(isCriticalField("due_date", critical));
}

TEST_CASE("pretrainedFieldFor maps to service field names", "[catalog]") {
  REQUIRE(pretrainedFieldFor("invoice_number") == std::optional<std::string>("InvoiceId"));
  REQUIRE(pretrainedFieldFor("total_amount") == std::optional<std::string>("InvoiceTotal"));
  REQUIRE_FALSE(pretrainedFieldFor("forwarder_name").has_value());
}

TEST_CASE("fieldsByCategory filters in catalog order", "[catalog]") {
  auto charges = fieldsByCategory(FieldCategory::Charges);
  REQUIRE_FALSE(charges.empty());
  for (const auto& f : charges) REQUIRE(f.category == FieldCategory::Charges);
  REQUIRE(std::string(toString(FieldCategory::Charges)) == "charges");
  REQUIRE(std::string(toString(FieldDataType::Weight)) == "weight");
}
