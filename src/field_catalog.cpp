#include "field_catalog.hpp"

#include <algorithm>
#include <unordered_map>

namespace invoicemap {

namespace {

std::vector<StandardField> buildCatalog() {
  return {
    {"invoice_number", "Invoice Number", FieldCategory::Basic, FieldDataType::String, true, ""},
    {"invoice_date", "Invoice Date", FieldCategory::Basic, FieldDataType::Date, true, R"(^\d{4}-\d{2}-\d{2}$)"},
    {"due_date", "Due Date", FieldCategory::Basic, FieldDataType::Date, false, R"(^\d{4}-\d{2}-\d{2}$)"},
    {"currency", "Currency", FieldCategory::Basic, FieldDataType::String, true, R"(^[A-Z]{3}$)"},
    {"forwarder_name", "Forwarder Name", FieldCategory::Basic, FieldDataType::String, true, ""},
    {"forwarder_account", "Forwarder Account", FieldCategory::Basic, FieldDataType::String, false, ""},
    {"service_type", "Service Type", FieldCategory::Basic, FieldDataType::String, false, ""},
    {"incoterm", "Incoterm", FieldCategory::Basic, FieldDataType::String, false, R"(^(EXW|FCA|CPT|CIP|DAP|DPU|DDP|FAS|FOB|CFR|CIF)$)"},
    {"customs_entry_number", "Customs Entry Number", FieldCategory::Basic, FieldDataType::String, false, ""},
    {"billing_period", "Billing Period", FieldCategory::Basic, FieldDataType::String, false, ""},
    {"document_type", "Document Type", FieldCategory::Basic, FieldDataType::String, false, ""},
    {"tax_id", "Tax ID", FieldCategory::Basic, FieldDataType::String, false, ""},
    {"statement_number", "Statement Number", FieldCategory::Basic, FieldDataType::String, false, ""},
    {"customer_code", "Customer Code", FieldCategory::Basic, FieldDataType::String, false, ""},
    {"shipper_name", "Shipper Name", FieldCategory::Shipper, FieldDataType::String, true, ""},
    {"shipper_address_line1", "Shipper Address Line 1", FieldCategory::Shipper, FieldDataType::Address, false, ""},
    {"shipper_address_line2", "Shipper Address Line 2", FieldCategory::Shipper, FieldDataType::Address, false, ""},
    {"shipper_city", "Shipper City", FieldCategory::Shipper, FieldDataType::String, false, ""},
    {"shipper_state", "Shipper State/Province", FieldCategory::Shipper, FieldDataType::String, false, ""},
    {"shipper_postal_code", "Shipper Postal Code", FieldCategory::Shipper, FieldDataType::String, false, ""},
    {"shipper_country", "Shipper Country", FieldCategory::Shipper, FieldDataType::String, true, ""},
    {"shipper_phone", "Shipper Phone", FieldCategory::Shipper, FieldDataType::Phone, false, ""},
    {"shipper_email", "Shipper Email", FieldCategory::Shipper, FieldDataType::Email, false, ""},
    {"shipper_contact", "Shipper Contact Person", FieldCategory::Shipper, FieldDataType::String, false, ""},
    {"shipper_reference", "Shipper Reference", FieldCategory::Shipper, FieldDataType::String, false, ""},
    {"shipper_tax_id", "Shipper Tax ID", FieldCategory::Shipper, FieldDataType::String, false, ""},
    {"consignee_name", "Consignee Name", FieldCategory::Consignee, FieldDataType::String, true, ""},
    {"consignee_address_line1", "Consignee Address Line 1", FieldCategory::Consignee, FieldDataType::Address, false, ""},
    {"consignee_address_line2", "Consignee Address Line 2", FieldCategory::Consignee, FieldDataType::Address, false, ""},
    {"consignee_city", "Consignee City", FieldCategory::Consignee, FieldDataType::String, false, ""},
    {"consignee_state", "Consignee State/Province", FieldCategory::Consignee, FieldDataType::String, false, ""},
    {"consignee_postal_code", "Consignee Postal Code", FieldCategory::Consignee, FieldDataType::String, false, ""},
    {"consignee_country", "Consignee Country", FieldCategory::Consignee, FieldDataType::String, true, ""},
    {"consignee_phone", "Consignee Phone", FieldCategory::Consignee, FieldDataType::Phone, false, ""},
    {"consignee_email", "Consignee Email", FieldCategory::Consignee, FieldDataType::Email, false, ""},
    {"consignee_contact", "Consignee Contact Person", FieldCategory::Consignee, FieldDataType::String, false, ""},
    {"consignee_reference", "Consignee Reference", FieldCategory::Consignee, FieldDataType::String, false, ""},
    {"consignee_tax_id", "Consignee Tax ID", FieldCategory::Consignee, FieldDataType::String, false, ""},
    {"tracking_number", "Tracking Number", FieldCategory::Shipping, FieldDataType::String, true, ""},
    {"master_tracking_number", "Master Tracking Number", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"house_tracking_number", "House Tracking Number", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"ship_date", "Ship Date", FieldCategory::Shipping, FieldDataType::Date, false, R"(^\d{4}-\d{2}-\d{2}$)"},
    {"delivery_date", "Delivery Date", FieldCategory::Shipping, FieldDataType::Date, false, R"(^\d{4}-\d{2}-\d{2}$)"},
    {"origin_code", "Origin Code", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"destination_code", "Destination Code", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"transport_mode", "Transport Mode", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"carrier_code", "Carrier Code", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"flight_number", "Flight Number", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"vessel_name", "Vessel Name", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"voyage_number", "Voyage Number", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"container_number", "Container Number", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"seal_number", "Seal Number", FieldCategory::Shipping, FieldDataType::String, false, ""},
    {"etd", "Estimated Time of Departure", FieldCategory::Shipping, FieldDataType::Date, false, ""},
    {"eta", "Estimated Time of Arrival", FieldCategory::Shipping, FieldDataType::Date, false, ""},
    {"total_pieces", "Total Pieces", FieldCategory::Package, FieldDataType::Number, false, ""},
    {"gross_weight", "Gross Weight", FieldCategory::Package, FieldDataType::Weight, true, ""},
    {"chargeable_weight", "Chargeable Weight", FieldCategory::Package, FieldDataType::Weight, false, ""},
    {"volume_weight", "Volume Weight", FieldCategory::Package, FieldDataType::Weight, false, ""},
    {"length", "Length", FieldCategory::Package, FieldDataType::Dimension, false, ""},
    {"width", "Width", FieldCategory::Package, FieldDataType::Dimension, false, ""},
    {"height", "Height", FieldCategory::Package, FieldDataType::Dimension, false, ""},
    {"commodity_description", "Commodity Description", FieldCategory::Package, FieldDataType::String, false, ""},
    {"freight_charge", "Freight Charge", FieldCategory::Charges, FieldDataType::Currency, true, ""},
    {"fuel_surcharge", "Fuel Surcharge", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"security_surcharge", "Security Surcharge", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"handling_fee", "Handling Fee", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"customs_duty", "Customs Duty", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"import_tax", "Import Tax", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"documentation_fee", "Documentation Fee", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"insurance", "Insurance", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"storage_fee", "Storage Fee", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"delivery_fee", "Delivery Fee", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"pickup_fee", "Pickup Fee", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"misc_charges", "Miscellaneous Charges", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"subtotal", "Subtotal", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"tax_amount", "Tax Amount", FieldCategory::Charges, FieldDataType::Currency, false, ""},
    {"total_amount", "Total Amount", FieldCategory::Charges, FieldDataType::Currency, true, ""},
    {"po_number", "Purchase Order Number", FieldCategory::Reference, FieldDataType::String, false, ""},
    {"so_number", "Sales Order Number", FieldCategory::Reference, FieldDataType::String, false, ""},
    {"booking_number", "Booking Number", FieldCategory::Reference, FieldDataType::String, false, ""},
    {"reference_1", "Reference 1", FieldCategory::Reference, FieldDataType::String, false, ""},
    {"reference_2", "Reference 2", FieldCategory::Reference, FieldDataType::String, false, ""},
    {"batch_number", "Batch Number", FieldCategory::Reference, FieldDataType::String, false, ""},
    {"job_number", "Job Number", FieldCategory::Reference, FieldDataType::String, false, ""},
    {"payment_terms", "Payment Terms", FieldCategory::Payment, FieldDataType::String, false, ""},
    {"bank_name", "Bank Name", FieldCategory::Payment, FieldDataType::String, false, ""},
    {"bank_account", "Bank Account Number", FieldCategory::Payment, FieldDataType::String, false, ""},
    {"swift_code", "SWIFT Code", FieldCategory::Payment, FieldDataType::String, false, R"(^[A-Z]{6}[A-Z0-9]{2}([A-Z0-9]{3})?$)"},
    {"remittance_info", "Remittance Information", FieldCategory::Payment, FieldDataType::String, false, ""},
    {"credit_note", "Credit Note Number", FieldCategory::Payment, FieldDataType::String, false, ""},
  };
}

} // namespace

const std::vector<StandardField>& standardFields() {
  static const std::vector<StandardField> catalog = buildCatalog();
  return catalog;
}

const StandardField* findField(const std::string& name) {
  const auto& catalog = standardFields();
  auto it = std::find_if(catalog.begin(), catalog.end(),
                         [&](const StandardField& f) { return f.name == name; });
  return it == catalog.end() ? nullptr : &*it;
}

std::vector<StandardField> fieldsByCategory(FieldCategory category) {
  std::vector<StandardField> out;
  for (const auto& f : standardFields()) {
    if (f.category == category) out.push_back(f);
  }
  return out;
}

const std::vector<std::string>& defaultCriticalFields() {
  static const std::vector<std::string> critical = {
    "invoice_number", "invoice_date", "total_amount",
    "currency", "shipper_name", "consignee_name",
  };
  return critical;
}

bool isCriticalField(const std::string& name, const std::vector<std::string>& criticalFields) {
  return std::find(criticalFields.begin(), criticalFields.end(), name) != criticalFields.end();
}

std::optional<std::string> pretrainedFieldFor(const std::string& fieldName) {
  static const std::unordered_map<std::string, std::string> table = {
    {"invoice_number", "InvoiceId"},
    {"invoice_date", "InvoiceDate"},
    {"due_date", "DueDate"},
    {"po_number", "PurchaseOrder"},
    {"subtotal", "SubTotal"},
    {"tax_amount", "TotalTax"},
    {"total_amount", "InvoiceTotal"},
    {"currency", "CurrencyCode"},
    {"shipper_name", "VendorName"},
    {"shipper_address_line1", "VendorAddress"},
    {"consignee_name", "CustomerName"},
    {"consignee_address_line1", "CustomerAddress"},
    {"tax_id", "VendorTaxId"},
    {"customer_code", "CustomerId"},
    {"payment_terms", "PaymentTerm"},
  };
  auto it = table.find(fieldName);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

const char* toString(FieldCategory category) {
  switch (category) {
    case FieldCategory::Basic: return "basic";
    case FieldCategory::Shipper: return "shipper";
    case FieldCategory::Consignee: return "consignee";
    case FieldCategory::Shipping: return "shipping";
    case FieldCategory::Package: return "package";
    case FieldCategory::Charges: return "charges";
    case FieldCategory::Reference: return "reference";
    case FieldCategory::Payment: return "payment";
  }
  return "unknown";
}

const char* toString(FieldDataType dataType) {
  switch (dataType) {
    case FieldDataType::String: return "string";
    case FieldDataType::Number: return "number";
    case FieldDataType::Date: return "date";
    case FieldDataType::Currency: return "currency";
    case FieldDataType::Address: return "address";
    case FieldDataType::Phone: return "phone";
    case FieldDataType::Email: return "email";
    case FieldDataType::Weight: return "weight";
    case FieldDataType::Dimension: return "dimension";
  }
  return "unknown";
}

} // namespace invoicemap
