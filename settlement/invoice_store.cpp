#include "invoice_store.hpp"

namespace settlement {
namespace posting {

std::string invoiceStatusToString(InvoiceStatus status) {
  switch (status) {
    case InvoiceStatus::DRAFT: return "DRAFT";
    case InvoiceStatus::OPEN: return "OPEN";
    case InvoiceStatus::PAID: return "PAID";
    case InvoiceStatus::EXPIRED: return "EXPIRED";
    case InvoiceStatus::CANCELED: return "CANCELED";
    default: return "UNKNOWN";
  }
}

std::optional<InvoiceStatus> parseInvoiceStatus(const std::string& name) {
  if (name == "DRAFT") return InvoiceStatus::DRAFT;
  if (name == "OPEN") return InvoiceStatus::OPEN;
  if (name == "PAID") return InvoiceStatus::PAID;
  if (name == "EXPIRED") return InvoiceStatus::EXPIRED;
  if (name == "CANCELED") return InvoiceStatus::CANCELED;
  return std::nullopt;
}

bool isTerminalStatus(InvoiceStatus status) {
  return status == InvoiceStatus::PAID || status == InvoiceStatus::EXPIRED ||
         status == InvoiceStatus::CANCELED;
}

std::string entryTypeToString(EntryType type) {
  return type == EntryType::DEBIT ? "DEBIT" : "CREDIT";
}

}  // namespace posting
}  // namespace settlement
