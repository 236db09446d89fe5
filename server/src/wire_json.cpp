#include "wire_json.h"

#include <sstream>

#include "json_util.h"

namespace sendkey::server {

namespace {

void WriteErrors(std::ostream& os, const std::vector<std::string>& errors) {
  os << "\"errors\":[";
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i != 0) {
      os << ',';
    }
    WriteJsonEscaped(os, errors[i]);
  }
  os << ']';
}

void WriteEntry(std::ostream& os, const Entry& entry) {
  os << "{\"id\":";
  WriteJsonEscaped(os, entry.id.ToString());
  os << ",\"name\":";
  WriteJsonEscaped(os, entry.name);
  os << ",\"sentByUserId\":";
  WriteJsonEscaped(os, entry.sent_by_user_id.ToString());
  os << ",\"sentToEmail\":";
  WriteJsonEscaped(os, entry.sent_to_email);
  os << ",\"invalidAttempts\":" << entry.invalid_attempts;
  os << ",\"createdAtUtc\":";
  WriteJsonEscaped(os, FormatRfc3339(entry.created_at));
  os << ",\"expiresAtUtc\":";
  WriteJsonEscaped(os, FormatRfc3339(entry.expires_at));
  os << '}';
}

}  // namespace

std::string RenderEntry(const Entry& entry) {
  std::ostringstream os;
  WriteEntry(os, entry);
  return os.str();
}

std::string RenderCreateEntryResult(const CreateEntryResult& result) {
  std::ostringstream os;
  os << "{\"success\":" << (result.success ? "true" : "false") << ',';
  WriteErrors(os, result.errors);
  os << ",\"entry\":";
  if (result.success && result.entry) {
    WriteEntry(os, *result.entry);
  } else {
    os << "null";
  }
  os << '}';
  return os.str();
}

std::string RenderDecryptEntryResult(const DecryptEntryResult& result) {
  std::ostringstream os;
  os << "{\"success\":" << (result.success ? "true" : "false") << ',';
  WriteErrors(os, result.errors);
  os << ",\"expired\":" << (result.expired ? "true" : "false");
  os << ",\"value\":";
  if (result.success && result.value) {
    WriteJsonEscaped(os, *result.value);
  } else {
    os << "null";
  }
  os << '}';
  return os.str();
}

std::string RenderToken(const Token& token) {
  std::ostringstream os;
  os << "{\"token\":";
  WriteJsonEscaped(os, token.token);
  os << ",\"expires\":" << token.expires << '}';
  return os.str();
}

std::string RenderErrors(const std::vector<std::string>& errors) {
  std::ostringstream os;
  os << "{\"success\":false,";
  WriteErrors(os, errors);
  os << '}';
  return os.str();
}

}  // namespace sendkey::server
