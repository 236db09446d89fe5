#ifndef SENDKEY_SERVER_WIRE_JSON_H
#define SENDKEY_SERVER_WIRE_JSON_H

#include <string>
#include <vector>

#include "entry_service.h"
#include "records.h"
#include "token_manager.h"

namespace sendkey::server {

// Response bodies for a transport layer. The nonce and the sealed value of
// an entry are never rendered.
std::string RenderEntry(const Entry& entry);
std::string RenderCreateEntryResult(const CreateEntryResult& result);
std::string RenderDecryptEntryResult(const DecryptEntryResult& result);
std::string RenderToken(const Token& token);
std::string RenderErrors(const std::vector<std::string>& errors);

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_WIRE_JSON_H
