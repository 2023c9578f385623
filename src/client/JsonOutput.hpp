#ifndef __HL_JSON_OUTPUT__
#define __HL_JSON_OUTPUT__

#include "nlohmann/json.hpp"

#include "ContentSource.hpp"
#include "HotlineObjects.hpp"
#include "ServerEvent.hpp"
#include "Transfer.hpp"

using json = nlohmann::json;

namespace hl {
// nlohmann::json picks these up by argument dependent lookup
void to_json(json& j, const FileEntry& entry);
void to_json(json& j, const UserEntry& user);
void to_json(json& j, const ContentNode& node);
void to_json(json& j, const Transfer& transfer);
void to_json(json& j, const ServerEvent& event);
void to_json(json& j, const HotlineError& error);
}  // namespace hl

#endif  // __HL_JSON_OUTPUT__
