#pragma once

#include "header_map.h"
#include "sddp_message.h"
#include <nlohmann/json.hpp>

namespace c4::sddp::protocol {

// JSON views of protocol records for CLI/API output.

nlohmann::json toJson(const HeaderValue& value);

/// {"Name": value, ...}
nlohmann::json toJson(const HeaderMap& headers);

/// Statement fields, headers, and receive metadata when present.
nlohmann::json toJson(const SddpMessage& message);

} // namespace c4::sddp::protocol
