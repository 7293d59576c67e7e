// id_generator.h - Random identifiers for persisted records
#pragma once

#include <string>

namespace coderoom::server::core {

// UUID v4 string (8-4-4-4-12 lowercase hex)
std::string GenerateUUID();

} // namespace coderoom::server::core
