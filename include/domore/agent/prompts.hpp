#pragma once

#include <string>

namespace domore::agent {

// Base instructions telling the agent how to request files and how to
// issue Create/Modify/Delete commands
const std::string& file_operations_instructions();

}  // namespace domore::agent
