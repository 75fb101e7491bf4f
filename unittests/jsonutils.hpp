#pragma once

#include <string>

// compares parsed documents, formatting and key order are ignored
void REQUIRE_JSON(const std::string& current, const char* expected);
