#include "jsonutils.hpp"

#include "catch2/catch_all.hpp"
#include "rapidjson/document.h"

void REQUIRE_JSON(const std::string& current, const char* expected) {
    rapidjson::Document currentDoc, expectedDoc;

    CAPTURE(current);
    CAPTURE(expected);

    currentDoc.Parse(current.c_str());
    REQUIRE(!currentDoc.HasParseError());
    expectedDoc.Parse(expected);
    REQUIRE(!expectedDoc.HasParseError());

    REQUIRE(currentDoc == expectedDoc);
}
