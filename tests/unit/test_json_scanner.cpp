#include <catch2/catch.hpp>
#include "domore/core/json_scanner.hpp"

#include <chrono>

using namespace domore::core;

TEST_CASE("Scanner finds objects in prose", "[json_scanner]") {
    std::string text = R"(First {"a": 1} then {"b": {"c": 2}} done.)";

    auto found = find_json_objects(text);
    REQUIRE(found.size() == 2);

    REQUIRE(found[0].value["a"] == 1);
    REQUIRE(found[0].offset == text.find("{\"a\""));
    REQUIRE(found[0].text == R"({"a": 1})");

    // Nested object is consumed with its parent
    REQUIRE(found[1].value["b"]["c"] == 2);
    REQUIRE(found[1].length == std::string(R"({"b": {"c": 2}})").size());
    REQUIRE_FALSE(found[1].fenced);
}

TEST_CASE("Scanner skips incidental braces", "[json_scanner]") {
    std::string text = R"(Use {braces} freely. {"command": "Delete", "fileName": "x"})";

    auto found = find_json_objects(text);
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].value["command"] == "Delete");
}

TEST_CASE("Scanner respects string literals", "[json_scanner]") {
    std::string text = R"({"content": "function f() { return \"}\"; }"} tail)";

    auto found = find_json_objects(text);
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].value["content"] == "function f() { return \"}\"; }");
}

TEST_CASE("Scanner records fence labels", "[json_scanner]") {
    std::string text = "Plan:\n```JSON\n{\"a\": 1}\n```\nand\n```js\nconst o = {\"b\": 2};\n```\n";

    auto found = find_json_objects(text);
    REQUIRE(found.size() == 2);
    REQUIRE(found[0].fenced);
    REQUIRE(found[0].fence_label == "json");
    REQUIRE(found[1].fenced);
    REQUIRE(found[1].fence_label == "js");
}

TEST_CASE("Scanner treats fence boundaries as imbalance", "[json_scanner]") {
    std::string text = "{ \"open\": 1\n```json\n{\"b\": 2}\n```\n";

    auto found = find_json_objects(text);
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].value["b"] == 2);
    REQUIRE(found[0].fenced);
}

TEST_CASE("Scanner retries inside unparseable spans", "[json_scanner]") {
    auto found = find_json_objects(R"(x {not json {"x": 1} } y)");
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].value["x"] == 1);
}

TEST_CASE("Scanner ignores unterminated and non-object input", "[json_scanner]") {
    REQUIRE(find_json_objects(R"({"a": 1)").empty());
    REQUIRE(find_json_objects("[1, 2, 3]").empty());
    REQUIRE(find_json_objects("").empty());
    REQUIRE(find_json_objects("no braces at all").empty());
}

TEST_CASE("Scanner handles fences on the brace line", "[json_scanner]") {
    std::string text =
        "```json {\"a\": 1} ```\n"
        "```json\n{\"b\": 2}```\n"
        "then {\"c\": 3}";

    auto found = find_json_objects(text);
    REQUIRE(found.size() == 3);
    REQUIRE(found[0].fence_label == "json");
    REQUIRE(found[1].value["b"] == 2);
    REQUIRE(found[1].fenced);
    REQUIRE(found[2].value["c"] == 3);
    REQUIRE_FALSE(found[2].fenced);
}

TEST_CASE("Scanner keeps fence markers inside strings", "[json_scanner]") {
    std::string text = R"({"content": "```js\nlet x = 1;\n```"} and {"d": 4})";

    auto found = find_json_objects(text);
    REQUIRE(found.size() == 2);
    REQUIRE(found[0].value["content"] == "```js\nlet x = 1;\n```");
    REQUIRE(found[1].value["d"] == 4);
}

TEST_CASE("Scanner stays linear with many stray braces", "[json_scanner]") {
    std::string text;
    for (int i = 0; i < 20000; ++i) {
        text += "use { here ";
    }
    text += R"({"command": "Delete", "fileName": "a.txt"})";

    auto started = std::chrono::steady_clock::now();
    auto found = find_json_objects(text);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(found.size() == 1);
    REQUIRE(found[0].value["fileName"] == "a.txt");
    REQUIRE(elapsed < std::chrono::seconds(2));
}
