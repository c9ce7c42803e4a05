#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "oac/common/error.hpp"
#include "oac/common/fs.hpp"
#include "oac/common/json_util.hpp"
#include "oac/common/toml.hpp"

#include <string>

void register_common_tests(std::vector<oac::tests::TestCase> &tests) {
  using oac::tests::require;
  namespace common = oac::common;

  tests.push_back({"common_error_prefixes_category", [] {
                     require(common::Error::request(404, "not found").to_string() ==
                                 "request failed: 404 not found",
                             "request error text mismatch");
                     require(common::Error::unsupported_grant("oops").to_string() ==
                                 "unsupported grant type: oops",
                             "unsupported grant text mismatch");
                     const auto network = common::Error::network("https://x", "timed out");
                     require(network.code == common::ErrorCode::Request, "network is request");
                     require(network.status == 0, "network error has no status");
                   }});

  tests.push_back({"common_result_value_on_failure_throws", [] {
                     auto failed = common::Result<int>::failure(common::Error::io("boom"));
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "accessing a failed value should throw");
                     require(failed.error().message == "boom", "error preserved");
                   }});

  tests.push_back({"common_trim_and_case", [] {
                     require(common::trim("  \n value \t") == "value", "trim failed");
                     require(common::trim("   ").empty(), "blank trims to empty");
                     require(common::to_upper("get") == "GET", "upper failed");
                     require(common::to_lower("PaRaMs") == "params", "lower failed");
                   }});

  tests.push_back({"common_read_file_reports_missing", [] {
                     oac::testing::TempWorkspace ws;
                     ws.create_file("body.json", "{\"x\":1}");
                     auto ok = common::read_file(ws.path() / "body.json");
                     require(ok.ok() && ok.value() == "{\"x\":1}", "read_file content mismatch");

                     auto missing = common::read_file(ws.path() / "nope.json");
                     require(!missing.ok(), "missing file should fail");
                     require(missing.error().code == common::ErrorCode::Io, "missing file is Io");

                     auto dir = common::read_file(ws.path());
                     require(!dir.ok(), "directory should fail");
                   }});

  tests.push_back({"json_parse_object_tags_kinds", [] {
                     auto parsed = common::json_parse_object(
                         R"({"s":"a\"b\u00e9","n":-12.5,"b":true,"z":null,"o":{"k":[1]},"a":[]})");
                     require(parsed.ok(), "parse should succeed");
                     const auto &obj = parsed.value();
                     require(obj.at("s").kind == common::JsonKind::String, "s kind");
                     require(obj.at("s").text == "a\"b\xC3\xA9", "s unescaped to utf-8");
                     require(obj.at("n").kind == common::JsonKind::Number, "n kind");
                     require(obj.at("n").text == "-12.5", "n raw text");
                     require(obj.at("b").kind == common::JsonKind::Bool, "b kind");
                     require(obj.at("z").kind == common::JsonKind::Null, "z kind");
                     require(obj.at("o").kind == common::JsonKind::Object, "o kind");
                     require(obj.at("o").text == R"({"k":[1]})", "o raw text");
                     require(obj.at("a").kind == common::JsonKind::Array, "a kind");
                   }});

  tests.push_back({"json_parse_object_surrogate_pair", [] {
                     auto parsed = common::json_parse_object(R"({"e":"\ud83d\ude00"})");
                     require(parsed.ok(), "parse should succeed");
                     require(parsed.value().at("e").text == "\xF0\x9F\x98\x80",
                             "surrogate pair should decode to one code point");
                   }});

  tests.push_back({"json_parse_object_rejects_malformed", [] {
                     require(!common::json_parse_object("").ok(), "empty input");
                     require(!common::json_parse_object("[1,2]").ok(), "array is not an object");
                     require(!common::json_parse_object(R"({"a":1,})").ok(), "trailing comma");
                     require(!common::json_parse_object(R"({"a":1} x)").ok(), "trailing data");
                     require(!common::json_parse_object(R"({"a":tru})").ok(), "bad literal");
                     const auto err = common::json_parse_object("{\"a\"");
                     require(!err.ok() && err.error().code == common::ErrorCode::Format,
                             "truncated input is a format error");
                   }});

  tests.push_back({"json_only_accepts_json_whitespace", [] {
                     require(common::json_parse_object(" \t\r\n{ \"a\" :\n1 }\n").ok(),
                             "space, tab, CR and LF are whitespace");
                     require(!common::json_parse_object("{\v}").ok(), "vertical tab rejected");
                     require(!common::json_parse_object("{\"a\":1}\f").ok(),
                             "form feed rejected");
                     require(!common::json_pretty_print("[1,\v2]").ok(),
                             "pretty print rejects vertical tab");
                     require(common::json_skip_ws("\f x", 0) == 0, "skip stops at form feed");
                   }});

  tests.push_back({"json_number_to_int64_bounds", [] {
                     require(common::json_number_to_int64("1700000000") == 1700000000,
                             "integer");
                     require(common::json_number_to_int64("9007199254740993") ==
                                 9007199254740993LL,
                             "exact above 2^53");
                     require(common::json_number_to_int64("12.9") == 12, "fraction truncates");
                     require(!common::json_number_to_int64("1e30").has_value(), "overflow");
                     require(!common::json_number_to_int64("abc").has_value(), "not a number");
                   }});

  tests.push_back({"json_pretty_print_layout", [] {
                     auto pretty = common::json_pretty_print(R"({"b":1,"a":[true,null],"c":{}})");
                     require(pretty.ok(), "pretty print should succeed");
                     const std::string expected = "{\n"
                                                  "  \"b\": 1,\n"
                                                  "  \"a\": [\n"
                                                  "    true,\n"
                                                  "    null\n"
                                                  "  ],\n"
                                                  "  \"c\": {}\n"
                                                  "}";
                     require(pretty.value() == expected, "unexpected layout: " + pretty.value());
                   }});

  tests.push_back({"json_pretty_print_preserves_scalars", [] {
                     auto pretty = common::json_pretty_print(R"(["x\ny", 1.50, -0, []])");
                     require(pretty.ok(), "pretty print should succeed");
                     require(pretty.value().find("\"x\\ny\"") != std::string::npos,
                             "string escapes kept verbatim");
                     require(pretty.value().find("1.50") != std::string::npos,
                             "number spelling kept");
                     require(pretty.value().find("[]") != std::string::npos, "empty array");
                   }});

  tests.push_back({"json_pretty_print_rejects_invalid", [] {
                     require(!common::json_pretty_print("").ok(), "empty input");
                     require(!common::json_pretty_print("{").ok(), "unterminated");
                     require(!common::json_pretty_print("{} {}").ok(), "two documents");
                     require(!common::json_pretty_print("[01]").ok(), "leading zero");
                     std::string deep(600, '[');
                     deep += std::string(600, ']');
                     require(!common::json_pretty_print(deep).ok(), "nesting bound");
                   }});

  tests.push_back({"json_escape_control_characters", [] {
                     require(common::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n", "escapes");
                     require(common::json_escape(std::string(1, '\x01')) == "\\u0001",
                             "control char");
                   }});

  tests.push_back({"toml_sections_and_values", [] {
                     const std::string content = "# comment\n"
                                                 "[auth]\n"
                                                 "client_id = \"abc\" # trailing\n"
                                                 "scope = 'raw\\value'\n"
                                                 "[http]\n"
                                                 "timeout_ms = 1500\n";
                     auto doc = common::parse_toml(content);
                     require(doc.ok(), "toml should parse");
                     require(doc.value().get_string("auth.client_id") == "abc", "client_id");
                     require(doc.value().get_string("auth.scope") == "raw\\value",
                             "literal string");
                     require(doc.value().get_u64("http.timeout_ms", 0) == 1500, "timeout");
                     require(doc.value().get_u64("http.missing", 7) == 7, "fallback");
                     require(!doc.value().has("auth.missing"), "has");
                   }});

  tests.push_back({"toml_rejects_garbage_line", [] {
                     auto doc = common::parse_toml("[auth]\nnot a pair\n");
                     require(!doc.ok(), "garbage should fail");
                     require(doc.error().code == common::ErrorCode::Config, "config error");
                   }});
}
