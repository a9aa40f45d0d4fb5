#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "teledrop/common/fs.hpp"
#include "teledrop/common/json_util.hpp"
#include "teledrop/common/result.hpp"

#include <stdexcept>

void register_common_tests(std::vector<teledrop::tests::TestCase> &tests) {
  using teledrop::tests::require;
  namespace cm = teledrop::common;
  namespace tt = teledrop::testing;

  tests.push_back({"common_string_helpers", [] {
                     require(cm::trim("  hi \n") == "hi", "trim should strip both ends");
                     require(cm::trim(" \t ").empty(), "blank input trims to empty");
                     require(cm::starts_with("--files", "--"), "prefix should match");
                     require(!cm::starts_with("-", "--"), "longer prefix should not match");
                     require(cm::to_lower("HeLLo") == "hello", "to_lower mismatch");
                   }});

  tests.push_back({"common_expand_path_env_and_home", [] {
                     tt::EnvGuard home("HOME", std::string("/home/tester"));
                     tt::EnvGuard var("TELEDROP_TEST_DIR", std::string("artifacts"));
                     require(cm::expand_path("~/out") == "/home/tester/out", "tilde expansion");
                     require(cm::expand_path("/srv/${TELEDROP_TEST_DIR}/*.zip") ==
                                 "/srv/artifacts/*.zip",
                             "braced variable expansion");
                     require(cm::expand_path("$TELEDROP_TEST_DIR/x") == "artifacts/x",
                             "bare variable expansion");
                   }});

  tests.push_back({"common_result_value_throws_on_failure", [] {
                     auto failed =
                         cm::Result<int>::failure(cm::ErrorKind::Transport, "network down");
                     require(!failed.ok(), "failure should not be ok");
                     require(failed.kind() == cm::ErrorKind::Transport, "kind preserved");
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on a failure should throw");

                     const auto status = failed.status();
                     require(!status.ok() && status.error() == "network down",
                             "status should carry the error");
                     require(cm::error_kind_name(cm::ErrorKind::Session) == "session",
                             "kind name mismatch");
                   }});

  tests.push_back({"common_resolve_files_sorted_regular_files_only", [] {
                     tt::TempWorkspace ws;
                     ws.create_file("b.bin", "b");
                     ws.create_file("a.bin", "a");
                     ws.create_file("c.txt", "c");
                     std::filesystem::create_directories(ws.path() / "dir.bin");

                     auto files = cm::resolve_files((ws.path() / "*.bin").string());
                     require(files.ok(), files.error());
                     require(files.value().size() == 2, "directories must be skipped");
                     require(files.value()[0].filename() == "a.bin", "expected sorted order");
                     require(files.value()[1].filename() == "b.bin", "expected sorted order");
                   }});

  tests.push_back({"common_resolve_files_no_match_is_empty", [] {
                     tt::TempWorkspace ws;
                     auto files = cm::resolve_files((ws.path() / "*.none").string());
                     require(files.ok(), "no match is not an error");
                     require(files.value().empty(), "no match gives an empty list");

                     auto literal = cm::resolve_files((ws.path() / "missing.txt").string());
                     require(literal.ok() && literal.value().empty(),
                             "missing literal path gives an empty list");

                     auto blank = cm::resolve_files("   ");
                     require(!blank.ok() && blank.kind() == cm::ErrorKind::Configuration,
                             "blank pattern should be rejected");
                   }});

  tests.push_back({"common_read_text_file", [] {
                     tt::TempWorkspace ws;
                     const auto path = ws.create_file("note.txt", "line one\n");
                     auto content = cm::read_text_file(path);
                     require(content.ok() && content.value() == "line one\n", "content mismatch");
                     require(!cm::read_text_file(ws.path() / "absent").ok(),
                             "missing file should fail");
                   }});

  tests.push_back({"common_json_escape_round_trip", [] {
                     const std::string raw = "quote \" slash \\ tab\t bell\x07";
                     const std::string escaped = cm::json_escape(raw);
                     require(escaped.find("\\u0007") != std::string::npos,
                             "control characters should use \\u escapes");
                     require(cm::json_unescape(escaped) == raw, "unescape should restore input");
                   }});

  tests.push_back({"common_json_unescape_unicode", [] {
                     require(cm::json_unescape("caf\\u00e9") == "caf\xc3\xa9", "BMP escape");
                     require(cm::json_unescape("\\ud83d\\ude80") == "\xf0\x9f\x9a\x80",
                             "surrogate pair should decode to one code point");
                     require(cm::json_unescape("bad \\u12") == "bad u12",
                             "truncated escape is kept literally");
                   }});

  tests.push_back({"common_json_field_extraction", [] {
                     const std::string body =
                         R"({"ok":true,"result":{"id":987,"username":"drop_bot"},"n":-5})";
                     require(cm::json_get_bool(body, "ok") == std::optional<bool>(true),
                             "bool field");
                     const auto result = cm::json_get_object(body, "result");
                     require(cm::json_get_string(result, "username") == "drop_bot",
                             "nested string field");
                     require(cm::json_get_number(result, "id") == "987", "nested number field");
                     require(cm::json_get_number(body, "n") == "-5", "negative number");
                     require(cm::json_get_string(body, "ok").empty(),
                             "type mismatch yields empty string");
                     require(!cm::json_get_bool(body, "missing").has_value(), "absent bool");
                   }});

  tests.push_back({"common_json_parse_flat", [] {
                     auto parsed = cm::json_parse_flat(
                         R"({ "a": "x\ny", "b": 12, "c": null, "d": {"k": [1, 2]}, "e": false })");
                     require(parsed.has_value(), "valid object should parse");
                     const auto &map = *parsed;
                     require(map.at("a") == "x\ny", "string member unescaped");
                     require(map.at("b") == "12", "number kept raw");
                     require(!map.contains("c"), "null member omitted");
                     require(map.at("d") == R"({"k": [1, 2]})", "nested object kept raw");
                     require(map.at("e") == "false", "boolean kept raw");

                     require(!cm::json_parse_flat("[1,2]").has_value(), "array is not an object");
                     require(!cm::json_parse_flat(R"({"a": )").has_value(),
                             "truncated object rejected");
                     require(!cm::json_parse_flat(R"({a: 1})").has_value(),
                             "unquoted key rejected");
                   }});
}
