// test_node_update.cpp - Tests for merging edited fields back into a document
// Module 5: parse_edited_fields / merge_leaf_fields / update_json_by_path

#include <catch2/catch_all.hpp>
#include <json_edit/node_rows.h>
#include <json_edit/node_update.h>
#include <json_edit/path_core.h>
#include <json_edit/serialization.h>

using namespace json_edit;

namespace {

const std::string kDocument = R"({
  "customer": [
    {
      "id": 1,
      "name": "Ada",
      "address": {"city": "London", "zip": "N1"},
      "tags": ["vip", "early"]
    }
  ],
  "total": 9.5
})";

Value parse(const std::string& text) {
    auto parsed = from_json(text);
    REQUIRE(parsed.has_value());
    return *parsed;
}

/// Text the user sees for the node at @p path
std::string editable_text(const std::string& document, const Path& path) {
    return normalize_node_rows(node_rows_from_value(get_at_path(parse(document), path)));
}

} // namespace

// ============================================================
// parse_edited_fields Tests
// ============================================================

TEST_CASE("parse_edited_fields", "[update][parse]") {
    SECTION("valid JSON is decoded") {
        REQUIRE(parse_edited_fields(R"({"a": 1})") == Value::map({{"a", 1}}));
        REQUIRE(parse_edited_fields("42") == Value{42});
        REQUIRE(parse_edited_fields("null").is_null());
    }

    SECTION("anything else becomes the raw string") {
        REQUIRE(parse_edited_fields("Ada Lovelace") == Value{"Ada Lovelace"});
        REQUIRE(parse_edited_fields(R"({"a": 1,})") == Value{R"({"a": 1,})"});
        REQUIRE(parse_edited_fields("") == Value{""});
    }
}

// ============================================================
// merge_leaf_fields Tests
// ============================================================

TEST_CASE("merge_leaf_fields overwrites scalars only", "[update][merge]") {
    auto existing = Value::map({
        {"id", 1},
        {"address", Value::map({{"city", "London"}})},
        {"tags", Value::vector({"vip"})},
    });

    SECTION("scalars overwrite, containers survive") {
        auto merged = merge_leaf_fields(existing, Value::map({{"id", 2}}));
        REQUIRE(merged.at("id").as_int64() == 2);
        REQUIRE(merged.at("address") == existing.at("address"));
        REQUIRE(merged.at("tags") == existing.at("tags"));
    }

    SECTION("container values in the edit are ignored") {
        auto merged = merge_leaf_fields(existing, Value::map({
            {"address", Value::map({{"city", "Paris"}})},
            {"tags", Value::vector({})},
        }));
        REQUIRE(merged == existing);
    }

    SECTION("null is a scalar") {
        auto merged = merge_leaf_fields(existing, Value::map({{"id", Value{}}}));
        REQUIRE(merged.at("id").is_null());
    }

    SECTION("a scalar may replace a container") {
        auto merged = merge_leaf_fields(existing, Value::map({{"address", "unknown"}}));
        REQUIRE(merged.at("address").as_string() == "unknown");
    }

    SECTION("new keys are appended") {
        auto merged = merge_leaf_fields(existing, Value::map({{"email", "ada@example.com"}}));
        REQUIRE(to_json(merged, true) ==
                R"({"id":1,"address":{"city":"London"},"tags":["vip"],"email":"ada@example.com"})");
    }

    SECTION("non-map arguments leave the existing value") {
        REQUIRE(merge_leaf_fields(Value{1}, Value::map({{"a", 1}})) == Value{1});
        REQUIRE(merge_leaf_fields(existing, Value{"text"}) == existing);
    }
}

// ============================================================
// update_json_by_path Tests
// ============================================================

TEST_CASE("update_json_by_path preserves untouched nested fields", "[update][merge]") {
    Path path{"customer", std::size_t{0}};
    auto updated = parse(update_json_by_path(kDocument, path, Value::map({{"id", 2}, {"name", "Ada L."}})));

    auto customer = get_at_path(updated, path);
    REQUIRE(customer.at("id").as_int64() == 2);
    REQUIRE(customer.at("name").as_string() == "Ada L.");
    REQUIRE(customer.at("address") == Value::map({{"city", "London"}, {"zip", "N1"}}));
    REQUIRE(customer.at("tags") == Value::vector({"vip", "early"}));
    REQUIRE(updated.at("total").as_double() == 9.5);
}

TEST_CASE("update_json_by_path with an empty path replaces the document", "[update][replace]") {
    auto result = update_json_by_path(R"({"a": 1, "nested": {"x": 1}})", Path{}, Value::map({{"b", 2}}));
    REQUIRE(parse(result) == Value::map({{"b", 2}}));
    REQUIRE(result == "{\n  \"b\": 2\n}");
}

TEST_CASE("update_json_by_path creates missing intermediates", "[update][vivify]") {
    SECTION("objects") {
        auto result = update_json_by_path("{}", Path{"p", "q"}, Value::map({{"v", 1}}));
        REQUIRE(parse(result) == Value::map({{"p", Value::map({{"q", Value::map({{"v", 1}})}})}}));
    }

    SECTION("arrays when the next selector is an index") {
        auto result = update_json_by_path("{}", Path{"list", std::size_t{1}}, Value{"second"});
        REQUIRE(parse(result) == Value::map({{"list", Value::vector({Value{}, "second"})}}));
    }
}

TEST_CASE("update_json_by_path replaces non-object slots wholesale", "[update][replace]") {
    SECTION("scalar slot") {
        auto result = update_json_by_path(kDocument, Path{"total"}, Value{12});
        REQUIRE(parse(result).at("total").as_int64() == 12);
    }

    SECTION("array slot") {
        Path path{"customer", std::size_t{0}, "tags"};
        auto result = update_json_by_path(kDocument, path, Value::map({{"k", "v"}}));
        REQUIRE(get_at_path(parse(result), path) == Value::map({{"k", "v"}}));
    }

    SECTION("absent slot") {
        Path path{"customer", std::size_t{0}, "email"};
        auto result = update_json_by_path(kDocument, path, Value{"ada@example.com"});
        REQUIRE(get_at_path(parse(result), path).as_string() == "ada@example.com");
    }

    SECTION("raw string edit at an object slot") {
        Path path{"customer", std::size_t{0}, "address"};
        auto result = update_json_by_path(kDocument, path, parse_edited_fields("not { json"));
        REQUIRE(get_at_path(parse(result), path) == Value{"not { json"});
    }
}

TEST_CASE("update_json_by_path output is 2-space indented", "[update][format]") {
    auto result = update_json_by_path(R"({"a":{"b":1,"c":[1]}})", Path{"a"}, Value::map({{"b", 2}}));
    const std::string expected =
        "{\n"
        "  \"a\": {\n"
        "    \"b\": 2,\n"
        "    \"c\": [\n"
        "      1\n"
        "    ]\n"
        "  }\n"
        "}";
    REQUIRE(result == expected);
}

TEST_CASE("update_json_by_path returns malformed documents unchanged", "[update][error]") {
    const std::string broken = R"({"a": 1,)";

    REQUIRE_NOTHROW((void)update_json_by_path(broken, Path{"a"}, Value::map({{"b", 2}})));
    REQUIRE(update_json_by_path(broken, Path{"a"}, Value::map({{"b", 2}})) == broken);
    REQUIRE(update_json_by_path(broken, Path{}, Value::map({{"b", 2}})) == broken);
    REQUIRE(update_json_by_path("", Path{"a"}, Value{1}) == "");

    auto checked = update_json_by_path_checked(broken, Path{"a"}, Value{1});
    REQUIRE(checked.status == UpdateStatus::DocumentParseError);
    REQUIRE_FALSE(checked.updated());
    REQUIRE_FALSE(checked.error.empty());
    REQUIRE(checked.text == broken);
}

TEST_CASE("update_json_by_path treats documents nested past the depth limit as malformed", "[update][error]") {
    const std::size_t arrays = JSON_EDIT_MAX_DEPTH;
    const std::string deep = R"({"a": )" + std::string(arrays, '[') + std::string(arrays, ']') + "}";

    auto checked = update_json_by_path_checked(deep, Path{"b"}, Value{1});
    REQUIRE(checked.status == UpdateStatus::DocumentParseError);
    REQUIRE(checked.text == deep);

    const std::string at_limit = R"({"a": )" + std::string(arrays - 1, '[') + std::string(arrays - 1, ']') + "}";
    REQUIRE(update_json_by_path_checked(at_limit, Path{"b"}, Value{1}).updated());
}

TEST_CASE("update_json_by_path returns the input on structural path errors", "[update][error]") {
    SECTION("scalar intermediate") {
        auto checked = update_json_by_path_checked(kDocument, Path{"total", "x"}, Value{1});
        REQUIRE(checked.status == UpdateStatus::PathError);
        REQUIRE(checked.path_error == PathError::NotAContainer);
        REQUIRE(checked.text == kDocument);
    }

    SECTION("key applied to an array") {
        auto checked = update_json_by_path_checked(kDocument, Path{"customer", "id"}, Value{1});
        REQUIRE(checked.status == UpdateStatus::PathError);
        REQUIRE(checked.path_error == PathError::KeyOnArray);
        REQUIRE(update_json_by_path(kDocument, Path{"customer", "id"}, Value{1}) == kDocument);
    }

    SECTION("index too far past the end of an array") {
        const Path path{"a", std::size_t{4000000000}};
        auto checked = update_json_by_path_checked("{}", path, Value{1});
        REQUIRE(checked.status == UpdateStatus::PathError);
        REQUIRE(checked.path_error == PathError::IndexTooLarge);
        REQUIRE(checked.text == "{}");
        REQUIRE(update_json_by_path(kDocument, Path{"customer", std::size_t{4000000000}}, Value{1}) == kDocument);
    }
}

TEST_CASE("update_json_by_path_checked reports success", "[update]") {
    auto checked = update_json_by_path_checked("{}", Path{"a"}, Value{1});
    REQUIRE(checked.updated());
    REQUIRE(checked.path_error == PathError::None);
    REQUIRE(checked.error.empty());
    REQUIRE(checked.text == "{\n  \"a\": 1\n}");
}

// ============================================================
// Edit cycle round trip
// ============================================================

TEST_CASE("saving the unedited text of an object node changes nothing", "[update][roundtrip]") {
    Path path{"customer", std::size_t{0}};
    const auto text = editable_text(kDocument, path);

    auto once = update_json_by_path(kDocument, path, parse_edited_fields(text));
    REQUIRE(parse(once) == parse(kDocument));

    auto twice = update_json_by_path(once, path, parse_edited_fields(editable_text(once, path)));
    REQUIRE(parse(twice) == parse(once));
    REQUIRE(twice == once);
}

TEST_CASE("saving the unedited text of a scalar node changes nothing", "[update][roundtrip]") {
    SECTION("string leaf") {
        Path path{"customer", std::size_t{0}, "name"};
        const auto text = editable_text(kDocument, path);
        REQUIRE(text == "Ada");
        REQUIRE(parse(update_json_by_path(kDocument, path, parse_edited_fields(text))) == parse(kDocument));
    }

    SECTION("number leaf") {
        Path path{"total"};
        const auto text = editable_text(kDocument, path);
        REQUIRE(text == "9.5");
        REQUIRE(parse(update_json_by_path(kDocument, path, parse_edited_fields(text))) == parse(kDocument));
    }
}

TEST_CASE("a string leaf that looks like JSON is re-read as JSON", "[update][roundtrip]") {
    const std::string document = R"({"code": "42"})";
    const auto text = editable_text(document, Path{"code"});
    REQUIRE(text == "42");

    auto result = parse(update_json_by_path(document, Path{"code"}, parse_edited_fields(text)));
    REQUIRE(result.at("code").is<int64_t>());
}
