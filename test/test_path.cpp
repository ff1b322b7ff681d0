// test_path.cpp - Tests for path formatting, traversal and auto-vivifying updates
// Module 3: Path / path_core

#include <catch2/catch_all.hpp>
#include <json_edit/path.h>
#include <json_edit/path_core.h>
#include <json_edit/serialization.h>

using namespace json_edit;

namespace {

Value sample_document() {
    return Value::map({
        {"customer", Value::vector({
            Value::map({{"id", 1}, {"name", "Ada"}}),
            Value::map({{"id", 2}, {"name", "Grace"}}),
        })},
        {"count", 2},
        {"3", "numeric key"},
        {"nothing", Value{}},
    });
}

Value replace_with(const Value& v) {
    return v;
}

} // namespace

// ============================================================
// Formatting Tests
// ============================================================

TEST_CASE("path_to_json_path", "[path][format]") {
    SECTION("empty path is the root") {
        REQUIRE(path_to_json_path(Path{}) == "$");
    }

    SECTION("keys are quoted and indices are bare") {
        REQUIRE(path_to_json_path(Path{"customer", std::size_t{0}, "id"}) == R"($["customer"][0]["id"])");
        REQUIRE(path_to_json_path(Path{"a", std::size_t{0}, "b"}) == R"($["a"][0]["b"])");
        REQUIRE(path_to_json_path(Path{std::size_t{12}}) == "$[12]");
    }

    SECTION("keys are not escaped") {
        REQUIRE(path_to_json_path(Path{"with \"quote\""}) == R"($["with "quote""])");
        REQUIRE(path_to_json_path(Path{""}) == R"($[""])");
    }
}

TEST_CASE("path_to_string", "[path][format]") {
    REQUIRE(path_to_string(Path{}) == "/");
    REQUIRE(path_to_string(Path{"customer", std::size_t{0}, "id"}) == ".customer[0].id");
}

// ============================================================
// Lookup Tests
// ============================================================

TEST_CASE("find_at_path and get_at_path", "[path][lookup]") {
    auto doc = sample_document();

    SECTION("existing nodes") {
        REQUIRE(get_at_path(doc, Path{"customer", std::size_t{1}, "name"}).as_string() == "Grace");
        REQUIRE(get_at_path(doc, Path{}) == doc);
        REQUIRE(find_at_path(doc, Path{"nothing"}) != nullptr);
    }

    SECTION("an index on an object addresses the decimal key") {
        REQUIRE(get_at_path(doc, Path{std::size_t{3}}).as_string() == "numeric key");
    }

    SECTION("missing nodes") {
        REQUIRE(find_at_path(doc, Path{"missing"}) == nullptr);
        REQUIRE(find_at_path(doc, Path{"customer", std::size_t{5}}) == nullptr);
        REQUIRE(find_at_path(doc, Path{"customer", "id"}) == nullptr);
        REQUIRE(find_at_path(doc, Path{"count", "deeper"}) == nullptr);
        REQUIRE(get_at_path(doc, Path{"missing", "x"}).is_null());
    }
}

// ============================================================
// resolve_parent Tests
// ============================================================

TEST_CASE("resolve_parent returns the container above the target", "[path][resolve]") {
    auto doc = sample_document();

    SECTION("existing parent") {
        auto resolved = resolve_parent(doc, Path{"customer", std::size_t{0}, "name"});
        REQUIRE(resolved.ok());
        REQUIRE(resolved.parent == Value::map({{"id", 1}, {"name", "Ada"}}));
        REQUIRE(std::get<std::string>(resolved.last) == "name");
        REQUIRE(resolved.failed_at == 2);
    }

    SECTION("missing intermediates are synthesized by the kind of the next selector") {
        auto resolved = resolve_parent(Value{ValueMap{}}, Path{"a", std::size_t{0}, "b"});
        REQUIRE(resolved.ok());
        REQUIRE(resolved.parent.is_map());
        REQUIRE(resolved.parent.size() == 0);

        auto to_vector = resolve_parent(Value{ValueMap{}}, Path{"a", std::size_t{3}});
        REQUIRE(to_vector.ok());
        REQUIRE(to_vector.parent.is_vector());
        REQUIRE(std::get<std::size_t>(to_vector.last) == 3);
    }

    SECTION("the final selector is not looked up") {
        auto resolved = resolve_parent(doc, Path{"brand_new"});
        REQUIRE(resolved.ok());
        REQUIRE(resolved.parent == doc);
    }

    SECTION("structural errors") {
        REQUIRE(resolve_parent(doc, Path{}).error == PathError::EmptyPath);
        REQUIRE(resolve_parent(doc, Path{"count", "x"}).error == PathError::NotAContainer);
        REQUIRE(resolve_parent(doc, Path{"nothing", "x"}).error == PathError::NotAContainer);
        REQUIRE(resolve_parent(doc, Path{"customer", "x"}).error == PathError::KeyOnArray);

        auto deep = resolve_parent(doc, Path{"count", "x", "y"});
        REQUIRE(deep.error == PathError::NotAContainer);
        REQUIRE(deep.failed_at == 1);
    }
}

// ============================================================
// update_at_path_vivify Tests
// ============================================================

TEST_CASE("update_at_path_vivify creates missing structure", "[path][vivify]") {
    SECTION("objects for key selectors") {
        auto update = set_at_path_vivify(Value{ValueMap{}}, Path{"p", "q"}, Value::map({{"v", 1}}));
        REQUIRE(update.ok());
        REQUIRE(update.root == Value::map({{"p", Value::map({{"q", Value::map({{"v", 1}})}})}}));
    }

    SECTION("arrays for index selectors, padded with null") {
        auto update = set_at_path_vivify(Value{ValueMap{}}, Path{"items", std::size_t{2}, "name"}, Value{"x"});
        REQUIRE(update.ok());
        REQUIRE(to_json(update.root, true) == R"({"items":[null,null,{"name":"x"}]})");
    }

    SECTION("existing arrays grow to reach the index") {
        auto doc = Value::map({{"list", Value::vector({1})}});
        auto update = set_at_path_vivify(doc, Path{"list", std::size_t{3}}, Value{4});
        REQUIRE(update.ok());
        REQUIRE(update.root.at("list") == Value::vector({1, Value{}, Value{}, 4}));
    }

    SECTION("index selector on an object writes the decimal key") {
        auto update = set_at_path_vivify(Value{ValueMap{}}, Path{std::size_t{3}}, Value{true});
        REQUIRE(update.ok());
        REQUIRE(update.root.at("3").as_bool());
    }
}

TEST_CASE("update_at_path_vivify passes the current slot to the updater", "[path][vivify]") {
    auto doc = sample_document();

    SECTION("present slot") {
        const Value* seen = nullptr;
        Value seen_copy;
        auto update = update_at_path_vivify(doc, Path{"customer", std::size_t{0}, "id"},
            [&](const Value* slot) {
                seen = slot;
                if (slot) seen_copy = *slot;
                return Value{slot->as_int64() + 100};
            });
        REQUIRE(update.ok());
        REQUIRE(seen != nullptr);
        REQUIRE(seen_copy.as_int64() == 1);
        REQUIRE(get_at_path(update.root, Path{"customer", std::size_t{0}, "id"}).as_int64() == 101);
    }

    SECTION("absent slot") {
        bool called_with_null = false;
        auto update = update_at_path_vivify(doc, Path{"customer", std::size_t{0}, "email"},
            [&](const Value* slot) {
                called_with_null = (slot == nullptr);
                return Value{"ada@example.com"};
            });
        REQUIRE(update.ok());
        REQUIRE(called_with_null);
    }

    SECTION("empty path updates the root") {
        auto update = update_at_path_vivify(doc, Path{}, [](const Value* slot) {
            return Value{slot->size()};
        });
        REQUIRE(update.ok());
        REQUIRE(update.root.as_int64() == 4);
    }
}

TEST_CASE("update_at_path_vivify leaves siblings and the input untouched", "[path][vivify]") {
    auto doc = sample_document();
    auto update = set_at_path_vivify(doc, Path{"customer", std::size_t{1}, "name"}, Value{"Hopper"});
    REQUIRE(update.ok());

    REQUIRE(get_at_path(update.root, Path{"customer", std::size_t{0}}) ==
            get_at_path(doc, Path{"customer", std::size_t{0}}));
    REQUIRE(update.root.at("count").as_int64() == 2);
    REQUIRE(get_at_path(doc, Path{"customer", std::size_t{1}, "name"}).as_string() == "Grace");
}

TEST_CASE("update_at_path_vivify reports structural errors", "[path][vivify][error]") {
    auto doc = sample_document();
    bool called = false;
    auto updater = [&](const Value* slot) {
        called = true;
        return slot ? replace_with(*slot) : Value{};
    };

    SECTION("scalar intermediate") {
        auto update = update_at_path_vivify(doc, Path{"count", "x", "y"}, updater);
        REQUIRE(update.error == PathError::NotAContainer);
        REQUIRE(update.failed_at == 1);
        REQUIRE(update.root == doc);
    }

    SECTION("null parent") {
        auto update = update_at_path_vivify(doc, Path{"nothing", "x"}, updater);
        REQUIRE(update.error == PathError::NotAContainer);
    }

    SECTION("scalar root") {
        auto update = update_at_path_vivify(Value{5}, Path{"a"}, updater);
        REQUIRE(update.error == PathError::NotAContainer);
        REQUIRE(update.failed_at == 0);
        REQUIRE(update.root == Value{5});
    }

    SECTION("key on array") {
        auto update = update_at_path_vivify(doc, Path{"customer", "name"}, updater);
        REQUIRE(update.error == PathError::KeyOnArray);
        REQUIRE(update.root == doc);
    }

    SECTION("index far past the end of an existing array") {
        auto update = update_at_path_vivify(doc, Path{"customer", std::size_t{4000000000}}, updater);
        REQUIRE(update.error == PathError::IndexTooLarge);
        REQUIRE(update.failed_at == 1);
        REQUIRE(update.root == doc);
    }

    SECTION("index far past the end of a synthesized array") {
        auto update = update_at_path_vivify(doc, Path{"list", std::size_t{4000000000}, "x"}, updater);
        REQUIRE(update.error == PathError::IndexTooLarge);
        REQUIRE(update.root == doc);
    }

    REQUIRE_FALSE(called);
}

TEST_CASE("update_at_path_vivify pads up to the growth limit", "[path][vivify]") {
    const std::size_t last = JSON_EDIT_MAX_ARRAY_PADDING;
    auto update = set_at_path_vivify(Value{ValueVector{}}, Path{last}, Value{"end"});
    REQUIRE(update.ok());
    REQUIRE(update.root.size() == last + 1);
    REQUIRE(update.root.at(std::size_t{0}).is_null());
    REQUIRE(update.root.at(last - 1).is_null());
    REQUIRE(update.root.at(last).as_string() == "end");

    auto too_far = set_at_path_vivify(Value{ValueVector{}}, Path{last + 1}, Value{"end"});
    REQUIRE(too_far.error == PathError::IndexTooLarge);
    REQUIRE(too_far.root == Value::vector({}));
}

TEST_CASE("path_error_message", "[path][error]") {
    REQUIRE(path_error_message(PathError::None) == "no error");
    REQUIRE_FALSE(path_error_message(PathError::KeyOnArray).empty());
    REQUIRE_FALSE(path_error_message(PathError::IndexTooLarge).empty());
}
