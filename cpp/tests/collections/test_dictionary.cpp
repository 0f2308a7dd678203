/**
 * @file test_dictionary.cpp
 * @brief Unit tests for Dictionary storage, lookup and removal.
 *
 * Every test injects its own IdentityRegistry so tokens minted for objects
 * and handles never leak between test cases.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <tcoll/collections/dictionary.h>
#include <tcoll/types/class_registry.h>
#include <tcoll/types/type_errors.h>

#include <limits>
#include <string>
#include <vector>

using namespace tcoll;
using Catch::Matchers::ContainsSubstring;

namespace {

Dictionary make_dictionary() { return Dictionary(std::nullopt, std::nullopt, {}, IdentityRegistry::create()); }

Dictionary make_dictionary(std::string_view key_spec, std::string_view value_spec) {
    return Dictionary(key_spec, value_spec, IdentityRegistry::create());
}

} // namespace

// ============================================================================
// Keys of every kind
// ============================================================================

TEST_CASE("Dictionary - objects, arrays and scalars as keys", "[collections][dictionary]") {
    ClassRegistry classes;
    auto dict = make_dictionary("mixed", "string");

    auto object = classes.instantiate("GenericObject");
    Value list{Array{1, 2, 3}};

    dict.set(object, "object").set(list, "array").set(true, "bool");
    REQUIRE(dict.size() == 3);

    CHECK(dict.get(object) == Value{"object"});
    CHECK(dict.get(list) == Value{"array"});
    CHECK(dict.get(true) == Value{"bool"});

    SECTION("arrays are keyed by content") {
        Value rebuilt{Array{1, 2, 3}};
        CHECK(dict.key_exists(rebuilt));
        CHECK(dict.get(rebuilt) == Value{"array"});

        dict.set(rebuilt, "replaced");
        CHECK(dict.size() == 3);
        CHECK(dict.get(list) == Value{"replaced"});
    }

    SECTION("objects are keyed by instance") {
        auto twin = classes.instantiate("GenericObject");
        CHECK_FALSE(dict.key_exists(twin));
        REQUIRE_THROWS_AS(dict.get(twin), UnknownKey);
    }

    SECTION("iteration returns the keys as inserted") {
        auto keys = dict.keys();
        REQUIRE(keys.size() == 3);
        CHECK(keys[0] == Value{object});
        CHECK(keys[1] == list);
        CHECK(keys[2] == Value{true});
    }
}

TEST_CASE("Dictionary - keys of different kinds never collide", "[collections][dictionary]") {
    auto dict = make_dictionary();

    dict.set(1, "int").set("1", "string").set(true, "bool").set(1.0, "float").set(Value{}, "null");
    CHECK(dict.size() == 5);
    CHECK(dict.get(1) == Value{"int"});
    CHECK(dict.get("1") == Value{"string"});
    CHECK(dict.get(true) == Value{"bool"});
    CHECK(dict.get(1.0) == Value{"float"});
    CHECK(dict.get(Value{}) == Value{"null"});
}

TEST_CASE("Dictionary - handles and callables as keys", "[collections][dictionary]") {
    auto dict = make_dictionary("resource|callable", "int");
    auto handle = make_handle("stream");
    auto fn = make_callable([](const std::vector<Value> &) { return Value{}; });

    dict.set(handle, 1).set(fn, 2);
    CHECK(dict.get(handle) == Value{1});
    CHECK(dict.get(fn) == Value{2});
    CHECK_FALSE(dict.key_exists(make_handle("stream")));
}

TEST_CASE("Dictionary - NaN cannot be a key", "[collections][dictionary]") {
    auto dict = make_dictionary();
    auto nan = std::numeric_limits<double>::quiet_NaN();

    REQUIRE_THROWS_AS(dict.set(nan, 1), InvalidKey);
    CHECK_FALSE(dict.key_exists(nan));
    REQUIRE_THROWS_AS(dict.get(nan), UnknownKey);
    CHECK(dict.empty());
}

// ============================================================================
// Set and get
// ============================================================================

TEST_CASE("Dictionary - set replaces in place", "[collections][dictionary]") {
    auto dict = make_dictionary("string", "int");
    dict.set("a", 1).set("b", 2).set("c", 3);

    dict.set("a", 10);
    CHECK(dict.size() == 3);
    CHECK(dict.get("a") == Value{10});
    CHECK(dict.keys().front() == Value{"a"});
    CHECK(dict["a"] == Value{10});
}

TEST_CASE("Dictionary - replacing with references into stored pairs", "[collections][dictionary]") {
    auto dict = make_dictionary();
    std::string long_key(64, 'k');
    std::string long_value(64, 'v');
    dict.set(long_key + "1", long_value).set(long_key + "2", long_value).set(Value{Array{long_key}}, long_value);

    SECTION("keys taken from iteration") {
        for (const Pair& pair : dict) dict.set(pair.key(), 1);
        CHECK(dict.size() == 3);
        CHECK(dict.values() == std::vector<Value>{Value{1}, Value{1}, Value{1}});
        CHECK(dict.keys().front() == Value{long_key + "1"});
        CHECK(dict.get(Value{Array{long_key}}) == Value{1});
    }

    SECTION("key and value of the pair being replaced") {
        for (const Pair& pair : dict) dict.set(pair.key(), pair.value());
        CHECK(dict.size() == 3);
        CHECK(dict.get(long_key + "2") == Value{long_value});
    }

    SECTION("value read back from the dictionary") {
        dict.set(long_key + "1", dict.get(long_key + "1"));
        CHECK(dict.get(long_key + "1") == Value{long_value});
    }
}

TEST_CASE("Dictionary - add and import", "[collections][dictionary]") {
    auto dict = make_dictionary("string", "int");
    dict.add("a", 1).add(Pair{"b", 2}).import({Pair{"c", 3}, Pair{"a", 4}});

    CHECK(dict.size() == 3);
    CHECK(dict.values() == std::vector<Value>{Value{4}, Value{2}, Value{3}});
}

TEST_CASE("Dictionary - type checks", "[collections][dictionary]") {
    auto dict = make_dictionary("int", "string");
    dict.set(5, "five");

    SECTION("disallowed key on set") {
        try {
            dict.set("x", "y");
            FAIL("expected TypeMismatch");
        } catch (const TypeMismatch &e) {
            CHECK(e.label() == "key");
            CHECK(e.actual().name() == "string");
            CHECK_THAT(std::string(e.what()), ContainsSubstring("Disallowed key type: string."));
        }
    }

    SECTION("disallowed value on set") {
        REQUIRE_THROWS_WITH(dict.set(6, 6), ContainsSubstring("Disallowed value type: int."));
        CHECK(dict.size() == 1);
    }

    SECTION("type mismatch wins over unknown key") {
        REQUIRE_THROWS_AS(dict.get("missing"), TypeMismatch);
        REQUIRE_THROWS_AS(dict.remove("missing"), TypeMismatch);
        REQUIRE_THROWS_AS(dict.get(6), UnknownKey);
    }

    SECTION("key_exists never throws") {
        CHECK(dict.key_exists(5));
        CHECK_FALSE(dict.key_exists(6));
        CHECK_FALSE(dict.key_exists("5"));
        CHECK_FALSE(dict.key_exists(Value{Array{5}}));
    }
}

TEST_CASE("Dictionary - lookups do not register identities", "[collections][dictionary]") {
    ClassRegistry classes;
    auto registry = IdentityRegistry::create();
    Dictionary dict(std::nullopt, std::nullopt, {}, registry);
    auto stored = make_handle("stored");
    dict.set(stored, 1);
    auto before = registry->size();

    auto stranger = classes.instantiate("GenericObject");
    auto handle = make_handle("stream");
    CHECK_FALSE(dict.key_exists(stranger));
    CHECK_FALSE(dict.key_exists(Value{Array{handle}}));
    REQUIRE_THROWS_AS(dict.get(stranger), UnknownKey);
    REQUIRE_THROWS_AS(dict.remove(handle), UnknownKey);
    CHECK(registry->size() == before);
    CHECK(dict.key_exists(stored));
}

TEST_CASE("Dictionary - unknown key messages", "[collections][dictionary]") {
    auto dict = make_dictionary();

    REQUIRE_THROWS_WITH(dict.get("kiwi"), "Unknown key: \"kiwi\".");
    REQUIRE_THROWS_WITH(dict.get(std::string(100, 'x')), ContainsSubstring("..."));
}

// ============================================================================
// Removal
// ============================================================================

TEST_CASE("Dictionary - remove", "[collections][dictionary]") {
    auto dict = make_dictionary("string", "int");
    dict.set("a", 1).set("b", 2).set("c", 3);

    dict.remove("b");
    CHECK(dict.size() == 2);
    CHECK_FALSE(dict.key_exists("b"));
    CHECK(dict.keys() == std::vector<Value>{Value{"a"}, Value{"c"}});
    REQUIRE_THROWS_AS(dict.remove("b"), UnknownKey);

    // A re-added key goes to the end
    dict.set("b", 20);
    CHECK(dict.keys() == std::vector<Value>{Value{"a"}, Value{"c"}, Value{"b"}});
}

TEST_CASE("Dictionary - remove_by_key returns the value", "[collections][dictionary]") {
    auto dict = make_dictionary("string", "int");
    dict.set("a", 1).set("b", 2);

    CHECK(dict.remove_by_key("a") == Value{1});
    CHECK(dict.size() == 1);
    REQUIRE_THROWS_AS(dict.remove_by_key("a"), UnknownKey);
}

TEST_CASE("Dictionary - remove_by_value removes every match", "[collections][dictionary]") {
    auto dict = make_dictionary("string", "int");
    dict.set("a", 1).set("b", 2).set("c", 1).set("d", 3);

    CHECK(dict.remove_by_value(1) == 2);
    CHECK(dict.keys() == std::vector<Value>{Value{"b"}, Value{"d"}});
    CHECK(dict.remove_by_value(99) == 0);
    REQUIRE_THROWS_AS(dict.remove_by_value("1"), TypeMismatch);
}

TEST_CASE("Dictionary - clear", "[collections][dictionary]") {
    auto dict = make_dictionary();
    dict.set(1, 1).set(2, 2);

    dict.clear();
    CHECK(dict.empty());
    CHECK(dict.begin() == dict.end());
    CHECK_FALSE(dict.key_exists(1));

    dict.set(3, 3);
    CHECK(dict.size() == 1);
}

TEST_CASE("Dictionary - many removals keep order and lookups intact", "[collections][dictionary]") {
    auto dict = make_dictionary("int", "int");
    for (int i = 0; i < 100; ++i) dict.set(i, i * i);

    for (int i = 0; i < 100; ++i) {
        if (i % 10 != 0) dict.remove(i);
    }

    REQUIRE(dict.size() == 10);
    int expected = 0;
    for (const Pair &pair : dict) {
        CHECK(pair.key() == Value{expected});
        CHECK(pair.value() == Value{expected * expected});
        expected += 10;
    }
    CHECK(dict.get(90) == Value{8100});

    dict.set(5, 25);
    CHECK(dict.keys().back() == Value{5});
    CHECK(dict.size() == 11);
}

// ============================================================================
// Queries
// ============================================================================

TEST_CASE("Dictionary - contains is strict", "[collections][dictionary]") {
    auto dict = make_dictionary();
    dict.set("a", 1).set("b", Value{Array{1, 2}});

    CHECK(dict.contains(1));
    CHECK_FALSE(dict.contains("1"));
    CHECK_FALSE(dict.contains(1.0));
    CHECK(dict.contains(Value{Array{1, 2}}));
}

TEST_CASE("Dictionary - equal compares keys, values and order", "[collections][dictionary]") {
    auto a = make_dictionary("string", "int");
    auto b = make_dictionary();
    a.set("x", 1).set("y", 2);
    b.set("x", 1).set("y", 2);

    CHECK(a.equal(b));

    b.set("y", 3);
    CHECK_FALSE(a.equal(b));

    auto c = make_dictionary();
    c.set("y", 2).set("x", 1);
    CHECK_FALSE(a.equal(c));
}

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("Dictionary - default construction allows anything", "[collections][dictionary]") {
    Dictionary dict;
    CHECK(dict.empty());
    CHECK(dict.key_types().empty());
    CHECK(dict.value_types().empty());
    CHECK(dict.registry() == IdentityRegistry::shared());
}

TEST_CASE("Dictionary - constraints inferred from a source", "[collections][dictionary]") {
    Dictionary dict(std::nullopt, std::nullopt, {Pair{1, "a"}, Pair{2.5, "b"}}, IdentityRegistry::create());

    CHECK(dict.size() == 2);
    CHECK(dict.key_types().contains_only("int", "float"));
    CHECK(dict.value_types().contains_only("string"));
    REQUIRE_THROWS_AS(dict.set("c", "c"), TypeMismatch);
}

TEST_CASE("Dictionary - explicit constraints check the source", "[collections][dictionary]") {
    REQUIRE_THROWS_AS(Dictionary(TypeSet("int"), std::nullopt, {Pair{"a", 1}}, IdentityRegistry::create()),
                      TypeMismatch);

    Dictionary dict(TypeSet("?int"), std::nullopt, {Pair{Value{}, 1}, Pair{2, 2}}, IdentityRegistry::create());
    CHECK(dict.size() == 2);
    CHECK(dict.value_types().contains_only("int"));
}

TEST_CASE("Dictionary - spec string construction", "[collections][dictionary]") {
    auto dict = make_dictionary("int|string", "?float");
    CHECK(dict.key_types().contains_only("int", "string"));
    CHECK(dict.value_types().null_ok());

    REQUIRE_THROWS_AS(make_dictionary("9bad", "int"), InvalidTypeName);
    REQUIRE_THROWS_AS(make_dictionary("", "int"), InvalidTypeName);
}

TEST_CASE("Dictionary - combine", "[collections][dictionary]") {
    auto registry = IdentityRegistry::create();

    SECTION("zips keys and values") {
        auto dict = Dictionary::combine({"a", "b"}, {1, 2}, true, registry);
        CHECK(dict.get("b") == Value{2});
        CHECK(dict.key_types().contains_only("string"));
        CHECK(dict.value_types().contains_only("int"));
    }

    SECTION("without inference") {
        auto dict = Dictionary::combine({"a", 1}, {1, "b"}, false, registry);
        CHECK(dict.key_types().empty());
        CHECK(dict.size() == 2);
    }

    SECTION("count mismatch") {
        REQUIRE_THROWS_WITH(Dictionary::combine({"a", "b"}, {1}, true, registry),
                            ContainsSubstring("keys count (2) does not match values count (1)"));
    }

    SECTION("repeated keys") {
        REQUIRE_THROWS_AS(Dictionary::combine({"a", "a"}, {1, 2}, true, registry), DuplicateKey);
    }
}

// ============================================================================
// Rendering
// ============================================================================

TEST_CASE("Dictionary - to_string", "[collections][dictionary]") {
    auto dict = make_dictionary();
    CHECK(dict.to_string() == "{}");

    dict.set("a", 1).set(2, true);
    CHECK(dict.to_string() == "{\"a\" => 1, 2 => true}");
}
