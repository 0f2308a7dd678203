/**
 * @file test_class_registry.cpp
 * @brief Unit tests for named classes and capability sets.
 */

#include <catch2/catch_test_macros.hpp>

#include <tcoll/types/class_registry.h>
#include <tcoll/types/type_errors.h>

#include <memory>

using namespace tcoll;

namespace {

// Host-side subclass carrying state
struct Counter : Object {
    explicit Counter(class_meta_ptr meta, int start) : Object(meta), value(start) {}
    int value;
};

} // namespace

TEST_CASE("ClassRegistry - GenericObject is always registered", "[types][classes]") {
    ClassRegistry classes;

    REQUIRE(classes.has("GenericObject"));
    REQUIRE(classes.generic() != nullptr);
    CHECK(classes.generic()->is_default_constructible());
    CHECK(classes.size() == 1);

    auto object = classes.instantiate("GenericObject");
    REQUIRE(object != nullptr);
    CHECK(object->class_name() == "GenericObject");
}

TEST_CASE("ClassRegistry - capabilities include ancestors and interfaces", "[types][classes]") {
    ClassRegistry classes;
    classes.define("Shape").implements("Drawable").build();
    classes.define("Circle").extends("Shape").implements("Countable").uses("Loggable").default_constructible().build();

    auto circle = classes.instantiate("Circle");
    CHECK(circle->is_a("Circle"));
    CHECK(circle->is_a("Shape"));
    CHECK(circle->is_a("Drawable"));
    CHECK(circle->is_a("Countable"));
    CHECK(circle->is_a("Loggable"));
    CHECK_FALSE(circle->is_a("Square"));
}

TEST_CASE("ClassRegistry - registered interfaces expand their own capabilities", "[types][classes]") {
    ClassRegistry classes;
    classes.define("Collection").implements("Traversable").build();
    classes.define("Bag").implements("Collection").default_constructible().build();

    auto bag = classes.instantiate("Bag");
    CHECK(bag->is_a("Collection"));
    CHECK(bag->is_a("Traversable"));
}

TEST_CASE("ClassRegistry - lookup ignores a leading namespace separator", "[types][classes]") {
    ClassRegistry classes;
    classes.define("\\App\\Models\\User").build();

    CHECK(classes.has("App\\Models\\User"));
    CHECK(classes.has("\\App\\Models\\User"));
    CHECK(classes.find("User") == nullptr);
}

TEST_CASE("ClassRegistry - invalid definitions", "[types][classes]") {
    ClassRegistry classes;
    classes.define("Shape").build();

    REQUIRE_THROWS_AS(classes.define("9bad"), InvalidTypeName);
    REQUIRE_THROWS_AS(classes.define("string"), InvalidTypeName);
    REQUIRE_THROWS_AS(classes.define("Shape"), std::invalid_argument);
    REQUIRE_THROWS_AS(classes.define("Circle").extends("Missing"), std::invalid_argument);
    REQUIRE_THROWS_AS(classes.define("Circle").implements("not valid"), InvalidTypeName);
}

TEST_CASE("ClassRegistry - instantiation", "[types][classes]") {
    ClassRegistry classes;
    classes.define("Abstract").build();
    classes.define("Counter")
        .factory([](class_meta_ptr meta) { return std::make_shared<Counter>(meta, 10); })
        .build();

    SECTION("unknown class") {
        REQUIRE_THROWS_AS(classes.instantiate("Nope"), std::out_of_range);
    }

    SECTION("class without a zero-argument constructor") {
        REQUIRE_THROWS_AS(classes.instantiate("Abstract"), NoDefaultAvailable);
    }

    SECTION("custom factory") {
        auto object = classes.instantiate("Counter");
        auto counter = std::dynamic_pointer_cast<Counter>(object);
        REQUIRE(counter != nullptr);
        CHECK(counter->value == 10);
        CHECK(counter->class_name() == "Counter");
    }
}
