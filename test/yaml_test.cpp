#include <catch.hpp>

#include <seqmap/exception.hpp>
#include <seqmap/ordered_map.hpp>
#include <seqmap/yaml.hpp>

#include <string>
#include <vector>

using namespace seqmap;

TEST_CASE("yaml shapes", "[yaml]") {
    REQUIRE(yaml::shape_of(YAML::Node()) == data_shape::null);
    REQUIRE(yaml::shape_of(YAML::Load("42")) == data_shape::scalar);
    REQUIRE(yaml::shape_of(YAML::Load("[1, 2]")) == data_shape::sequence);
    REQUIRE(yaml::shape_of(YAML::Load("{a: 1}")) == data_shape::map);
}

TEST_CASE("load keeps document order", "[yaml]") {
    auto map = yaml::load<ordered_map<std::string, int>>("{z: 1, a: 2, m: 3}");

    std::vector<std::pair<std::string, int>> expected{{"z", 1}, {"a", 2}, {"m", 3}};
    REQUIRE(map.entries() == expected);
}

TEST_CASE("emit keeps insertion order and duplicates", "[yaml]") {
    ordered_map<std::string, int> map{{"b", 1}, {"a", 2}, {"b", 3}};

    YAML::Emitter out;
    out << YAML::Flow;
    yaml::emit(out, map);
    REQUIRE(std::string(out.c_str()) == "{b: 1, a: 2, b: 3}");

    REQUIRE(yaml::to_string(ordered_map<std::string, int>{{"x", 1}}) == "x: 1");
}

TEST_CASE("node round trip with duplicate keys", "[yaml]") {
    ordered_map<std::string, std::string> map{{"k", "1"}, {"j", "2"}, {"k", "3"}};

    YAML::Node node = yaml::to_node(map);
    REQUIRE(node.IsMap());
    REQUIRE(node.size() == 3);

    auto decoded = yaml::from_node<ordered_map<std::string, std::string>>(node);
    REQUIRE(decoded == map);
}

TEST_CASE("yaml keys are lifted by the strategy", "[yaml]") {
    using map_t = ordered_map<std::string, std::string, decimal_strategy<i64>>;

    auto map = yaml::load<map_t>("{'10': ten, '-1': minus one}");
    std::vector<std::pair<i64, std::string>> expected{{10, "ten"}, {-1, "minus one"}};
    REQUIRE(map.entries() == expected);

    YAML::Emitter out;
    out << YAML::Flow << map;
    REQUIRE(std::string(out.c_str()) == "{10: ten, -1: minus one}");

    REQUIRE_THROWS_AS(yaml::load<map_t>("{'1': a, x: b}"), decode_error);
}

TEST_CASE("yaml decoding errors", "[yaml]") {
    using map_t = ordered_map<std::string, int>;

    SECTION("not a map") {
        try {
            yaml::load<map_t>("[1, 2, 3]");
            FAIL("expected an exception");
        } catch (const shape_error& e) {
            REQUIRE(e.got() == data_shape::sequence);
        }
    }

    SECTION("invalid value") {
        try {
            yaml::load<map_t>("a: 1\nb: two\n");
            FAIL("expected an exception");
        } catch (const decode_error& e) {
            REQUIRE(std::string(e.what()) == "invalid map value at line 2, column 4");
            REQUIRE_THROWS_AS(std::rethrow_if_nested(e), YAML::BadConversion);
        }
    }

    SECTION("invalid document") {
        REQUIRE_THROWS_AS(yaml::load<map_t>("{a: 1"), decode_error);
    }
}

TEST_CASE("yaml-cpp conversions", "[yaml]") {
    using inner_t = ordered_map<std::string, int>;
    using outer_t = ordered_map<std::string, inner_t>;

    YAML::Node node = YAML::Load("{first: {b: 1, a: 2}, second: {}}");

    auto outer = node.as<outer_t>();
    REQUIRE(outer.size() == 2);
    REQUIRE(outer.front().first == "first");
    REQUIRE(outer.front().second == inner_t{{"b", 1}, {"a", 2}});
    REQUIRE(outer.back().second.empty());

    YAML::Node encoded(outer);
    REQUIRE(encoded["first"].IsMap());
    REQUIRE(encoded["first"].as<inner_t>() == inner_t{{"b", 1}, {"a", 2}});

    REQUIRE_THROWS_AS(YAML::Load("[1]").as<inner_t>(), YAML::BadConversion);
}

TEST_CASE("yaml nested sequences", "[yaml]") {
    ordered_map<std::string, std::vector<int>> map;
    map.merge_append("a", 1);
    map.merge_append("a", 2);
    map.merge_append("b", 3);

    YAML::Emitter out;
    out << YAML::Flow << map;
    REQUIRE(std::string(out.c_str()) == "{a: [1, 2], b: [3]}");

    auto decoded = yaml::load<ordered_map<std::string, std::vector<int>>>(out.c_str());
    REQUIRE(decoded == map);
}
