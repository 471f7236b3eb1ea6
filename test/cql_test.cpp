#include <catch.hpp>

#include <seqmap/cql/column_type.hpp>
#include <seqmap/cql/errors.hpp>
#include <seqmap/cql/frame_slice.hpp>
#include <seqmap/cql/ordered_map.hpp>
#include <seqmap/cql/value.hpp>
#include <seqmap/cql/writers.hpp>
#include <seqmap/ordered_map.hpp>

#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace seqmap;
using namespace seqmap::cql;

namespace {

// Returns the exception nested in `e`, if it is a `Nested`.
template<typename Nested, typename Exception>
std::optional<Nested> nested_as(const Exception& e) {
    try {
        std::rethrow_if_nested(e);
    } catch (const Nested& nested) {
        return nested;
    }
    return {};
}

} // namespace

TEST_CASE("column type names", "[cql]") {
    REQUIRE(column_type(native_type::int_).to_string() == "int");
    REQUIRE(column_type::map(native_type::int_, native_type::text).to_string() == "map<int, text>");
    REQUIRE(column_type::list(native_type::bigint, true).to_string() == "frozen<list<bigint>>");
    REQUIRE(column_type::set(column_type::list(native_type::ascii, true)).to_string()
            == "set<frozen<list<ascii>>>");

    REQUIRE(column_type::map(native_type::int_, native_type::text)
            == column_type::map(native_type::int_, native_type::text));
    REQUIRE(column_type::map(native_type::int_, native_type::text)
            != column_type::map(native_type::int_, native_type::text, true));
}

TEST_CASE("cell writer", "[cql]") {
    std::vector<byte> buffer;

    cell_writer(buffer).set_null();
    REQUIRE(buffer == std::vector<byte>{0xff, 0xff, 0xff, 0xff});

    buffer.clear();
    const byte data[] = {1, 2, 3};
    cell_writer(buffer).set_value(data, sizeof(data));
    REQUIRE(buffer == std::vector<byte>{0, 0, 0, 3, 1, 2, 3});

    buffer.clear();
    REQUIRE_THROWS_AS(cell_writer(buffer, 2).set_value(data, sizeof(data)), cell_overflow_error);
    REQUIRE(buffer.empty());

    buffer.clear();
    cell_value_builder builder = cell_writer(buffer).into_value_builder();
    builder.append_number<i16>(0x0102);
    builder.make_sub_writer().set_value(data, 1);
    REQUIRE(builder.size() == 7);
    builder.finish();
    REQUIRE(buffer == std::vector<byte>{0, 0, 0, 7, 1, 2, 0, 0, 0, 1, 1});
}

TEST_CASE("frame slice", "[cql]") {
    const std::vector<byte> bytes{0, 0, 0, 2, 0xaa, 0xbb, 0xff, 0xff, 0xff, 0xff, 0, 0, 0, 5, 1};
    frame_slice frame(bytes);

    auto first = frame.read_cell();
    REQUIRE(first.has_value());
    REQUIRE(first->size() == 2);
    REQUIRE(first->data()[1] == 0xbb);

    auto second = frame.read_cell();
    REQUIRE(!second.has_value());

    REQUIRE(frame.size() == 5);
    REQUIRE_THROWS_AS(frame.read_cell(), frame_error);
    REQUIRE(frame.size() == 5);
}

TEST_CASE("native values", "[cql]") {
    REQUIRE(serialize_value(true, native_type::boolean) == std::vector<byte>{0, 0, 0, 1, 1});
    REQUIRE(serialize_value(i8(-1), native_type::tinyint) == std::vector<byte>{0, 0, 0, 1, 0xff});
    REQUIRE(serialize_value(i16(0x1234), native_type::smallint) == std::vector<byte>{0, 0, 0, 2, 0x12, 0x34});
    REQUIRE(serialize_value(i32(7), native_type::int_) == std::vector<byte>{0, 0, 0, 4, 0, 0, 0, 7});
    REQUIRE(serialize_value(i64(-2), native_type::bigint)
            == std::vector<byte>{0, 0, 0, 8, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfe});
    REQUIRE(serialize_value(1.0, native_type::double_)
            == std::vector<byte>{0, 0, 0, 8, 0x3f, 0xf0, 0, 0, 0, 0, 0, 0});
    REQUIRE(serialize_value(std::string("hi"), native_type::text) == std::vector<byte>{0, 0, 0, 2, 'h', 'i'});
    REQUIRE(serialize_value(std::optional<i32>(), native_type::int_) == std::vector<byte>{0xff, 0xff, 0xff, 0xff});

    const std::vector<byte> float_bytes = serialize_value(1.5f, native_type::float_);
    REQUIRE(deserialize_value<float>(native_type::float_, frame_slice(float_bytes)) == 1.5f);

    const std::vector<byte> text{0, 0, 0, 3, 'a', 'b', 'c'};
    REQUIRE(deserialize_value<std::string>(native_type::ascii, frame_slice(text)) == "abc");

    const std::vector<byte> null{0xff, 0xff, 0xff, 0xff};
    REQUIRE(!deserialize_value<std::optional<std::string>>(native_type::text, frame_slice(null)).has_value());
}

TEST_CASE("native value errors", "[cql]") {
    SECTION("mismatched type") {
        try {
            serialize_value(i32(1), native_type::bigint);
            FAIL("expected an exception");
        } catch (const type_check_error& e) {
            REQUIRE(e.kind() == type_check_kind::mismatched_type);
            REQUIRE(e.got() == column_type(native_type::bigint));
            REQUIRE(e.type_name() == "int");
        }
    }

    SECTION("null") {
        const std::vector<byte> null{0xff, 0xff, 0xff, 0xff};
        try {
            deserialize_value<i32>(native_type::int_, frame_slice(null));
            FAIL("expected an exception");
        } catch (const deserialization_error& e) {
            REQUIRE(e.kind() == deserialization_kind::expected_non_null);
        }
    }

    SECTION("wrong length") {
        const std::vector<byte> bytes{0, 0, 0, 2, 1, 2};
        try {
            deserialize_value<i32>(native_type::int_, frame_slice(bytes));
            FAIL("expected an exception");
        } catch (const deserialization_error& e) {
            REQUIRE(e.kind() == deserialization_kind::byte_length_mismatch);
        }
    }

    SECTION("invalid ascii") {
        const std::vector<byte> bytes{0, 0, 0, 2, 0xc3, 0xa9};
        try {
            deserialize_value<std::string>(native_type::ascii, frame_slice(bytes));
            FAIL("expected an exception");
        } catch (const deserialization_error& e) {
            REQUIRE(e.kind() == deserialization_kind::invalid_ascii);
        }
        REQUIRE(deserialize_value<std::string>(native_type::text, frame_slice(bytes)) == "\xc3\xa9");
    }

    SECTION("truncated") {
        const std::vector<byte> bytes{0, 0, 0, 4, 1};
        try {
            deserialize_value<i32>(native_type::int_, frame_slice(bytes));
            FAIL("expected an exception");
        } catch (const deserialization_error& e) {
            REQUIRE(e.kind() == deserialization_kind::truncated);
        }
    }
}

TEST_CASE("list values", "[cql]") {
    const column_type type = column_type::list(native_type::int_);
    const std::vector<i32> list{1, 2};

    const std::vector<byte> expected{0, 0, 0, 20, 0, 0, 0, 2, 0, 0, 0, 4, 0, 0, 0, 1, 0, 0, 0, 4, 0, 0, 0, 2};
    REQUIRE(serialize_value(list, type) == expected);
    REQUIRE(deserialize_value<std::vector<i32>>(type, frame_slice(expected)) == list);
    REQUIRE(deserialize_value<std::vector<i32>>(column_type::set(native_type::int_), frame_slice(expected)) == list);

    try {
        type_check<std::vector<i32>>(column_type::list(native_type::text));
        FAIL("expected an exception");
    } catch (const type_check_error& e) {
        REQUIRE(e.kind() == type_check_kind::element_type_check_failed);
        auto nested = nested_as<type_check_error>(e);
        REQUIRE(nested.has_value());
        REQUIRE(nested->kind() == type_check_kind::mismatched_type);
    }

    REQUIRE_THROWS_AS(type_check<std::vector<i32>>(native_type::int_), type_check_error);
}

TEST_CASE("map layout", "[cql]") {
    using map_t = ordered_map<i32, std::string>;
    const column_type type = column_type::map(native_type::int_, native_type::text);

    map_t map{{1, "a"}, {2, "bc"}};
    const std::vector<byte> expected{
        0, 0, 0, 31,                // cell length
        0, 0, 0, 2,                 // count
        0, 0, 0, 4, 0, 0, 0, 1,     // key 1
        0, 0, 0, 1, 'a',            // value "a"
        0, 0, 0, 4, 0, 0, 0, 2,     // key 2
        0, 0, 0, 2, 'b', 'c',       // value "bc"
    };
    REQUIRE(serialize_value(map, type) == expected);
    REQUIRE(deserialize_value<map_t>(type, frame_slice(expected)) == map);
}

TEST_CASE("map round trip keeps order and duplicates", "[cql]") {
    using map_t = ordered_map<std::string, double, decimal_strategy<i64>>;
    const column_type type = column_type::map(native_type::bigint, native_type::double_);

    map_t map;
    map.insert_unchecked(5, 0.5);
    map.insert_unchecked(-1, 1.5);
    map.insert_unchecked(5, 2.5);

    const std::vector<byte> bytes = serialize_value(map, type);
    REQUIRE(bytes.size() == 4 + 4 + 3 * (12 + 12));

    auto decoded = deserialize_value<map_t>(type, frame_slice(bytes));
    REQUIRE(decoded == map);

    const std::vector<byte> empty_bytes = serialize_value(map_t(), type);
    REQUIRE(empty_bytes == std::vector<byte>{0, 0, 0, 4, 0, 0, 0, 0});
    REQUIRE(deserialize_value<map_t>(type, frame_slice(empty_bytes)).empty());
}

TEST_CASE("map type check", "[cql]") {
    using map_t = ordered_map<i32, std::string>;

    SECTION("not a map") {
        try {
            type_check<map_t>(column_type::list(native_type::int_));
            FAIL("expected an exception");
        } catch (const type_check_error& e) {
            REQUIRE(e.kind() == type_check_kind::not_map);
            REQUIRE(e.got() == column_type::list(native_type::int_));
        }
    }

    SECTION("frozen map") {
        try {
            type_check<map_t>(column_type::map(native_type::int_, native_type::text, true));
            FAIL("expected an exception");
        } catch (const type_check_error& e) {
            REQUIRE(e.kind() == type_check_kind::not_map);
        }
    }

    SECTION("key type") {
        try {
            type_check<map_t>(column_type::map(native_type::text, native_type::text));
            FAIL("expected an exception");
        } catch (const type_check_error& e) {
            REQUIRE(e.kind() == type_check_kind::key_type_check_failed);
            auto nested = nested_as<type_check_error>(e);
            REQUIRE(nested.has_value());
            REQUIRE(nested->kind() == type_check_kind::mismatched_type);
            REQUIRE(nested->got() == column_type(native_type::text));
        }
    }

    SECTION("value type") {
        try {
            type_check<map_t>(column_type::map(native_type::int_, native_type::boolean));
            FAIL("expected an exception");
        } catch (const type_check_error& e) {
            REQUIRE(e.kind() == type_check_kind::value_type_check_failed);
        }
    }

    SECTION("serialization checks first") {
        map_t map{{1, "a"}};
        REQUIRE_THROWS_AS(serialize_value(map, column_type::map(native_type::int_, native_type::int_)),
                          type_check_error);
    }
}

TEST_CASE("map serialization errors", "[cql]") {
    using map_t = ordered_map<i32, i32>;
    const column_type type = column_type::map(native_type::int_, native_type::int_);

    SECTION("too many elements") {
        map_t map{{1, 1}};
        const size_t too_many = static_cast<size_t>(std::numeric_limits<i32>::max()) + 1;

        std::vector<byte> buffer;
        try {
            cql::detail::serialize_mapping<map_t, i32, i32>(too_many, map.begin(), map.end(), type,
                                                            cell_writer(buffer));
            FAIL("expected an exception");
        } catch (const serialization_error& e) {
            REQUIRE(e.kind() == serialization_kind::too_many_elements);
        }
        REQUIRE(buffer.empty());
    }

    SECTION("size overflow") {
        // 4 bytes count + 3 * (8 + 8) bytes of entries exceed the limit.
        map_t map{{1, 1}, {2, 2}, {3, 3}};
        try {
            serialize_value(map, type, 40);
            FAIL("expected an exception");
        } catch (const serialization_error& e) {
            REQUIRE(e.kind() == serialization_kind::size_overflow);
            REQUIRE(nested_as<cell_overflow_error>(e).has_value());
        }
        REQUIRE(serialize_value(map, type, 52).size() == 56);
    }

    SECTION("value failure") {
        using text_map_t = ordered_map<i32, std::string>;
        text_map_t map{{1, "0123456789"}};
        try {
            serialize_value(map, column_type::map(native_type::int_, native_type::text), 8);
            FAIL("expected an exception");
        } catch (const serialization_error& e) {
            REQUIRE(e.kind() == serialization_kind::value_serialization_failed);
            auto nested = nested_as<serialization_error>(e);
            REQUIRE(nested.has_value());
            REQUIRE(nested->kind() == serialization_kind::size_overflow);
        }
    }
}

TEST_CASE("failed serialization leaves earlier cells intact", "[cql]") {
    std::vector<byte> frame;
    value_codec<i32>::serialize(7, native_type::int_, cell_writer(frame, 16));
    const std::vector<byte> good_cell = frame;
    REQUIRE(good_cell.size() == 8);

    SECTION("map value too large") {
        ordered_map<i32, std::string> map{{1, "short"}, {2, "this value is far too long"}};
        try {
            value_codec<ordered_map<i32, std::string>>::serialize(
                map, column_type::map(native_type::int_, native_type::text), cell_writer(frame, 16));
            FAIL("expected an exception");
        } catch (const serialization_error& e) {
            REQUIRE(e.kind() == serialization_kind::value_serialization_failed);
        }
        REQUIRE(frame == good_cell);
    }

    SECTION("map cell too large") {
        using int_map_t = ordered_map<i32, i32>;
        int_map_t map{{1, 1}, {2, 2}, {3, 3}};
        REQUIRE_THROWS_AS(value_codec<int_map_t>::serialize(
                              map, column_type::map(native_type::int_, native_type::int_),
                              cell_writer(frame, 40)),
                          serialization_error);
        REQUIRE(frame == good_cell);
    }

    SECTION("list element too large") {
        std::vector<std::string> list{"ok", "this element is far too long"};
        REQUIRE_THROWS_AS(value_codec<std::vector<std::string>>::serialize(
                              list, column_type::list(native_type::text), cell_writer(frame, 16)),
                          serialization_error);
        REQUIRE(frame == good_cell);
    }

    value_codec<i32>::serialize(8, native_type::int_, cell_writer(frame));
    // deserialize_value reads from a copy of `reader`.
    frame_slice reader(frame);
    REQUIRE(deserialize_value<i32>(native_type::int_, reader) == 7);
    REQUIRE(reader.read_cell().has_value());
    REQUIRE(deserialize_value<i32>(native_type::int_, reader) == 8);
}

TEST_CASE("value builder rollback", "[cql]") {
    std::vector<byte> buffer{0xaa};

    cell_value_builder builder = cell_writer(buffer).into_value_builder();
    builder.append_number<i32>(1);
    builder.make_sub_writer().set_null();
    REQUIRE(buffer.size() == 13);

    builder.rollback();
    REQUIRE(buffer == std::vector<byte>{0xaa});

    cell_value_builder small = cell_writer(buffer, 2).into_value_builder();
    small.append_number<i32>(1);
    REQUIRE_THROWS_AS(small.finish(), cell_overflow_error);
    REQUIRE(buffer == std::vector<byte>{0xaa});
}

TEST_CASE("map deserialization errors", "[cql]") {
    using map_t = ordered_map<i32, i32>;
    const column_type type = column_type::map(native_type::int_, native_type::int_);

    SECTION("null") {
        const std::vector<byte> bytes{0xff, 0xff, 0xff, 0xff};
        try {
            deserialize_value<map_t>(type, frame_slice(bytes));
            FAIL("expected an exception");
        } catch (const deserialization_error& e) {
            REQUIRE(e.kind() == deserialization_kind::expected_non_null);
        }
        REQUIRE(!deserialize_value<std::optional<map_t>>(type, frame_slice(bytes)).has_value());
    }

    SECTION("negative count") {
        const std::vector<byte> bytes{0, 0, 0, 4, 0xff, 0xff, 0xff, 0xfe};
        try {
            deserialize_value<map_t>(type, frame_slice(bytes));
            FAIL("expected an exception");
        } catch (const deserialization_error& e) {
            REQUIRE(e.kind() == deserialization_kind::negative_element_count);
        }
    }

    SECTION("missing entries") {
        const std::vector<byte> bytes{0, 0, 0, 12, 0, 0, 0, 2, 0, 0, 0, 4, 0, 0, 0, 1};
        try {
            deserialize_value<map_t>(type, frame_slice(bytes));
            FAIL("expected an exception");
        } catch (const deserialization_error& e) {
            REQUIRE(e.kind() == deserialization_kind::truncated);
        }
    }

    SECTION("bad value") {
        const std::vector<byte> bytes{0, 0, 0, 18, 0, 0, 0, 1, 0, 0, 0, 4, 0, 0, 0, 1, 0, 0, 0, 2, 0, 1};
        try {
            deserialize_value<map_t>(type, frame_slice(bytes));
            FAIL("expected an exception");
        } catch (const deserialization_error& e) {
            REQUIRE(e.kind() == deserialization_kind::value_deserialization_failed);
            auto nested = nested_as<deserialization_error>(e);
            REQUIRE(nested.has_value());
            REQUIRE(nested->kind() == deserialization_kind::byte_length_mismatch);
        }
    }

    SECTION("null key") {
        const std::vector<byte> bytes{0, 0, 0, 16, 0, 0, 0, 1, 0xff, 0xff, 0xff, 0xff, 0, 0, 0, 4, 0, 0, 0, 1};
        try {
            deserialize_value<map_t>(type, frame_slice(bytes));
            FAIL("expected an exception");
        } catch (const deserialization_error& e) {
            REQUIRE(e.kind() == deserialization_kind::key_deserialization_failed);
        }
    }
}
