#ifndef SEQMAP_YAML_HPP
#define SEQMAP_YAML_HPP

#include <seqmap/data_shape.hpp>
#include <seqmap/defs.hpp>
#include <seqmap/exception.hpp>
#include <seqmap/ordered_map.hpp>
#include <seqmap/protocol.hpp>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

/// \defgroup yaml YAML support
///
/// Integration of \ref seqmap::ordered_map with yaml-cpp.
///
/// YAML mappings keep the order of their entries and may contain duplicate keys when
/// they are built programmatically, so an ordered_map survives a round trip through
/// `YAML::Node` or `YAML::Emitter` unchanged.
///
/// Besides the functions in `seqmap::yaml`, this header specializes `YAML::convert`
/// and provides an `operator<<` for `YAML::Emitter`, which means that ordered maps can be
/// used like any other yaml-cpp compatible type:
///
/// \code{.cpp}
///     YAML::Node node = YAML::Load("{b: 1, a: 2}");
///     auto map = node.as<seqmap::ordered_map<std::string, int>>();
///
///     YAML::Emitter out;
///     out << map;
/// \endcode

namespace seqmap::yaml {

/// Returns the shape of the given yaml node.
data_shape shape_of(const YAML::Node& node);

/**
 * A map source that reads the entries of a `YAML::Node` one at a time.
 *
 * Keys and values are converted using yaml-cpp's conversion facilities (`YAML::convert<T>`).
 * Conversion failures are reported as \ref decode_error with the original yaml-cpp
 * exception attached as the nested cause.
 */
class node_source {
public:
    explicit node_source(YAML::Node node);

    data_shape shape() const { return shape_of(m_node); }

    std::optional<size_t> size_hint() const;

    template<typename K, typename V>
    std::optional<std::pair<K, V>> next_entry() {
        if (!m_started) {
            const YAML::Node& node = m_node;
            if (!node.IsMap())
                return {};

            m_pos = node.begin();
            m_end = node.end();
            m_started = true;
        }
        if (m_pos == m_end)
            return {};

        const YAML::Node key_node = m_pos->first;
        const YAML::Node value_node = m_pos->second;
        ++m_pos;

        K key = convert_node<K>(key_node, "key");
        V value = convert_node<V>(value_node, "value");
        return std::pair<K, V>(std::move(key), std::move(value));
    }

private:
    template<typename T>
    static T convert_node(const YAML::Node& node, std::string_view role) {
        try {
            return node.as<T>();
        } catch (const YAML::BadConversion& e) {
            const YAML::Mark mark = e.mark;
            SEQMAP_THROW_NESTED(decode_error(fmt::format(
                "invalid map {} at line {}, column {}", role, mark.line + 1, mark.column + 1)));
        }
    }

private:
    YAML::Node m_node;
    bool m_started = false;
    YAML::const_iterator m_pos;
    YAML::const_iterator m_end;
};

/**
 * A map sink that builds a `YAML::Node` of type map.
 * Entries with duplicate keys are kept (see `YAML::Node::force_insert`).
 */
class node_sink {
public:
    node_sink() = default;

    void begin_map(size_t size);

    template<typename K, typename V>
    void write_entry(const K& key, const V& value) {
        m_node.force_insert(key, value);
    }

    void end_map() {}

    /// Returns the node built so far.
    const YAML::Node& node() const { return m_node; }

private:
    YAML::Node m_node;
};

/**
 * A map sink that writes a map to a `YAML::Emitter`.
 *
 * The emitter's style settings (e.g. `YAML::Flow`) apply as usual.
 * Emitter errors are not reported by the sink itself; check `YAML::Emitter::good()`
 * or use \ref seqmap::yaml::emit.
 */
class emitter_sink {
public:
    explicit emitter_sink(YAML::Emitter& out)
        : m_out(out) {}

    void begin_map(size_t size);

    template<typename K, typename V>
    void write_entry(const K& key, const V& value) {
        m_out << YAML::Key << key << YAML::Value << value;
    }

    void end_map();

private:
    YAML::Emitter& m_out;
};

/// Converts the map into a `YAML::Node` of type map.
template<typename K, typename V, typename S>
YAML::Node to_node(const ordered_map<K, V, S>& map) {
    node_sink sink;
    encode_map(map, sink);
    return sink.node();
}

/// Decodes a map of type `Map` from the given yaml node.
///
/// \throws shape_error     If the node is not a map.
/// \throws decode_error    If a key or value could not be converted.
template<typename Map>
Map from_node(const YAML::Node& node) {
    node_source source(node);
    return decode_map<Map>(source);
}

/// Writes the map to the given emitter.
///
/// \throws encode_error    If the emitter entered an error state.
template<typename K, typename V, typename S>
void emit(YAML::Emitter& out, const ordered_map<K, V, S>& map) {
    emitter_sink sink(out);
    encode_map(map, sink);
    if (!out.good())
        SEQMAP_THROW(encode_error(fmt::format("Failed to emit map: {}", out.GetLastError())));
}

/// Formats the map as a yaml document.
template<typename K, typename V, typename S>
std::string to_string(const ordered_map<K, V, S>& map) {
    YAML::Emitter out;
    emit(out, map);
    return std::string(out.c_str(), out.size());
}

/// Parses the yaml document and decodes a map of type `Map` from its root node.
///
/// \throws decode_error    If the document is not valid yaml or if a key or value could not be converted.
/// \throws shape_error     If the document's root is not a map.
template<typename Map>
Map load(const std::string& document) {
    YAML::Node node;
    try {
        node = YAML::Load(document);
    } catch (const YAML::ParserException&) {
        SEQMAP_THROW_NESTED(decode_error("Failed to parse yaml document."));
    }
    return from_node<Map>(node);
}

} // namespace seqmap::yaml

namespace seqmap {

/// Writes the map to the emitter as a yaml mapping.
///
/// \ingroup yaml
template<typename K, typename V, typename S>
YAML::Emitter& operator<<(YAML::Emitter& out, const ordered_map<K, V, S>& map) {
    yaml::emitter_sink sink(out);
    encode_map(map, sink);
    return out;
}

} // namespace seqmap

namespace YAML {

template<typename K, typename V, typename S>
struct convert<seqmap::ordered_map<K, V, S>> {
    using map_type = seqmap::ordered_map<K, V, S>;

    static Node encode(const map_type& rhs) { return seqmap::yaml::to_node(rhs); }

    static bool decode(const Node& node, map_type& rhs) {
        if (!node.IsMap())
            return false;

        rhs = seqmap::yaml::from_node<map_type>(node);
        return true;
    }
};

} // namespace YAML

#endif // SEQMAP_YAML_HPP
