#include <seqmap/yaml.hpp>

#include <seqmap/assert.hpp>

namespace seqmap::yaml {

data_shape shape_of(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
        return data_shape::undefined;
    case YAML::NodeType::Null:
        return data_shape::null;
    case YAML::NodeType::Scalar:
        return data_shape::scalar;
    case YAML::NodeType::Sequence:
        return data_shape::sequence;
    case YAML::NodeType::Map:
        return data_shape::map;
    }
    SEQMAP_UNREACHABLE("invalid yaml node type");
}

node_source::node_source(YAML::Node node)
    : m_node(std::move(node)) {}

std::optional<size_t> node_source::size_hint() const {
    if (!m_node.IsMap())
        return {};
    return m_node.size();
}

void node_sink::begin_map(size_t size) {
    unused(size);
    m_node = YAML::Node(YAML::NodeType::Map);
}

void emitter_sink::begin_map(size_t size) {
    unused(size);
    m_out << YAML::BeginMap;
}

void emitter_sink::end_map() {
    m_out << YAML::EndMap;
}

} // namespace seqmap::yaml
