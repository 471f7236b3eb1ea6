#include <seqmap/cql/ordered_map.hpp>
#include <seqmap/exception.hpp>
#include <seqmap/formatting.hpp>
#include <seqmap/logging.hpp>
#include <seqmap/ordered_map.hpp>
#include <seqmap/yaml.hpp>

#include <clipp.h>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace seqmap;

enum class output_format { yaml, cql };

struct options {
    std::string file;
    output_format format = output_format::yaml;
    bool group = false;
    bool flow = false;
    bool verbose = false;
};

// Keys are integers written as strings, e.g. {"10": ..., "-3": ...}.
using input_map = ordered_map<std::string, std::string, decimal_strategy<i64>>;
using grouped_map = ordered_map<std::string, std::vector<std::string>, decimal_strategy<i64>>;

static void parse_options(int argc, char** argv, options& o) {
    using namespace clipp;

    bool show_help = false;

    auto cli = "Options:" % (
        value("file", o.file)                                           % "yaml file containing a map with integer keys",
        (option("-o", "--output") & (
            required("yaml").set(o.format, output_format::yaml) |
            required("cql").set(o.format, output_format::cql)))          % "output format (default: yaml)",
        option("-g", "--group").set(o.group)                            % "merge values of adjacent equal keys into lists",
        option("--flow").set(o.flow)                                    % "emit yaml in flow style",
        option("-v", "--verbose").set(o.verbose)                        % "enable debug logging",
        option("-h", "--help").set(show_help)                           % "display this text"
    );

    auto print_usage = [&](bool include_help){
        auto fmt = doc_formatting()
                .merge_alternative_flags_with_common_prefix(false)
                .start_column(0)
                .doc_column(30);

        std::cout << "Usage:\n"
                  << usage_lines(cli, argv[0], doc_formatting(fmt).start_column(4))
                  << "\n";
        if (include_help) {
            std::cout << "\n"
                      << documentation(cli, fmt)
                      << "\n";
        }
    };

    parsing_result result = parse(argc, argv, cli);
    if (show_help) {
        print_usage(true);
        std::exit(1);
    }

    if (!result) {
        if (!result.missing().empty()) {
            std::cout << "Required parameters are missing.\n\n";
        }
        print_usage(false);
        std::exit(1);
    }
}

static std::string read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in)
        SEQMAP_THROW(bad_argument(fmt::format("Failed to open {}.", path)));

    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

static grouped_map group_entries(input_map&& map) {
    grouped_map result;
    for (auto& entry : std::move(map).into_entries())
        result.merge_append(entry.first, std::move(entry.second));
    return result;
}

template<typename Map>
static void print_yaml(const Map& map, bool flow) {
    YAML::Emitter out;
    if (flow)
        out << YAML::Flow;
    yaml::emit(out, map);
    std::cout << out.c_str() << "\n";
}

template<typename Map>
static void print_cql(const Map& map, const cql::column_type& type) {
    const std::vector<byte> bytes = cql::serialize_value(map, type);
    logger()->debug("Serialized {} entries as {} ({} bytes)", map.size(), type.to_string(), bytes.size());
    std::cout << format_hex(bytes, 16) << "\n";
}

static void run(const options& o) {
    input_map map = yaml::load<input_map>(read_file(o.file));
    logger()->info("Read {} entries from {}", map.size(), o.file);

    if (o.group) {
        grouped_map grouped = group_entries(std::move(map));
        logger()->info("Grouped into {} entries", grouped.size());

        if (o.format == output_format::yaml) {
            print_yaml(grouped, o.flow);
        } else {
            print_cql(grouped, cql::column_type::map(cql::native_type::bigint,
                                                     cql::column_type::list(cql::native_type::text, true)));
        }
        return;
    }

    if (o.format == output_format::yaml) {
        print_yaml(map, o.flow);
    } else {
        print_cql(map, cql::column_type::map(cql::native_type::bigint, cql::native_type::text));
    }
}

int main(int argc, char** argv) {
    options o;
    parse_options(argc, argv, o);

    auto log = spdlog::stderr_color_mt("rekey");
    log->set_level(o.verbose ? spdlog::level::debug : spdlog::level::warn);
    set_logger(log);

    try {
        run(o);
    } catch (const std::exception& e) {
        log->error("{}", format_exception(e));
        return 1;
    }
    return 0;
}
