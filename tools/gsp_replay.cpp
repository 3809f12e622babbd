#include "cli/CommandLine.hpp"
#include "log/TaggedLogger.hpp"

#include <gsp/interpreter/StreamInterpreter.hpp>
#include <gsp/interpreter/StreamReader.hpp>
#include <gsp/interpreter/WidgetCatalog.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

using GSP::Interpreter::ChangeEvent;
using GSP::Interpreter::NamedWidgetCatalog;
using GSP::Interpreter::ResolvedLayout;
using GSP::Interpreter::StreamInterpreter;
using GSP::Interpreter::StreamReader;
using GSP::Interpreter::StreamStats;
using Json = nlohmann::json;

constexpr int kExitNotReady = 3;

struct ReplayOptions {
    std::optional<std::string>           input;
    GSP::Interpreter::InterpreterOptions interpreter = GSP::Interpreter::interpreterOptionsFromEnvironment();
    std::optional<NamedWidgetCatalog>    catalog;
    int                                  indent        = 2;
    bool                                 quiet         = false;
    bool                                 require_ready = false;
    bool                                 show_help     = false;
};

auto parse_catalog(std::string_view list) -> NamedWidgetCatalog {
    NamedWidgetCatalog catalog;
    while (!list.empty()) {
        auto comma = list.find(',');
        catalog.add(list.substr(0, comma));
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }
    return catalog;
}

auto parse_cli(int argc, char** argv, ReplayOptions& options, std::string& usage) -> bool {
    using GSP::Cli::CommandLine;
    CommandLine cli;
    cli.set_program_name("gsp_replay");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });
    cli.set_positional_handler([&](std::string_view token) -> CommandLine::ParseError {
        if (options.input) {
            return std::string{"only one input stream may be given"};
        }
        options.input = std::string(token);
        return std::nullopt;
    });

    cli.add_size("--max-nodes", {.on_value = [&](std::size_t value) { options.interpreter.max_nodes = value; },
                                 .help     = "Maximum buffered node ids (0 = unlimited)"});
    cli.add_size("--max-line-bytes", {.on_value = [&](std::size_t value) { options.interpreter.max_line_bytes = value; },
                                      .help     = "Reject lines longer than this"});
    cli.add_size("--max-depth", {.on_value = [&](std::size_t value) { options.interpreter.max_depth = value; },
                                 .help     = "Reject lines nesting JSON deeper than this"});
    cli.add_value("--bind-marker", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                        if (value.empty()) {
                                            return std::string{"--bind-marker must not be empty"};
                                        }
                                        options.interpreter.bind_marker.assign(value.begin(), value.end());
                                        return std::nullopt;
                                    },
                                    .value_name = "key",
                                    .help       = "Object key marking a state binding (default $bind)"});
    cli.add_value("--catalog", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                    options.catalog = parse_catalog(value);
                                    return std::nullopt;
                                },
                                .value_name = "kinds",
                                .help       = "Comma separated widget kinds; unknown kinds are reported"});
    cli.add_value("--indent", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                   int  indent = 0;
                                   auto result = std::from_chars(value.data(), value.data() + value.size(), indent);
                                   if (result.ec != std::errc{} || result.ptr != value.data() + value.size()) {
                                       return std::string{"--indent must be numeric"};
                                   }
                                   options.indent = indent;
                                   return std::nullopt;
                               },
                               .value_name = "n",
                               .help       = "Summary JSON indent (-1 for compact)"});
    cli.add_flag("--quiet", {.on_set = [&] { options.quiet = true; }, .help = "Do not print notifications"});
    cli.add_flag("--require-ready", {.on_set = [&] { options.require_ready = true; },
                                     .help   = "Exit with status 3 if the layout never became ready"});
    cli.add_flag("--help", {.on_set = [&] { options.show_help = true; }, .help = "Show this message"});
    cli.add_alias("-h", "--help");
    cli.add_alias("-q", "--quiet");

    auto ok = cli.parse(argc, argv);
    usage   = cli.usage() + "Reads a line-delimited JSON stream from <file> or stdin ('-').\n";
    return ok;
}

auto value_to_json(GSP::Interpreter::ResolvedValue const& value) -> Json {
    if (value.isMissing()) {
        return Json{{"$missing", value.binding.value_or(std::string{})}};
    }
    return *value.value;
}

auto layout_to_json(ResolvedLayout const& layout) -> Json {
    Json nodes = Json::array();
    for (auto const& node : layout.nodes) {
        Json properties = Json::object();
        for (auto const& [name, value] : node.properties) {
            properties[name] = value_to_json(value);
        }
        nodes.push_back(Json{{"id", node.id},
                             {"type", node.kind},
                             {"depth", node.depth},
                             {"properties", std::move(properties)},
                             {"children", node.children}});
    }
    return Json{{"rootId", layout.root_id}, {"nodes", std::move(nodes)}, {"missing", layout.missing}};
}

auto summary_to_json(StreamInterpreter const& interpreter,
                     StreamStats const&       stats,
                     ReplayOptions const&     options) -> Json {
    Json summary{{"ready", interpreter.isReady()},
                 {"nodes", interpreter.nodeCount()},
                 {"stats", Json{{"lines", stats.lines},
                                {"applied", stats.applied},
                                {"skipped", stats.skipped},
                                {"errors", stats.errors}}},
                 {"state", interpreter.stateSnapshot()}};
    if (auto const& session = interpreter.session()) {
        summary["session"] = Json{{"id", session->session_id}, {"headers", session->header_count}};
        if (session->format_version) {
            summary["session"]["formatVersion"] = *session->format_version;
        }
    }
    if (auto layout = interpreter.currentLayout()) {
        summary["layout"] = layout_to_json(*layout);
        if (options.catalog) {
            summary["unsupportedKinds"] = GSP::Interpreter::findUnsupportedKinds(*layout, *options.catalog);
        }
    } else {
        summary["layout"]  = nullptr;
        summary["waiting"] = interpreter.missingNodes();
    }
    return summary;
}

} // namespace

int main(int argc, char** argv) {
#ifdef GSP_LOG_DEBUG
    GSP::set_thread_name("Replay");
    GSP::configure_logging_from_environment();
#endif
    ReplayOptions options;
    std::string   usage;
    if (!parse_cli(argc, argv, options, usage)) {
        std::cerr << usage;
        return EXIT_FAILURE;
    }
    if (options.show_help) {
        std::cout << usage;
        return EXIT_SUCCESS;
    }

    std::ifstream file;
    std::istream* input = &std::cin;
    if (options.input && *options.input != "-") {
        file.open(*options.input);
        if (!file.is_open()) {
            std::cerr << "gsp_replay: failed to open '" << *options.input << "'" << std::endl;
            return EXIT_FAILURE;
        }
        input = &file;
    }

    StreamInterpreter interpreter{options.interpreter};
    if (!options.quiet) {
        interpreter.subscribe([](ChangeEvent const& event) {
            std::cout << "notify " << GSP::Interpreter::changeReasonToString(event.reason) << " #" << event.sequence
                      << " root=" << event.root_id;
            if (!event.changed_keys.empty()) {
                std::cout << " keys=";
                for (std::size_t i = 0; i < event.changed_keys.size(); ++i) {
                    std::cout << (i == 0 ? "" : ",") << event.changed_keys[i];
                }
            }
            std::cout << '\n';
        });
    }

    StreamReader reader{interpreter, [](GSP::Interpreter::LineError const& failure) {
                            std::cerr << "line " << failure.line_number << ": " << GSP::describeError(failure.error)
                                      << '\n';
                        }};
    auto stats = reader.run(*input);

    std::cout << summary_to_json(interpreter, stats, options).dump(options.indent) << std::endl;
#ifdef GSP_LOG_DEBUG
    GSP::logger().flush();
#endif
    if (options.require_ready && !interpreter.isReady()) {
        return kExitNotReady;
    }
    return EXIT_SUCCESS;
}
