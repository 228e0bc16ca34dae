#include "cli/RenderCli.hpp"

#include "cli/CommandLine.hpp"
#include "log/TaggedLogger.hpp"

#include <htmlframe/template/TemplateJson.hpp>

#include <fstream>
#include <iostream>

namespace HF::Cli {

namespace {

auto make_parser(RenderCliOptions& options) -> CommandLine {
    CommandLine cli{"htmlframe_render"};
    cli.add_string("--template", options.template_key, "template key or path (required)", "KEY");
    cli.add_string("--title", options.title, "value for {{title}}", "TEXT");
    cli.add_string("--text", options.text, "value for {{text}} (required)", "TEXT");
    cli.add_string("--image", options.image, "image path or URI for {{image}}", "REF");
    cli.add_value("--set", CommandLine::ValueOption{
                               .on_value = [&options](std::string_view value) -> CommandLine::ParseError {
                                   auto equals = value.find('=');
                                   if (equals == std::string_view::npos || equals == 0) {
                                       return std::string{"--set expects name=value, got '"} + std::string{value} + "'";
                                   }
                                   options.assignments.emplace_back(std::string{value.substr(0, equals)},
                                                                    std::string{value.substr(equals + 1)});
                                   return std::nullopt;
                               },
                               .metavar = "NAME=VALUE",
                               .help    = "set a template parameter (repeatable)"});
    cli.add_value("--vars", CommandLine::ValueOption{
                                .on_value = [&options](std::string_view value) -> CommandLine::ParseError {
                                    options.vars_file = std::filesystem::path{std::string{value}};
                                    return std::nullopt;
                                },
                                .metavar = "FILE",
                                .help    = "JSON object of template parameters"});
    cli.add_value("--output", CommandLine::ValueOption{
                                  .on_value = [&options](std::string_view value) -> CommandLine::ParseError {
                                      if (value.empty()) {
                                          return std::string{"--output must not be empty"};
                                      }
                                      options.output = std::filesystem::path{std::string{value}};
                                      return std::nullopt;
                                  },
                                  .metavar = "PNG",
                                  .help    = "output file (default: <output dir>/frame_<id>.png)"});
    cli.add_value("--config", CommandLine::ValueOption{
                                  .on_value = [&options](std::string_view value) -> CommandLine::ParseError {
                                      options.config_file = std::filesystem::path{std::string{value}};
                                      return std::nullopt;
                                  },
                                  .metavar = "FILE",
                                  .help    = "JSON frame configuration"});
    cli.add_int("--timeout-ms", CommandLine::IntOption{
                                    .on_value = [&options](int value) -> CommandLine::ParseError {
                                        if (value <= 0) {
                                            return std::string{"--timeout-ms must be > 0"};
                                        }
                                        options.timeout_ms = value;
                                        return std::nullopt;
                                    },
                                    .metavar = "MS",
                                    .help    = "browser timeout per frame"});
    cli.add_flag("--schema", CommandLine::FlagOption{.on_set = [&options] { options.schema = true; },
                                                     .help   = "print the template parameters as JSON and exit"});
    cli.add_flag("--help", CommandLine::FlagOption{.on_set = [&options] { options.show_help = true; },
                                                   .help   = "show this help"});
    cli.add_alias("-h", "--help");
    cli.add_alias("-t", "--template");
    cli.add_alias("-o", "--output");
    return cli;
}

auto read_json_file(std::filesystem::path const& path) -> Expected<nlohmann::ordered_json> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot read " + path.string()});
    }
    auto json = nlohmann::ordered_json::parse(stream, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, path.string() + " is not valid JSON"});
    }
    return json;
}

auto error_text(Error const& error) -> std::string {
    return error.message.value_or(std::string{errorCodeToString(error.code)});
}

} // namespace

auto ParseRenderCliArguments(int argc, char** argv) -> std::optional<RenderCliOptions> {
    RenderCliOptions options{};
    auto             cli = make_parser(options);
    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    if (options.show_help) {
        return options;
    }
    if (options.template_key.empty()) {
        std::cerr << "htmlframe_render: --template is required\n";
        return std::nullopt;
    }
    if (!options.schema && options.text.empty()) {
        std::cerr << "htmlframe_render: --text is required\n";
        return std::nullopt;
    }
    return options;
}

void PrintRenderCliUsage(std::ostream& out) {
    RenderCliOptions scratch{};
    make_parser(scratch).print_usage(out);
}

auto BuildFrameConfig(RenderCliOptions const& options) -> Expected<FrameConfig> {
    FrameConfig config{};
    if (options.config_file) {
        auto loaded = LoadFrameConfigFile(*options.config_file);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    if (!ApplyFrameConfigEnvOverrides(config)) {
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid HTMLFRAME_* environment"});
    }
    if (options.timeout_ms) {
        config.render_timeout_ms = *options.timeout_ms;
    }
    if (auto problem = ValidateFrameConfig(config)) {
        return std::unexpected(Error{Error::Code::MalformedInput, *problem});
    }
    return config;
}

auto BuildFrameRequest(RenderCliOptions const& options) -> Expected<Render::FrameRequest> {
    Render::FrameRequest request{};
    request.title       = options.title;
    request.text        = options.text;
    request.image       = options.image;
    request.output_path = options.output;

    if (options.vars_file) {
        auto json = read_json_file(*options.vars_file);
        if (!json) {
            return std::unexpected(json.error());
        }
        auto context = Template::VariableContextFromJson(*json);
        if (!context) {
            return std::unexpected(context.error());
        }
        request.ext = std::move(*context);
    }
    for (auto const& [name, value] : options.assignments) {
        request.ext.set(name, value);
    }
    return request;
}

auto MakeSuccessResponse(std::filesystem::path const& frame, Template::FrameSize size) -> nlohmann::ordered_json {
    nlohmann::ordered_json response;
    response["success"]    = true;
    response["message"]    = "Success";
    response["frame_path"] = frame.string();
    response["width"]      = size.width;
    response["height"]     = size.height;
    return response;
}

auto MakeFailureResponse(std::string const& message) -> nlohmann::ordered_json {
    nlohmann::ordered_json response;
    response["success"] = false;
    response["message"] = message;
    return response;
}

auto RunRenderCli(RenderCliOptions const& options, std::ostream& out, Render::FrameGeneratorHooks hooks) -> int {
    auto fail = [&out](std::string const& message) {
        out << MakeFailureResponse(message).dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << '\n';
        return 1;
    };

    auto config = BuildFrameConfig(options);
    if (!config) {
        return fail(error_text(config.error()));
    }

    if (options.schema) {
        config->check_fonts = false;
    }
    auto generator = Render::FrameGenerator::FromKey(options.template_key, std::move(*config), std::move(hooks));
    if (!generator) {
        return fail(error_text(generator.error()));
    }

    if (options.schema) {
        out << Template::SerializeParameterSchema(generator->parameters()) << '\n';
        return 0;
    }

    auto request = BuildFrameRequest(options);
    if (!request) {
        return fail(error_text(request.error()));
    }

    auto frame = generator->generateFrame(*request);
    if (!frame) {
        return fail(error_text(frame.error()));
    }
    hf_log("Rendered " + frame->string(), "CLI");
    out << MakeSuccessResponse(*frame, generator->size())
               .dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << '\n';
    return 0;
}

} // namespace HF::Cli
