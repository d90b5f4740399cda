/// uadump: decode an OPC UA encoded file and print it as JSON.
/// Usage: ./uadump [options] <file>
///   --format binary|xml|json     input encoding (default: from the file extension)
///   --json-input <encoding>      JSON encoding of the input (default Reversible)
///   --output <encoding>          JSON encoding to print (default Verbose)
///   --variant                    binary input is a Variant instead of an ExtensionObject
///   --namespace <uri>            append a namespace URI to the table (repeatable)
///   --limits <file.json>         EncodingLimits overrides
///   --verbose                    debug logging on stderr
///   --version                    print library and OPC UA versions
///
/// No structure types are registered, so bodies stay opaque and are printed
/// with their encoding id.

#include <ua/ua.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Options {
    std::string path;
    std::optional<ua::EncodingType> format;
    ua::JsonEncoding json_input = ua::JsonEncoding::Reversible;
    ua::JsonEncoding output = ua::JsonEncoding::Verbose;
    bool variant = false;
    std::vector<std::string> namespaces;
    std::string limits_path;
    bool verbose = false;
    bool version = false;
};

void usage() {
    std::cerr << "Usage: uadump [--format binary|xml|json] [--json-input ENC] [--output ENC]\n"
                 "              [--variant] [--namespace URI]... [--limits FILE] [--verbose] FILE\n"
                 "       uadump --version\n";
}

std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open " + path);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::optional<ua::EncodingType> format_from_name(const std::string& name) {
    if (name == "binary" || name == "bin" || name == "uabinary") return ua::EncodingType::Binary;
    if (name == "xml") return ua::EncodingType::Xml;
    if (name == "json") return ua::EncodingType::Json;
    return std::nullopt;
}

ua::JsonEncoding json_encoding_arg(const std::string& name) {
    auto encoding = ua::json_encoding_from_name(name);
    if (!encoding) throw std::invalid_argument("Unknown JSON encoding '" + name + "'");
    return *encoding;
}

Options parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
            return argv[++i];
        };
        if (arg == "--format") {
            std::string name = next();
            opts.format = format_from_name(name);
            if (!opts.format) throw std::invalid_argument("Unknown format '" + name + "'");
        } else if (arg == "--json-input") {
            opts.json_input = json_encoding_arg(next());
        } else if (arg == "--output") {
            opts.output = json_encoding_arg(next());
        } else if (arg == "--variant") {
            opts.variant = true;
        } else if (arg == "--namespace") {
            opts.namespaces.push_back(next());
        } else if (arg == "--limits") {
            opts.limits_path = next();
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--version") {
            opts.version = true;
            return opts;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option " + arg);
        } else {
            opts.path = arg;
        }
    }
    if (opts.path.empty()) throw std::invalid_argument("No input file");
    if (!opts.format) {
        auto dot = opts.path.rfind('.');
        if (dot != std::string::npos) opts.format = format_from_name(opts.path.substr(dot + 1));
        if (!opts.format) opts.format = ua::EncodingType::Binary;
    }
    return opts;
}

ua::EncodingLimits load_limits(const std::string& path) {
    if (path.empty()) return {};
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open " + path);
    return nlohmann::json::parse(in).get<ua::EncodingLimits>();
}

} // anonymous namespace

int main(int argc, char** argv) {
    auto logger = spdlog::stderr_color_mt("uadump");
    spdlog::set_default_logger(logger);

    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "uadump: " << e.what() << "\n";
        usage();
        return 2;
    }
    if (opts.version) {
        std::cout << "uadump " << ua::LIBRARY_VERSION << " (OPC UA " << ua::OPCUA_VERSION << ")\n";
        return 0;
    }
    if (opts.verbose) spdlog::set_level(spdlog::level::debug);

    try {
        ua::MessageContext context(ua::UriTable::namespaces(), std::make_shared<ua::TypeRegistry>(),
                                   load_limits(opts.limits_path));
        for (const auto& uri : opts.namespaces) context.namespace_uris.get_or_append(uri);

        auto data = read_file(opts.path);
        ua::LimitsGuard(context.limits).check_message_size(data.size());
        spdlog::debug("Read {} bytes of {} from {}", data.size(), ua::encoding_type_name(*opts.format),
                      opts.path);

        ua::JsonEncoderOptions out_options;
        out_options.encoding = opts.output;
        ua::JsonEncoder out(context, out_options);

        std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
        switch (*opts.format) {
            case ua::EncodingType::Binary: {
                ua::BinaryDecoder decoder(data, context);
                if (opts.variant) {
                    out.write_variant("Value", decoder.read_variant(""));
                } else {
                    out.write_root(decoder.read_extension_object(""));
                }
                if (decoder.remaining() != 0) {
                    spdlog::warn("{} trailing bytes ignored", decoder.remaining());
                }
                break;
            }
            case ua::EncodingType::Xml: {
                ua::XmlDecoder decoder(text, context);
                out.write_root(decoder.read_root());
                break;
            }
            case ua::EncodingType::Json: {
                ua::JsonDecoder decoder(text, context, opts.json_input);
                out.write_root(decoder.read_root());
                break;
            }
        }
        std::cout << out.document().dump(2) << "\n";
    } catch (const ua::UaError& e) {
        spdlog::error("{} ({})", e.what(), ua::status_symbol(e.status));
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
