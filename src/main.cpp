/**
 * @file main.cpp
 * @brief soon CLI - convert, validate and stream SOON documents
 */

#include "soon/soon.h"
#include "soon/config.h"
#include "soon/json_interop.h"

#include "nlohmann/json.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using ordered_json = nlohmann::ordered_json;

using namespace soon;

namespace {

enum class Mode {
    ToJson,
    FromJson,
    Reformat,
    Validate,
    Stream,
    Tokens
};

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::ToJson:   return "to-json";
        case Mode::FromJson: return "from-json";
        case Mode::Reformat: return "reformat";
        case Mode::Validate: return "validate";
        case Mode::Stream:   return "stream";
        case Mode::Tokens:   return "tokens";
    }
    return "unknown";
}

void print_usage() {
    std::cout << "Usage: soon [MODE] [OPTIONS] [FILE]\n\n";
    std::cout << "Reads FILE (or stdin when FILE is omitted or '-').\n";
    std::cout << "\nModes:\n";
    std::cout << "  --to-json                 SOON to JSON (default)\n";
    std::cout << "  --from-json               JSON to SOON\n";
    std::cout << "  --reformat                SOON to canonical SOON\n";
    std::cout << "  --validate                Check that the input decodes\n";
    std::cout << "  --stream                  Decode |id| delimited chunks incrementally,\n";
    std::cout << "                            one JSON line per chunk\n";
    std::cout << "  --tokens                  Dump the token stream\n";
    std::cout << "\nDecode Options:\n";
    std::cout << "  --allow-duplicate-keys    Last duplicate key wins instead of failing\n";
    std::cout << "  --max-depth N             Maximum nesting depth (default: 100)\n";
    std::cout << "  --strict                  Reject malformed lines instead of skipping them\n";
    std::cout << "\nEncode Options:\n";
    std::cout << "  --indent N                Spaces per level (default: 2; JSON output too)\n";
    std::cout << "  --sort-keys               Sort record keys\n";
    std::cout << "  --compact                 Small flat records on one line\n";
    std::cout << "\nGeneral:\n";
    std::cout << "  --output PATH             Write to PATH instead of stdout\n";
    std::cout << "  --config PATH             Config file (default: " << default_config_path() << ")\n";
    std::cout << "  --verbose                 Log progress to stderr\n";
    std::cout << "  --version                 Print version\n";
    std::cout << "  --help                    Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  soon data.soon                      # print as JSON\n";
    std::cout << "  soon --from-json --compact data.json\n";
    std::cout << "  producer | soon --stream\n";
    std::cout << std::endl;
}

bool read_input(const std::string& path, std::string& out, std::string& error) {
    std::ostringstream ss;
    if (path.empty() || path == "-") {
        ss << std::cin.rdbuf();
        out = ss.str();
        return true;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open input file: " + path;
        return false;
    }
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

bool write_output(const std::string& path, const std::string& text, std::string& error) {
    if (path.empty()) {
        std::cout << text;
        if (text.empty() || text.back() != '\n') {
            std::cout << "\n";
        }
        std::cout.flush();
        return true;
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        error = "Failed to open output file: " + path;
        return false;
    }
    out << text;
    if (text.empty() || text.back() != '\n') {
        out << "\n";
    }
    return true;
}

std::string dump_tokens(const std::vector<Token>& tokens) {
    std::ostringstream oss;
    for (const auto& token : tokens) {
        oss << token.line() << ":" << token.column() << "\t" << token_type_name(token.type);
        if (!token.text.empty() && token.type != TokenType::Newline) {
            oss << "\t" << (token.raw ? *token.raw : token.text);
        }
        oss << "\n";
    }
    return oss.str();
}

void report_error(const SOONError& e) {
    const auto* decode_error = dynamic_cast<const DecodeError*>(&e);
    if (decode_error) {
        std::cerr << "[soon] " << decode_error->format() << std::endl;
    } else {
        std::cerr << "[soon] " << e.kind() << ": " << e.what() << std::endl;
    }
}

// Feeds the input through a StreamParser in fixed-size blocks
int run_stream(std::istream& in, const CodecConfig& config, int json_indent, std::ostream& out) {
    StreamOptions options;
    options.parser = config.decode;
    options.verbose = config.verbose;

    int failures = 0;
    StreamParser stream(options);
    stream.on_chunk([&out, json_indent](const Chunk& chunk) {
        ordered_json line = ordered_json::object();
        line["id"] = chunk.id;
        line["value"] = to_json_value(chunk.value);
        out << line.dump(json_indent > 0 ? -1 : json_indent, ' ', false,
                         ordered_json::error_handler_t::replace) << std::endl;
    });
    stream.on_error([&failures](const DecodeError& e) {
        ++failures;
        std::cerr << "[soon] chunk " << e.format() << std::endl;
    });

    std::vector<char> block(4096);
    while (in.read(block.data(), static_cast<std::streamsize>(block.size())) || in.gcount() > 0) {
        stream.write(std::string(block.data(), static_cast<size_t>(in.gcount())));
    }
    stream.end();

    if (config.verbose) {
        std::cerr << "[soon] Stream finished: " << stream.chunks_emitted() << " chunks, "
                  << failures << " errors" << std::endl;
    }
    return failures > 0 ? 1 : 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path = default_config_path();
    for (int i = 1; i + 1 < argc; i++) {
        if (std::string(argv[i]) == "--config") {
            config_path = argv[i + 1];
        }
    }

    // Config file first; command-line flags override it
    CodecConfig config;
    std::string config_error;
    bool config_loaded = load_config_file(config_path, config, config_error);
    if (!config_error.empty()) {
        std::cerr << "[soon] " << config_error << std::endl;
        return 2;
    }

    Mode mode = Mode::ToJson;
    std::string input_path;
    std::string output_path;
    int json_indent = 2;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            }
            else if (arg == "--version") {
                std::cout << "soon " << VERSION << std::endl;
                return 0;
            }
            else if (arg == "--to-json") {
                mode = Mode::ToJson;
            }
            else if (arg == "--from-json") {
                mode = Mode::FromJson;
            }
            else if (arg == "--reformat") {
                mode = Mode::Reformat;
            }
            else if (arg == "--validate") {
                mode = Mode::Validate;
            }
            else if (arg == "--stream") {
                mode = Mode::Stream;
            }
            else if (arg == "--tokens") {
                mode = Mode::Tokens;
            }
            else if (arg == "--allow-duplicate-keys") {
                config.decode.allow_duplicate_keys = true;
            }
            else if (arg == "--max-depth" && i + 1 < argc) {
                config.decode.max_depth = std::stoi(argv[++i]);
            }
            else if (arg == "--strict") {
                config.decode.strict = true;
            }
            else if (arg == "--indent" && i + 1 < argc) {
                config.encode.indent = std::stoi(argv[++i]);
                json_indent = config.encode.indent;
            }
            else if (arg == "--sort-keys") {
                config.encode.sort_keys = true;
            }
            else if (arg == "--compact") {
                config.encode.compact = true;
            }
            else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            }
            else if (arg == "--config" && i + 1 < argc) {
                ++i;  // already applied
            }
            else if (arg == "--verbose") {
                config.verbose = true;
            }
            else if (arg == "-" || (!arg.empty() && arg[0] != '-')) {
                if (!input_path.empty()) {
                    std::cerr << "[soon] Only one input file may be given" << std::endl;
                    return 2;
                }
                input_path = arg;
            }
            else {
                std::cerr << "[soon] Unknown option: " << arg << "\n\n";
                print_usage();
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[soon] Invalid argument: " << e.what() << std::endl;
        return 2;
    }

    if (config.verbose) {
        if (config_loaded) {
            std::cerr << "[soon] Loaded config: " << config_path << std::endl;
        }
        std::cerr << "[soon] Mode: " << mode_name(mode)
                  << ", input: " << (input_path.empty() ? "<stdin>" : input_path) << std::endl;
    }

    if (mode == Mode::Stream) {
        std::ofstream file_out;
        if (!output_path.empty()) {
            file_out.open(output_path, std::ios::binary);
            if (!file_out) {
                std::cerr << "[soon] Failed to open output file: " << output_path << std::endl;
                return 1;
            }
        }
        std::ostream& out = output_path.empty() ? std::cout : file_out;

        if (input_path.empty() || input_path == "-") {
            return run_stream(std::cin, config, json_indent, out);
        }
        std::ifstream in(input_path, std::ios::binary);
        if (!in) {
            std::cerr << "[soon] Failed to open input file: " << input_path << std::endl;
            return 1;
        }
        return run_stream(in, config, json_indent, out);
    }

    std::string input;
    std::string io_error;
    if (!read_input(input_path, input, io_error)) {
        std::cerr << "[soon] " << io_error << std::endl;
        return 1;
    }
    if (config.verbose) {
        std::cerr << "[soon] Read " << input.size() << " bytes" << std::endl;
    }

    std::string output;
    try {
        switch (mode) {
            case Mode::ToJson:
                output = to_json(input, config.decode, json_indent);
                break;
            case Mode::FromJson:
                output = from_json(input, config.encode);
                break;
            case Mode::Reformat:
                output = encode(decode(input, config.decode), config.encode);
                break;
            case Mode::Validate: {
                ValidationResult result = validate(input, config.decode);
                if (!result.valid) {
                    std::cerr << "[soon] " << result.details << std::endl;
                    return 1;
                }
                output = "valid";
                break;
            }
            case Mode::Tokens:
                output = dump_tokens(tokenize(input));
                break;
            case Mode::Stream:
                break;
        }
    } catch (const SOONError& e) {
        report_error(e);
        return 1;
    }

    if (!write_output(output_path, output, io_error)) {
        std::cerr << "[soon] " << io_error << std::endl;
        return 1;
    }
    if (config.verbose) {
        std::cerr << "[soon] Wrote " << output.size() << " bytes" << std::endl;
    }
    return 0;
}
