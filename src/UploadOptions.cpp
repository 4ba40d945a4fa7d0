#include "UploadOptions.hpp"
#include <charconv>
#include <fstream>
#include <set>
#include <sstream>
#include "UploadRequest.hpp"

namespace {

bool parse_u64(const std::string& text, uint64_t& value) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last;
}

// Options that consume the following argument
const std::set<std::string>& options_with_value() {
    static const std::set<std::string> names = {
        "-f", "--file", "-r", "--range", "--file-range", "-c", "--chunk",
        "-u", "--url", "-m", "--method", "--config", "--log-level"};
    return names;
}

ParseResult error_result(const std::string& message) {
    ParseResult result;
    result.action = ParseResult::Action::Error;
    result.message = message;
    return result;
}

}

bool parse_byte_range(const std::string& text, uint64_t& start, uint64_t& end) {
    auto dash = text.find('-');
    if (dash == std::string::npos || text.find('-', dash + 1) != std::string::npos) {
        return false;
    }
    uint64_t first = 0;
    uint64_t last = 0;
    if (!parse_u64(text.substr(0, dash), first) || !parse_u64(text.substr(dash + 1), last)) {
        return false;
    }
    if (first > last) {
        return false;
    }
    start = first;
    end = last;
    return true;
}

bool parse_log_level(const std::string& name, trantor::Logger::LogLevel& level) {
    if (name == "trace") {
        level = trantor::Logger::kTrace;
    } else if (name == "debug") {
        level = trantor::Logger::kDebug;
    } else if (name == "info") {
        level = trantor::Logger::kInfo;
    } else if (name == "warn") {
        level = trantor::Logger::kWarn;
    } else if (name == "error") {
        level = trantor::Logger::kError;
    } else {
        return false;
    }
    return true;
}

bool apply_config(const Json::Value& config, UploadOptions& options, std::string& error) {
    if (!config.isObject()) {
        error = "Config must be a JSON object";
        return false;
    }
    if (config.isMember("file")) {
        if (!config["file"].isString()) {
            error = "Config 'file' must be a string";
            return false;
        }
        options.file = config["file"].asString();
    }
    if (config.isMember("url")) {
        if (!config["url"].isString()) {
            error = "Config 'url' must be a string";
            return false;
        }
        options.url = config["url"].asString();
    }
    if (config.isMember("method")) {
        if (!config["method"].isString() || !parse_http_method(config["method"].asString(), options.method)) {
            error = "Invalid HTTP method in config: " + config["method"].toStyledString();
            return false;
        }
    }
    if (config.isMember("chunk_size")) {
        const auto& chunk = config["chunk_size"];
        if (!chunk.isUInt64() || chunk.asUInt64() == 0) {
            error = "Config 'chunk_size' must be a positive integer";
            return false;
        }
        options.chunkSize = chunk.asUInt64();
    }
    if (config.isMember("range")) {
        const auto& range = config["range"];
        uint64_t start = 0;
        uint64_t end = 0;
        if (range.isString()) {
            if (!parse_byte_range(range.asString(), start, end)) {
                error = "Invalid byte range in config: " + range.asString();
                return false;
            }
        } else if (range.isObject() && range["start"].isUInt64() && range["end"].isUInt64()) {
            start = range["start"].asUInt64();
            end = range["end"].asUInt64();
            if (start > end) {
                error = "Config range start " + std::to_string(start) + " is after its end " + std::to_string(end);
                return false;
            }
        } else {
            error = "Config 'range' must be \"START-END\" or {\"start\": N, \"end\": N}";
            return false;
        }
        options.range = std::make_pair(start, end);
    }
    if (config.isMember("print_file_bytes")) {
        if (!config["print_file_bytes"].isBool()) {
            error = "Config 'print_file_bytes' must be a boolean";
            return false;
        }
        options.printFileBytes = config["print_file_bytes"].asBool();
    }
    if (config.isMember("progress")) {
        if (!config["progress"].isBool()) {
            error = "Config 'progress' must be a boolean";
            return false;
        }
        options.progress = config["progress"].asBool();
    }
    if (config.isMember("log_level")) {
        trantor::Logger::LogLevel level;
        if (!config["log_level"].isString() || !parse_log_level(config["log_level"].asString(), level)) {
            error = "Invalid log level in config: " + config["log_level"].toStyledString();
            return false;
        }
        options.logLevel = config["log_level"].asString();
    }
    return true;
}

bool load_config_file(const std::string& path, UploadOptions& options, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "Cannot open config file '" + path + "'";
        return false;
    }
    Json::CharReaderBuilder builder;
    Json::Value config;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &config, &errs)) {
        error = "Config file '" + path + "' is not valid JSON: " + errs;
        return false;
    }
    return apply_config(config, options, error);
}

ParseResult parse_command_line(const std::vector<std::string>& args) {
    ParseResult result;
    const auto& withValue = options_with_value();

    // Config first so that command line options override it
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                return error_result("Missing config path after argument '--config'");
            }
            result.options.configPath = args[i + 1];
            std::string error;
            if (!load_config_file(result.options.configPath, result.options, error)) {
                return error_result(error);
            }
            ++i;
        } else if (withValue.count(args[i])) {
            ++i;
        }
    }

    auto& options = result.options;
    size_t i = 0;
    while (i < args.size()) {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size();
        if (arg == "-f" || arg == "--file") {
            if (!hasValue) {
                return error_result("Missing file path after argument '" + arg + "'");
            }
            options.file = args[++i];
        } else if (arg == "-r" || arg == "--range" || arg == "--file-range") {
            if (!hasValue) {
                return error_result("Missing byte range after argument '" + arg + "'");
            }
            uint64_t start = 0;
            uint64_t end = 0;
            if (!parse_byte_range(args[i + 1], start, end)) {
                return error_result("Invalid byte range of " + args[i + 1]);
            }
            options.range = std::make_pair(start, end);
            ++i;
        } else if (arg == "-c" || arg == "--chunk") {
            if (!hasValue) {
                return error_result("Missing chunk size after argument '" + arg + "'");
            }
            uint64_t chunk = 0;
            if (!parse_u64(args[i + 1], chunk)) {
                return error_result("Invalid chunk size '" + args[i + 1] + "'");
            }
            if (chunk == 0) {
                return error_result("Chunk size must be greater than 0");
            }
            options.chunkSize = chunk;
            ++i;
        } else if (arg == "-u" || arg == "--url") {
            if (!hasValue) {
                return error_result("Missing URL with '" + arg + "'");
            }
            options.url = args[++i];
        } else if (arg == "-m" || arg == "--method") {
            if (!hasValue) {
                return error_result("Missing HTTP method after argument '" + arg + "'");
            }
            if (!parse_http_method(args[i + 1], options.method)) {
                return error_result("Invalid HTTP method '" + args[i + 1] + "'");
            }
            ++i;
        } else if (arg == "-fb" || arg == "--file-bytes") {
            options.printFileBytes = true;
        } else if (arg == "-p" || arg == "--progress") {
            options.progress = true;
        } else if (arg == "--log-level") {
            if (!hasValue) {
                return error_result("Missing log level after argument '" + arg + "'");
            }
            trantor::Logger::LogLevel level;
            if (!parse_log_level(args[i + 1], level)) {
                return error_result("Invalid log level '" + args[i + 1] + "'");
            }
            options.logLevel = args[++i];
        } else if (arg == "--config") {
            ++i;    // already applied
        } else if (arg == "-h" || arg == "--help") {
            result.action = ParseResult::Action::Help;
            result.message = help_text();
            return result;
        } else if (arg == "-v" || arg == "--version") {
            result.action = ParseResult::Action::Version;
            result.message = version_text();
            return result;
        } else {
            return error_result("Unknown argument '" + arg + "', use '-h' or '--help' for help");
        }
        ++i;
    }

    if (options.file.empty()) {
        return error_result("No file was given, use '-f' or '--file' to specify a file");
    }
    if (options.url.empty()) {
        return error_result("No URL was given, use '-u' or '--url' to specify a URL");
    }
    return result;
}

bool resolve_range(const UploadOptions& options, uint64_t fileSize, uint64_t& start, uint64_t& end, std::string& error) {
    if (!options.range) {
        start = 0;
        end = fileSize;
        return true;
    }
    if (options.range->second > fileSize) {
        error = "Byte range of " + std::to_string(options.range->second) + " is larger than the file's size of " + std::to_string(fileSize);
        return false;
    }
    start = options.range->first;
    end = options.range->second;
    return true;
}

std::string help_text() {
    std::ostringstream help;
    help << "Chunk Uploader - Help\n";
    help << "\t -f, --file        File to upload \n";
    help << "\t -c, --chunk       Chunk size to use for upload (Default: " << kDefaultChunkSize << ") \n";
    help << "\t -u, --url         URL to upload to \n";
    help << "\t -r, --range       Byte range of the file to upload e.g. 0-1000 for first 1000 bytes (Default: Input file's byte range [0-filesize]) \n";
    help << "\t -m, --method      HTTP Method to use (Default: PUT) \n";
    help << "\t -fb, --file-bytes Print the file size before uploading \n";
    help << "\t -p, --progress    Print a JSON progress line after every chunk \n";
    help << "\t --config          JSON file with default options (command line wins) \n";
    help << "\t --log-level       trace, debug, info, warn or error (Default: error) \n";
    help << "\t -h, --help        Show help (This command) \n";
    help << "\t -v, --version     Show version \n";
    return help.str();
}

std::string version_text() {
    return "V0.1.0";
}
