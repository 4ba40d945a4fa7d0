#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <drogon/HttpTypes.h>
#include <json/json.h>
#include <trantor/utils/Logger.h>

constexpr uint64_t kDefaultChunkSize = 5000000;

struct UploadOptions {
    std::string file;
    std::string url;
    std::optional<std::pair<uint64_t, uint64_t>> range;   // defaults to the whole file
    uint64_t chunkSize = kDefaultChunkSize;
    drogon::HttpMethod method = drogon::Put;
    bool printFileBytes = false;
    bool progress = false;
    std::string logLevel = "error";
    std::string configPath;
};

struct ParseResult {
    enum class Action {
        Upload,
        Help,
        Version,
        Error
    };

    Action action = Action::Upload;
    UploadOptions options;
    std::string message;
};

// args excludes the program name. Never exits; help, version and errors come back as the action.
// Options from --config are applied first, so command line values win regardless of order.
ParseResult parse_command_line(const std::vector<std::string>& args);

bool load_config_file(const std::string& path, UploadOptions& options, std::string& error);
bool apply_config(const Json::Value& config, UploadOptions& options, std::string& error);

// "START-END" of unsigned decimal integers, START <= END
bool parse_byte_range(const std::string& text, uint64_t& start, uint64_t& end);

bool parse_log_level(const std::string& name, trantor::Logger::LogLevel& level);

// Fills in the default range and checks the range end against the file size.
bool resolve_range(const UploadOptions& options, uint64_t fileSize, uint64_t& start, uint64_t& end, std::string& error);

std::string help_text();
std::string version_text();
