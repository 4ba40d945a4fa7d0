#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include "ChunkUploader.hpp"
#include "HttpChunkTransport.hpp"
#include "MappedFileSource.hpp"
#include "UploadOptions.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    ParseResult parsed = parse_command_line(args);
    switch (parsed.action) {
        case ParseResult::Action::Help:
        case ParseResult::Action::Version:
            std::cout << parsed.message << std::endl;
            return 0;
        case ParseResult::Action::Error:
            std::cout << parsed.message << std::endl;
            return 1;
        case ParseResult::Action::Upload:
            break;
    }
    const UploadOptions& options = parsed.options;

    trantor::Logger::LogLevel level = trantor::Logger::kError;
    if (!parse_log_level(options.logLevel, level)) {
        std::cout << "Invalid log level '" << options.logLevel << "'" << std::endl;
        return 1;
    }
    trantor::Logger::setLogLevel(level);
    // stdout carries the result lines
    trantor::Logger::setOutputFunction(
        [](const char* msg, const uint64_t len) { std::cerr.write(msg, static_cast<std::streamsize>(len)); },
        []() { std::cerr.flush(); });

    if (!std::filesystem::exists(options.file)) {
        std::cout << "File '" << options.file << "' does not exist" << std::endl;
        return 1;
    }
    std::unique_ptr<MappedFileSource> source;
    uint64_t fileSize = 0;
    try {
        source = std::make_unique<MappedFileSource>(options.file);
        fileSize = source->length();
    } catch (const SourceIoError& e) {
        std::cout << "Error opening file: " << e.what() << std::endl;
        return 1;
    }

    uint64_t rangeStart = 0;
    uint64_t rangeEnd = 0;
    std::string error;
    if (!resolve_range(options, fileSize, rangeStart, rangeEnd, error)) {
        std::cout << error << std::endl;
        return 1;
    }

    if (options.printFileBytes) {
        std::cout << "File size: " << fileSize << " bytes" << std::endl;
    }

    std::unique_ptr<HttpChunkTransport> transport;
    try {
        transport = std::make_unique<HttpChunkTransport>(options.url);
    } catch (const std::invalid_argument& e) {
        std::cout << "Invalid URL: " << e.what() << std::endl;
        return 1;
    }

    std::function<void(const Json::Value&)> progress;
    if (options.progress) {
        progress = [](const Json::Value& p) {
            Json::StreamWriterBuilder writer;
            writer["indentation"] = "";  // Compact output
            std::cout << Json::writeString(writer, p) << std::endl;
        };
    }

    UploadRequest request{*source, rangeStart, rangeEnd, options.chunkSize, options.url, options.method};
    ChunkUploader uploader(*transport);
    TransferOutcome outcome = uploader.upload(request, progress);
    std::cout << describe_outcome(outcome) << std::endl;
    return outcome.ok() ? 0 : 1;
}
