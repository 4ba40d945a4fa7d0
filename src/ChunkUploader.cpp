#include "ChunkUploader.hpp"
#include <trantor/utils/Logger.h>
#include "ChunkReader.hpp"
#include "RangePlanner.hpp"

namespace {

constexpr int kStatusOk = 200;

TransferOutcome failure(TransferOutcome::Kind kind, const std::string& message, const TransferOutcome& sofar) {
    TransferOutcome outcome = sofar;
    outcome.kind = kind;
    outcome.message = message;
    return outcome;
}

}

ChunkUploader::ChunkUploader(ChunkTransport& transport) : transport_(transport) {}

TransferOutcome ChunkUploader::upload(const UploadRequest& request, std::function<void(const Json::Value&)> progress) {
    TransferOutcome outcome;
    ChunkReader reader(request.source);
    try {
        reader.seekTo(request.rangeStart);
    } catch (const SourceIoError& e) {
        LOG_WARN << "seek to " << request.rangeStart << " failed: " << e.what();
        return failure(TransferOutcome::Kind::SourceIoError, e.what(), outcome);
    }

    LOG_INFO << http_method_name(request.httpMethod) << " " << request.destinationUrl
             << " bytes " << request.rangeStart << "-" << request.rangeEnd
             << " in chunks of " << request.chunkSize;

    const uint64_t totalBytes = request.rangeEnd - request.rangeStart;
    RangePlanner planner(request.rangeStart, request.rangeEnd, request.chunkSize);
    while (planner.hasNext()) {
        ChunkBounds bounds = planner.next();
        ChunkPayload payload{};
        try {
            payload = reader.read(bounds);
        } catch (const SourceIoError& e) {
            LOG_WARN << "read of bytes " << bounds.offsetStart << "-" << bounds.offsetEnd << " failed: " << e.what();
            return failure(TransferOutcome::Kind::SourceIoError, e.what(), outcome);
        }

        // A short read still sends the whole zero-padded buffer
        const size_t bytesRead = payload.bytesRead;
        const size_t bodySize = payload.data.size();
        ChunkRequest chunk{request.httpMethod, format_content_range(bounds, request.rangeEnd), std::move(payload.data)};
        LOG_DEBUG << "Content-Range: " << chunk.contentRange << " (" << bytesRead << " of " << bodySize << " bytes read)";

        ChunkReply reply;
        try {
            reply = transport_.send(std::move(chunk));
        } catch (const std::exception& e) {
            LOG_WARN << "chunk at " << bounds.offsetStart << " not delivered: " << e.what();
            return failure(TransferOutcome::Kind::TransportError, e.what(), outcome);
        }
        if (reply.statusCode != kStatusOk) {
            LOG_WARN << "chunk at " << bounds.offsetStart << " rejected with status " << reply.statusCode;
            auto result = failure(TransferOutcome::Kind::HttpStatusError,
                                  reply.body.empty() ? std::string("Response body is empty") : reply.body, outcome);
            result.httpStatus = reply.statusCode;
            return result;
        }

        ++outcome.chunksSent;
        outcome.bytesSent += bodySize;
        if (progress) {
            Json::Value p;
            p["chunk"] = (Json::Value::UInt64)outcome.chunksSent;
            p["range_start"] = (Json::Value::UInt64)bounds.offsetStart;
            p["range_end"] = (Json::Value::UInt64)bounds.offsetEnd;
            p["content_range"] = format_content_range(bounds, request.rangeEnd);
            p["bytes_sent"] = (Json::Value::UInt64)outcome.bytesSent;
            p["total_bytes"] = (Json::Value::UInt64)totalBytes;
            p["progress"] = totalBytes == 0 ? 1.0 : (double)(bounds.offsetEnd - request.rangeStart) / (double)totalBytes;
            progress(p);
        }

        if (bytesRead == 0 || bytesRead < request.chunkSize) {
            if (planner.hasNext()) {
                LOG_INFO << "source ended at " << bounds.offsetStart + bytesRead << ", before range end " << request.rangeEnd;
            }
            break;
        }
    }

    LOG_INFO << "uploaded " << outcome.chunksSent << " chunk(s), " << outcome.bytesSent << " bytes";
    return outcome;
}
