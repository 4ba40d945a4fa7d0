#pragma once
#include <cstdint>
#include <string>

struct TransferOutcome {
    enum class Kind {
        Success,
        SourceIoError,
        TransportError,
        HttpStatusError
    };

    Kind kind = Kind::Success;
    std::string message;
    int httpStatus = 0;     // only set for HttpStatusError
    uint64_t chunksSent = 0;
    uint64_t bytesSent = 0;

    bool ok() const { return kind == Kind::Success; }
};

std::string outcome_kind_name(TransferOutcome::Kind kind);

// One line for the console, e.g. "Http Error uploading chunk: <body>"
std::string describe_outcome(const TransferOutcome& outcome);
