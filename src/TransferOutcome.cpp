#include "TransferOutcome.hpp"

std::string outcome_kind_name(TransferOutcome::Kind kind) {
    switch (kind) {
        case TransferOutcome::Kind::Success:
            return "Success";
        case TransferOutcome::Kind::SourceIoError:
            return "SourceIoError";
        case TransferOutcome::Kind::TransportError:
            return "TransportError";
        case TransferOutcome::Kind::HttpStatusError:
            return "HttpStatusError";
    }
    return "Unknown";
}

std::string describe_outcome(const TransferOutcome& outcome) {
    switch (outcome.kind) {
        case TransferOutcome::Kind::Success:
            return "Request completed successfully";
        case TransferOutcome::Kind::SourceIoError:
            return "Error reading file: " + outcome.message;
        case TransferOutcome::Kind::TransportError:
            return "Error uploading chunk: " + outcome.message;
        case TransferOutcome::Kind::HttpStatusError:
            return "Http Error uploading chunk: " + outcome.message;
    }
    return outcome.message;
}
