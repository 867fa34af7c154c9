#include "skiff/TransferTypes.hpp"

namespace skiff {

TransferOutcome TransferOutcome::succeeded(std::string source,
                                           std::optional<std::string> destination) {
    TransferOutcome o;
    o.status = Status::Succeeded;
    o.source = std::move(source);
    o.destination = std::move(destination);
    return o;
}

TransferOutcome TransferOutcome::skipped(std::string source, std::string reason) {
    TransferOutcome o;
    o.status = Status::Skipped;
    o.source = std::move(source);
    o.reason = std::move(reason);
    return o;
}

TransferOutcome TransferOutcome::failed(std::string source, Error error) {
    TransferOutcome o;
    o.status = Status::Failed;
    o.source = std::move(source);
    o.error = std::move(error);
    return o;
}

const char *directionName(Direction d) {
    return d == Direction::Upload ? "upload" : "download";
}

} // namespace skiff
