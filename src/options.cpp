#include "bulkget/options.hpp"
#include "bulkget/error.hpp"

namespace bulkget {

void BatchOptions::validate() const {
    if (max_concurrent < 1) {
        throw TransferError::validation("maxConcurrent must be at least 1");
    }
    if (protocol.progress.interval.count() <= 0) {
        throw TransferError::validation("progress interval must be positive");
    }
    if (protocol.progress.chunk_interval < 1) {
        throw TransferError::validation("progress chunk interval must be at least 1");
    }
    if (protocol.http.connect_timeout.count() < 0 || protocol.http.low_speed_timeout.count() < 0) {
        throw TransferError::validation("HTTP timeouts cannot be negative");
    }
    if (metadata_retention.count() <= 0) {
        throw TransferError::validation("metadata retention must be positive");
    }
}

} // namespace bulkget
