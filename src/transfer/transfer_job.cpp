#include "peerlink/transfer/transfer_job.hpp"

namespace peerlink::transfer {

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::QUEUED:    return "queued";
        case JobStatus::ACTIVE:    return "active";
        case JobStatus::PAUSED:    return "paused";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED:    return "failed";
        case JobStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED || status == JobStatus::CANCELLED;
}

bool can_transition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::QUEUED:
            return to == JobStatus::ACTIVE || to == JobStatus::PAUSED || to == JobStatus::CANCELLED;
        case JobStatus::ACTIVE:
            return to == JobStatus::QUEUED || to == JobStatus::PAUSED || to == JobStatus::COMPLETED ||
                   to == JobStatus::FAILED || to == JobStatus::CANCELLED;
        case JobStatus::PAUSED:
            return to == JobStatus::QUEUED || to == JobStatus::CANCELLED;
        case JobStatus::FAILED:
            return to == JobStatus::QUEUED || to == JobStatus::CANCELLED;
        case JobStatus::COMPLETED:
        case JobStatus::CANCELLED:
            return false;
    }
    return false;
}

}
