#include "transfer/work_item.hpp"

const char* to_string(transfer_status status) {
    switch (status) {
    case transfer_status::completed:
        return "completed";
    case transfer_status::skipped:
        return "skipped";
    case transfer_status::failed:
        return "failed";
    case transfer_status::cancelled:
        return "cancelled";
    }
    return "unknown";
}
