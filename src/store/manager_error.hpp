#pragma once

namespace tcplat {
enum class ManagerError {
    Ok,
    OptionsFileIO,
    IndexFileIO,
    InvalidAddrArgument,
    InvalidInterval,
    FeedUnavailable,
    DataFileIO,
};

inline const char* error_name(ManagerError err) {
    switch (err) {
        case ManagerError::Ok: return "ok";
        case ManagerError::OptionsFileIO: return "options_file_io";
        case ManagerError::IndexFileIO: return "index_file_io";
        case ManagerError::InvalidAddrArgument: return "invalid_addr_argument";
        case ManagerError::InvalidInterval: return "invalid_interval";
        case ManagerError::FeedUnavailable: return "feed_unavailable";
        case ManagerError::DataFileIO: return "data_file_io";
    }
    return "?";
}
}  // namespace tcplat
