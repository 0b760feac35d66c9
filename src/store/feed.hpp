#pragma once
#include <string>

namespace tcplat {
enum class Feed { Raw, Averaged };

inline const char* feed_name(Feed feed) {
    switch (feed) {
        case Feed::Raw: return "raw";
        case Feed::Averaged: return "averaged";
    }
    return "?";
}

// Data file name suffix; "<kind>.<suffix>". The averaged file is reserved and never opened.
inline const char* feed_file_suffix(Feed feed) {
    switch (feed) {
        case Feed::Raw: return "data.dat";
        case Feed::Averaged: return "averaged.dat";
    }
    return "?";
}
}  // namespace tcplat
