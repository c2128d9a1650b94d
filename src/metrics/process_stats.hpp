#pragma once
#include <cstdint>
#include <fstream>
#include <string>

#include <unistd.h>

namespace repcat {

inline double process_rss_mb() {
    long rss_pages = 0L;
    std::ifstream f("/proc/self/statm");
    long ignore = 0L;
    if (f) {
        f >> ignore >> rss_pages;
    }
    const long page = sysconf(_SC_PAGESIZE);
    return (rss_pages > 0 && page > 0)
        ? (static_cast<double>(rss_pages) * static_cast<double>(page)) / (1024.0 * 1024.0)
        : 0.0;
}

// High-water mark (VmHWM) from /proc/self/status, in MiB; 0 if unavailable.
inline double process_peak_rss_mb() {
    std::ifstream f("/proc/self/status");
    std::string key;
    while (f >> key) {
        if (key == "VmHWM:") {
            long kb = 0;
            f >> kb;
            return static_cast<double>(kb) / 1024.0;
        }
        f.ignore(4096, '\n');
    }
    return 0.0;
}

}
