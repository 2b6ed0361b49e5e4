#include "log.h"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

// One log per process
Log& Log::getInstance() {
    static Log instance;
    return instance;
}

Log::~Log() {
    if (logfile.is_open()) {
        logfile.close();
    }
}

bool Log::openLogFile(std::string_view filename) {
    std::lock_guard<std::mutex> lock(log_mutex);

    // Reopening the current file is a no-op
    if (logfile.is_open() && current_filename == filename) {
        return true;
    }

    if (logfile.is_open()) {
        logfile.close();
    }

    // Missing parent directories are created
    std::filesystem::path logPath(filename);
    std::error_code ec;
    if (logPath.has_parent_path() && !std::filesystem::exists(logPath.parent_path(), ec)) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
        if (ec) {
            std::cerr << "Error: Unable to create log directory (" << logPath.parent_path()
                      << "): " << ec.message() << "\n";
            return false;
        }
    }

    logfile.open(std::string(filename), std::ios::out | std::ios::app);
    if (logfile.is_open()) {
        current_filename = filename;
        if constexpr (DEBUG) {
            std::cerr << "Opened log file: " << filename << "\n";
        }
        return true;
    } else {
        std::cerr << "Error: Unable to open log file (" << filename << ")\n";
        return false;
    }
}

bool Log::closeLogFile() {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (logfile.is_open()) {
        logfile.close();
        current_filename.clear();
        return true;
    } else {
        return false;
    }
}

bool Log::isOpen() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return logfile.is_open();
}

// UTC, ISO 8601
std::string Log::makeDate() {
    std::time_t now = std::time(nullptr);
    std::tm tm = *std::gmtime(&now);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

/**
 * One record per conversion run:
 * <date> status in=<bytes> items=<count> out=<bytes> "detail"
 */
bool Log::writeLogLine(std::string_view status, std::size_t in_bytes, std::size_t items,
                       std::size_t out_bytes, std::string_view detail) {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (logfile.is_open()) {
        logfile << makeDate() << ' ' << status << " in=" << in_bytes << " items=" << items
                << " out=" << out_bytes << " \"" << detail << "\"\n";
        logfile.flush(); // a failed run still leaves its record
        return true;
    } else {
        std::cerr << "Unable to write to logfile\n";
        return false;
    }
}
