#ifndef LINEUP_LOG_H
#define LINEUP_LOG_H 1

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

#include "global.h"

class Log {
  public:
    static Log& getInstance();

    bool openLogFile(std::string_view filename);
    bool closeLogFile();
    bool isOpen();
    /**
     * Append one record for a conversion run. Returns false when no log
     * file is open.
     */
    bool writeLogLine(std::string_view status, std::size_t in_bytes, std::size_t items,
                      std::size_t out_bytes, std::string_view detail);

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

  private:
    Log() = default;
    ~Log();

    std::string makeDate();
    std::ofstream logfile;
    std::mutex log_mutex;
    std::string current_filename;
};

#endif /* !LINEUP_LOG_H */
