#ifndef SALVO_LOG_H
#define SALVO_LOG_H

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace logsys {
    void init(spdlog::level::level_enum level);   // coloured stderr sink
    std::shared_ptr<spdlog::logger> get();         // "salvo"; created on first use
    spdlog::level::level_enum parse_level(const std::string& name, bool& ok);
}

#endif
