#include "chunkgate/logging.h"

#include "chunkgate/environment.h"

#include <drogon/drogon.h>
#include <nlohmann/json.hpp>
#include <trantor/utils/Logger.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace chunkgate {
namespace {

struct LevelName {
    std::string_view name;
    trantor::Logger::LogLevel level;
};

constexpr LevelName kLevels[] = {
    {"trace", trantor::Logger::kTrace}, {"debug", trantor::Logger::kDebug}, {"info", trantor::Logger::kInfo},
    {"warn", trantor::Logger::kWarn},   {"warning", trantor::Logger::kWarn}, {"error", trantor::Logger::kError},
    {"fatal", trantor::Logger::kFatal}, {"critical", trantor::Logger::kFatal},
};

trantor::Logger::LogLevel parseLevel(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const auto &entry : kLevels) {
        if (entry.name == level) {
            return entry.level;
        }
    }
    return trantor::Logger::kInfo;
}

// trantor lines look like "<date> <time> UTC <tid> LEVEL <msg> - file:line"; the
// level is the first token that names one.
std::string lineLevel(std::string_view line) {
    static constexpr std::string_view kTokens[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    std::istringstream words{std::string(line.substr(0, 64))};
    std::string word;
    while (words >> word) {
        if (std::find(std::begin(kTokens), std::end(kTokens), word) != std::end(kTokens)) {
            return word;
        }
    }
    return "INFO";
}

std::string utcNow() {
    const auto now = std::chrono::system_clock::now();
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return out.str();
}

template <typename T>
nlohmann::json orNull(const T &value, bool present) {
    return present ? nlohmann::json(value) : nlohmann::json(nullptr);
}

// Serializes trantor output as one JSON object per line on stdout and an
// optional append-only file.
class JsonLineSink {
  public:
    void configure(bool toStdout, const std::filesystem::path &filePath) {
        std::lock_guard guard(mutex_);
        toStdout_ = toStdout;
        file_.reset();
        if (filePath.empty()) {
            return;
        }
        std::error_code ec;
        if (filePath.has_parent_path()) {
            std::filesystem::create_directories(filePath.parent_path(), ec);
        }
        file_ = std::make_unique<std::ofstream>(filePath, std::ios::app);
        if (!*file_) {
            std::cerr << "Cannot open log file " << filePath << std::endl;
            file_.reset();
        }
    }

    void write(std::string_view line) {
        if (!line.empty() && line.back() == '\n') {
            line.remove_suffix(1);
        }
        const auto context = currentLogContext();

        nlohmann::json record;
        record["ts"] = utcNow();
        record["level"] = lineLevel(line);
        record["msg"] = std::string(line);
        record["request_id"] = orNull(context.requestId, !context.requestId.empty());
        record["endpoint"] = orNull(context.endpoint, !context.endpoint.empty());
        record["resource_id"] = orNull(context.resourceId, !context.resourceId.empty());
        record["status"] = orNull(context.status, context.status != 0);
        record["latency_ms"] = orNull(context.latencyMs, context.latencyMs > 0.0);

        // Client-supplied names and ids may carry invalid UTF-8.
        const auto text = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        std::lock_guard guard(mutex_);
        if (toStdout_) {
            std::cout << text << '\n';
        }
        if (file_) {
            *file_ << text << '\n';
        }
    }

    void flush() {
        std::lock_guard guard(mutex_);
        std::cout.flush();
        if (file_) {
            file_->flush();
        }
    }

  private:
    std::mutex mutex_;
    bool toStdout_{true};
    std::unique_ptr<std::ofstream> file_;
};

JsonLineSink &sink() {
    static JsonLineSink instance;
    return instance;
}

thread_local LogContext threadContext{};

}  // namespace

void initializeLogging(const std::string &level, const YAML::Node &loggingConfig) {
    bool toStdout = true;
    std::filesystem::path filePath;

    if (loggingConfig && loggingConfig["logging"]) {
        const auto logging = loggingConfig["logging"];
        toStdout = logging["stdout"].as<bool>(true);
        const auto file = logging["file"];
        if (file && file["enabled"].as<bool>(false)) {
            filePath = file["path"].as<std::string>("");
        }
    }

    toStdout = getEnvFlag("LOG_STDOUT", toStdout);

    sink().configure(toStdout, filePath);
    trantor::Logger::setLogLevel(parseLevel(level));
    trantor::Logger::setOutputFunction([](const char *msg, const uint64_t len) { sink().write({msg, len}); },
                                       []() { sink().flush(); });

    LOG_INFO << "Logging initialized at level " << level;
}

void setLogContext(const LogContext &context) {
    threadContext = context;
}

void updateLogContext(const LogContext &context) {
    auto merge = [](std::string &target, const std::string &value) {
        if (!value.empty()) {
            target = value;
        }
    };
    merge(threadContext.requestId, context.requestId);
    merge(threadContext.endpoint, context.endpoint);
    merge(threadContext.resourceId, context.resourceId);
    if (context.status != 0) {
        threadContext.status = context.status;
    }
    if (context.latencyMs > 0.0) {
        threadContext.latencyMs = context.latencyMs;
    }
}

LogContext currentLogContext() {
    return threadContext;
}

void clearLogContext() {
    threadContext = LogContext{};
}

}  // namespace chunkgate
