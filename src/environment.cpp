#include "chunkgate/environment.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace chunkgate {
namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view strip(std::string_view text) {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

// VALUE, "VALUE" or 'VALUE'. Unquoted values end at an inline " #" comment.
std::string parseValue(std::string_view raw) {
    raw = strip(raw);
    if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'')) {
        const auto closing = raw.find(raw.front(), 1);
        if (closing != std::string_view::npos) {
            return std::string(raw.substr(1, closing - 1));
        }
    }
    if (const auto comment = raw.find(" #"); comment != std::string_view::npos) {
        raw = strip(raw.substr(0, comment));
    }
    return std::string(raw);
}

}  // namespace

bool loadDotEnv(const std::filesystem::path &path) {
    std::ifstream input(path);
    if (!input) {
        return false;
    }

    constexpr std::string_view kExportPrefix = "export ";
    std::string line;
    while (std::getline(input, line)) {
        auto entry = strip(line);
        if (entry.empty() || entry.front() == '#') {
            continue;
        }
        if (entry.substr(0, kExportPrefix.size()) == kExportPrefix) {
            entry = strip(entry.substr(kExportPrefix.size()));
        }

        const auto equals = entry.find('=');
        if (equals == std::string_view::npos) {
            continue;
        }

        const std::string key(strip(entry.substr(0, equals)));
        if (key.empty()) {
            continue;
        }
        ::setenv(key.c_str(), parseValue(entry.substr(equals + 1)).c_str(), 1);
    }

    return true;
}

std::optional<std::string> getEnv(std::string_view key) {
    if (const char *value = std::getenv(std::string(key).c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

std::string getEnvOrDefault(std::string_view key, std::string_view defaultValue) {
    auto value = getEnv(key);
    return value && !value->empty() ? *value : std::string(defaultValue);
}

bool getEnvFlag(std::string_view key, bool defaultValue) {
    static constexpr std::array<std::string_view, 4> kTrue{"true", "1", "yes", "on"};
    static constexpr std::array<std::string_view, 4> kFalse{"false", "0", "no", "off"};

    auto value = getEnv(key);
    if (!value) {
        return defaultValue;
    }
    std::transform(value->begin(), value->end(), value->begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (std::find(kTrue.begin(), kTrue.end(), *value) != kTrue.end()) {
        return true;
    }
    if (std::find(kFalse.begin(), kFalse.end(), *value) != kFalse.end()) {
        return false;
    }
    return defaultValue;
}

std::uint64_t getEnvUnsigned(std::string_view key, std::uint64_t defaultValue) {
    auto value = getEnv(key);
    if (!value) {
        return defaultValue;
    }
    const auto text = strip(*value);
    std::uint64_t parsed = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
        return defaultValue;
    }
    return parsed;
}

}  // namespace chunkgate
