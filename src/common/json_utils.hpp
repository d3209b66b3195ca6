#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"
#include "common/size_format.hpp"

namespace driftwatch {

// Formats as 2024-05-01T10:00:00.123Z.
inline std::string toIso8601Utc(TimePoint timestamp)
{
    const auto seconds = std::chrono::floor<std::chrono::seconds>(timestamp);
    const auto millis = (timestamp - seconds).count();

    std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

// Accepts the millisecond form written by toIso8601Utc as well as a plain
// seconds form ending in Z.
inline std::optional<TimePoint> fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    long long millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek())) {
            digits.push_back(static_cast<char>(in.get()));
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        // Keep millisecond precision; pad or truncate the fraction.
        digits.resize(3, '0');
        millis = std::stoll(digits);
    }
    if (in.get() != 'Z' || in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    const std::chrono::year_month_day date{
        std::chrono::year{tm.tm_year + 1900},
        std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return TimePoint{std::chrono::sys_days{date}}
        + std::chrono::hours(tm.tm_hour)
        + std::chrono::minutes(tm.tm_min)
        + std::chrono::seconds(tm.tm_sec)
        + std::chrono::milliseconds(millis);
}

inline std::string toChangeKindString(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::Created:
        return "created";
    case ChangeKind::Modified:
        return "modified";
    case ChangeKind::Deleted:
        return "deleted";
    }
    return "created";
}

// Persisted form of a record. The path is the key of the enclosing object,
// so it is not repeated here.
inline void to_json(nlohmann::json &j, const FileRecord &record)
{
    j = nlohmann::json{
        {"name", record.name},
        {"size", record.size},
        {"sizeFormatted", formatBytes(record.size)},
        {"modified", toIso8601Utc(record.modifiedAt)},
        {"created", record.createdAt ? nlohmann::json(toIso8601Utc(*record.createdAt))
                                     : nlohmann::json()},
        {"extension", record.extension}
    };
}

inline void from_json(const nlohmann::json &j, FileRecord &record)
{
    if (!j.is_object()) {
        throw StateLoadFailure("file record is not an object");
    }

    record.name = j.value("name", "");
    if (!j.contains("size") || !j.at("size").is_number_unsigned()) {
        throw StateLoadFailure("invalid size for " + record.name);
    }
    record.size = j.at("size").get<std::uint64_t>();
    record.extension = j.value("extension", "");

    const auto modified = fromIso8601Utc(j.value("modified", ""));
    if (!modified) {
        throw StateLoadFailure("invalid modified timestamp for " + record.name);
    }
    record.modifiedAt = *modified;

    record.createdAt.reset();
    if (j.contains("created") && j.at("created").is_string()) {
        record.createdAt = fromIso8601Utc(j.at("created").get<std::string>());
    }
}

// Paths that are not valid UTF-8 are stored under a key starting with NUL,
// which no real path contains. The key, name and extension of such a record
// are percent-encoded: '%', control bytes and bytes >= 0x80 become %XX.
inline constexpr char kEncodedKeyPrefix = '\0';

inline bool isValidUtf8(const std::string &value)
{
    try {
        (void)nlohmann::json(value).dump();
        return true;
    } catch (const nlohmann::json::type_error &) {
        return false;
    }
}

inline std::string percentEncode(const std::string &value)
{
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (const char ch : value) {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte == '%' || byte < 0x20 || byte >= 0x80) {
            out.push_back('%');
            out.push_back(kHex[byte >> 4]);
            out.push_back(kHex[byte & 0x0F]);
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

inline std::string percentDecode(const std::string &value)
{
    const auto hexValue = [&value](char ch) -> int {
        if (ch >= '0' && ch <= '9') {
            return ch - '0';
        }
        if (ch >= 'A' && ch <= 'F') {
            return ch - 'A' + 10;
        }
        if (ch >= 'a' && ch <= 'f') {
            return ch - 'a' + 10;
        }
        throw StateLoadFailure("invalid percent escape in " + value);
    };

    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '%') {
            out.push_back(value[i]);
            continue;
        }
        if (i + 2 >= value.size()) {
            throw StateLoadFailure("truncated percent escape in " + value);
        }
        out.push_back(static_cast<char>(hexValue(value[i + 1]) * 16 + hexValue(value[i + 2])));
        i += 2;
    }
    return out;
}

inline nlohmann::json snapshotToJson(const Snapshot &snapshot)
{
    nlohmann::json out = nlohmann::json::object();
    for (const auto &[path, record] : snapshot) {
        if (isValidUtf8(path)) {
            out[path] = record;
            continue;
        }
        FileRecord stored = record;
        stored.name = percentEncode(record.name);
        stored.extension = percentEncode(record.extension);
        out[std::string(1, kEncodedKeyPrefix) + percentEncode(path)] = stored;
    }
    return out;
}

inline Snapshot snapshotFromJson(const nlohmann::json &j)
{
    if (!j.is_object()) {
        throw StateLoadFailure("state root is not an object");
    }

    Snapshot snapshot;
    for (const auto &item : j.items()) {
        FileRecord record = item.value().get<FileRecord>();
        const std::string &key = item.key();
        if (!key.empty() && key.front() == kEncodedKeyPrefix) {
            record.path = percentDecode(key.substr(1));
            record.name = percentDecode(record.name);
            record.extension = percentDecode(record.extension);
        } else {
            record.path = key;
        }
        std::string path = record.path;
        snapshot.emplace(std::move(path), std::move(record));
    }
    return snapshot;
}

} // namespace driftwatch
