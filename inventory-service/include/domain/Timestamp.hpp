#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Момент времени (UTC) с ISO 8601 представлением
 *
 * Используется и как полная отметка времени (журнал, статусы),
 * и как календарная дата (дата заказа, дата инвентаризации).
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разобрать "2025-05-01T10:30:00Z" или "2025-05-01"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        if (isoString.size() > 10) {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        }
        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + isoString);
        }
        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    /**
     * @brief ISO 8601: "2025-05-01T10:30:00Z"
     */
    std::string toString() const {
        return format("%Y-%m-%dT%H:%M:%SZ");
    }

    /**
     * @brief Только дата: "2025-05-01"
     */
    std::string toDateString() const {
        return format("%Y-%m-%d");
    }

    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::milliseconds(millis)
        ));
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }

private:
    std::string format(const char* pattern) const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, pattern);
        return ss.str();
    }
};

} // namespace inventory::domain
