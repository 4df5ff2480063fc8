#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Временная метка (UTC)
 *
 * Даты проводок хранятся как полночь UTC соответствующего дня.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разбор "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[Z]" или "YYYY-MM-DD HH:MM:SS"
     * @throws std::invalid_argument при неверном формате
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        if (str.size() > 10 && str[10] == ' ') {
            ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        } else if (str.size() > 10) {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        }
        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }
        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    /**
     * @brief Полночь UTC указанного дня
     */
    static Timestamp date(int year, int month, int day) {
        std::tm tm = {};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    static Timestamp fromEpochSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::seconds(seconds)));
    }

    int64_t epochSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(value.time_since_epoch()).count();
    }

    /**
     * @brief Начало дня (UTC)
     */
    Timestamp startOfDay() const {
        int64_t secs = epochSeconds();
        int64_t day = secs >= 0 ? secs / 86400 : (secs - 86399) / 86400;
        return fromEpochSeconds(day * 86400);
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    std::string toDateString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d");
        return ss.str();
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
};

} // namespace ledger::domain
