#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Денежная сумма в минорных единицах (копейки, центы)
 *
 * В журнале никогда не используются числа с плавающей точкой:
 * все суммы хранятся и складываются как int64.
 * Масштаб фиксирован: 1 единица = 100 минорных.
 */
class Money {
public:
    static constexpr int64_t SCALE = 100;

    static constexpr int64_t MAX_MINOR = std::numeric_limits<int64_t>::max();

    int64_t minor = 0;

    Money() = default;

    explicit Money(int64_t minorUnits) : minor(minorUnits) {}

    static Money fromMinor(int64_t minorUnits) {
        return Money(minorUnits);
    }

    /**
     * @throws std::invalid_argument если значение не конечно или не помещается в int64
     */
    static Money fromDouble(double value) {
        double scaled = value * SCALE;
        // double(INT64_MAX) == 2^63, всё строго меньше уже представимо
        if (!std::isfinite(scaled) ||
            std::fabs(scaled) >= static_cast<double>(MAX_MINOR)) {
            throw std::invalid_argument("Money amount out of range: " + std::to_string(value));
        }
        return Money(static_cast<int64_t>(std::llround(scaled)));
    }

    /**
     * @brief Разобрать десятичную строку "1234.5", "-10.05", "7"
     * @throws std::invalid_argument если строка не число, больше двух знаков после точки
     *         или сумма не помещается в int64
     */
    static Money fromString(const std::string& str) {
        if (str.empty()) {
            throw std::invalid_argument("Empty money string");
        }

        size_t pos = 0;
        bool negative = false;
        if (str[0] == '-' || str[0] == '+') {
            negative = str[0] == '-';
            pos = 1;
        }

        int64_t whole = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool seenDot = false;
        bool seenDigit = false;

        for (; pos < str.size(); ++pos) {
            char c = str[pos];
            if (c == '.' && !seenDot) {
                seenDot = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid money string: " + str);
            }
            seenDigit = true;
            if (seenDot) {
                if (++fractionDigits > 2) {
                    throw std::invalid_argument("Too many decimal places: " + str);
                }
                fraction = fraction * 10 + (c - '0');
            } else {
                int digit = c - '0';
                if (whole > (MAX_MINOR - digit) / 10) {
                    throw std::invalid_argument("Money amount out of range: " + str);
                }
                whole = whole * 10 + digit;
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Invalid money string: " + str);
        }
        if (fractionDigits == 1) {
            fraction *= 10;
        }

        if (whole > (MAX_MINOR - fraction) / SCALE) {
            throw std::invalid_argument("Money amount out of range: " + str);
        }
        int64_t value = whole * SCALE + fraction;
        return Money(negative ? -value : value);
    }

    double toDouble() const {
        return static_cast<double>(minor) / SCALE;
    }

    /**
     * @brief Формат "1234.50"
     */
    std::string toString() const {
        int64_t absMinor = std::llabs(minor);
        std::string fraction = std::to_string(absMinor % SCALE);
        if (fraction.size() < 2) fraction = "0" + fraction;
        return (minor < 0 ? "-" : "") + std::to_string(absMinor / SCALE) + "." + fraction;
    }

    bool isZero() const { return minor == 0; }
    bool isNegative() const { return minor < 0; }
    bool isPositive() const { return minor > 0; }

    Money abs() const { return Money(std::llabs(minor)); }

    Money operator+(const Money& other) const { return Money(minor + other.minor); }
    Money operator-(const Money& other) const { return Money(minor - other.minor); }
    Money operator-() const { return Money(-minor); }

    Money& operator+=(const Money& other) {
        minor += other.minor;
        return *this;
    }

    Money& operator-=(const Money& other) {
        minor -= other.minor;
        return *this;
    }

    bool operator==(const Money& other) const { return minor == other.minor; }
    bool operator!=(const Money& other) const { return minor != other.minor; }
    bool operator<(const Money& other) const { return minor < other.minor; }
    bool operator>(const Money& other) const { return minor > other.minor; }
    bool operator<=(const Money& other) const { return minor <= other.minor; }
    bool operator>=(const Money& other) const { return minor >= other.minor; }
};

} // namespace ledger::domain
