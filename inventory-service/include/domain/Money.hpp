// include/domain/Money.hpp
#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Хранится в центах (int64_t), чтобы суммы по строкам заказа
 * складывались без ошибок округления.
 */
class Money {
public:
    int64_t cents = 0;
    std::string currency = "USD";

    Money() = default;

    Money(int64_t c, const std::string& cur = "USD")
        : cents(c), currency(cur) {}

    static Money fromDouble(double value, const std::string& cur = "USD") {
        return Money(static_cast<int64_t>(std::llround(value * 100.0)), cur);
    }

    double toDouble() const {
        return static_cast<double>(cents) / 100.0;
    }

    /**
     * @throws std::invalid_argument при сложении разных валют
     */
    Money operator+(const Money& other) const {
        if (cents != 0 && other.cents != 0 && currency != other.currency) {
            throw std::invalid_argument("Currency mismatch: " + currency + " vs " + other.currency);
        }
        return Money(cents + other.cents, cents != 0 ? currency : other.currency);
    }

    Money operator*(int64_t quantity) const {
        return Money(cents * quantity, currency);
    }

    bool operator==(const Money& other) const {
        return cents == other.cents && currency == other.currency;
    }

    bool operator!=(const Money& other) const { return !(*this == other); }
};

} // namespace inventory::domain
