#pragma once

#include "domain/Currency.hpp"
#include "domain/Rate.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <string>
#include <cstdint>
#include <cctype>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Хранит значение в минорных единицах валюты (центы, копейки) как int64_t.
 * Масштаб берётся из справочника валют, арифметика целочисленная и точная.
 * Операции над суммами в разных валютах запрещены.
 */
class Money {
public:
    int64_t minorUnits = 0;
    std::string currency = "USD";

    Money() = default;

    Money(int64_t minor, const std::string& cur)
        : minorUnits(minor), currency(cur) {}

    static Money zero(const std::string& cur) {
        return Money(0, cur);
    }

    /**
     * @brief Разобрать десятичную строку в валюте ("10.50", "100", "-3.25")
     *
     * Лишние знаки после запятой не округляются: "10.005" для USD это ошибка,
     * у клиента не может быть суммы мельче минорной единицы.
     * @throws std::invalid_argument для некорректной строки или неизвестной валюты
     */
    static Money fromString(const std::string& text, const std::string& cur) {
        const int scale = currencyScale(cur);
        if (text.empty()) {
            throw std::invalid_argument("Empty amount");
        }

        size_t pos = 0;
        bool negative = false;
        if (text[0] == '-' || text[0] == '+') {
            negative = text[0] == '-';
            pos = 1;
        }

        int64_t whole = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool seenDot = false;
        bool seenDigit = false;

        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '.') {
                if (seenDot) {
                    throw std::invalid_argument("Malformed amount: " + text);
                }
                seenDot = true;
                continue;
            }
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Malformed amount: " + text);
            }
            seenDigit = true;
            int digit = c - '0';
            if (!seenDot) {
                if (whole > INT64_MAX / 10 / pow10(scale) - 1) {
                    throw std::invalid_argument("Amount out of range: " + text);
                }
                whole = whole * 10 + digit;
            } else {
                if (fractionDigits >= scale) {
                    if (digit != 0) {
                        throw std::invalid_argument(
                            "Amount " + text + " has more than " + std::to_string(scale) +
                            " decimal places for " + cur);
                    }
                    continue;
                }
                fraction = fraction * 10 + digit;
                ++fractionDigits;
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Malformed amount: " + text);
        }

        for (int i = fractionDigits; i < scale; ++i) {
            fraction *= 10;
        }

        int64_t minor = whole * pow10(scale) + fraction;
        return Money(negative ? -minor : minor, cur);
    }

    int scale() const {
        return currencyScale(currency);
    }

    /**
     * @brief Десятичная запись с полным масштабом валюты ("10100.00", "1500", "-0.05")
     */
    std::string toString() const {
        const int s = scale();
        const bool negative = minorUnits < 0;
        // -(INT64_MIN) не представим, поэтому через uint64_t
        uint64_t magnitude = negative ? static_cast<uint64_t>(-(minorUnits + 1)) + 1
                                      : static_cast<uint64_t>(minorUnits);
        const uint64_t divisor = static_cast<uint64_t>(pow10(s));

        std::string result = std::to_string(magnitude / divisor);
        if (s > 0) {
            std::string fraction = std::to_string(magnitude % divisor);
            fraction.insert(0, static_cast<size_t>(s) - fraction.size(), '0');
            result += "." + fraction;
        }
        return negative ? "-" + result : result;
    }

    bool isPositive() const { return minorUnits > 0; }
    bool isNegative() const { return minorUnits < 0; }
    bool isZero() const { return minorUnits == 0; }

    /**
     * @brief Конвертация по курсу в другую валюту
     *
     * credit = round_half_even(amount * rate) в масштабе целевой валюты.
     * Промежуточное произведение считается в cpp_int без переполнения.
     */
    Money convertTo(const Rate& rate, const std::string& targetCurrency) const {
        using boost::multiprecision::cpp_int;

        const int sourceScale = scale();
        const int targetScale = currencyScale(targetCurrency);

        cpp_int numerator = cpp_int(minorUnits) * cpp_int(rate.totalNanos()) *
                            cpp_int(pow10(targetScale));
        cpp_int denominator = cpp_int(pow10(sourceScale)) * cpp_int(Rate::NANO);

        const bool negative = numerator < 0;
        if (negative) {
            numerator = -numerator;
        }

        cpp_int quotient = numerator / denominator;
        cpp_int remainder = numerator % denominator;
        cpp_int twice = remainder * 2;
        if (twice > denominator || (twice == denominator && (quotient & 1) != 0)) {
            quotient += 1;
        }
        if (negative) {
            quotient = -quotient;
        }

        if (quotient > cpp_int(INT64_MAX) || quotient < cpp_int(INT64_MIN)) {
            throw std::overflow_error("Converted amount out of range");
        }
        return Money(quotient.convert_to<int64_t>(), targetCurrency);
    }

    /// @throws std::overflow_error если сумма не помещается в int64_t
    Money operator+(const Money& other) const {
        requireSameCurrency(other);
        int64_t sum = 0;
        if (__builtin_add_overflow(minorUnits, other.minorUnits, &sum)) {
            throw std::overflow_error("Amount out of range: " + toString() + " + " + other.toString());
        }
        return Money(sum, currency);
    }

    /// @throws std::overflow_error если разность не помещается в int64_t
    Money operator-(const Money& other) const {
        requireSameCurrency(other);
        int64_t difference = 0;
        if (__builtin_sub_overflow(minorUnits, other.minorUnits, &difference)) {
            throw std::overflow_error("Amount out of range: " + toString() + " - " + other.toString());
        }
        return Money(difference, currency);
    }

    bool operator<(const Money& other) const {
        requireSameCurrency(other);
        return minorUnits < other.minorUnits;
    }

    bool operator>(const Money& other) const {
        return other < *this;
    }

    bool operator<=(const Money& other) const {
        return !(other < *this);
    }

    bool operator>=(const Money& other) const {
        return !(*this < other);
    }

    bool operator==(const Money& other) const {
        return minorUnits == other.minorUnits && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

private:
    void requireSameCurrency(const Money& other) const {
        if (currency != other.currency) {
            throw std::invalid_argument("Currency mismatch: " + currency + " vs " + other.currency);
        }
    }
};

} // namespace ledger::domain
