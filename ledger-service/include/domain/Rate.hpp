#pragma once

#include <string>
#include <cstdint>
#include <stdexcept>
#include <cctype>

namespace ledger::domain {

/**
 * @brief Точный десятичный курс
 *
 * Хранит курс как целую часть + дробную часть в нано (10^-9),
 * так же, как Money хранил units/nano. Никакой плавающей точки.
 */
class Rate {
public:
    static constexpr int64_t NANO = 1000000000;
    static constexpr int SCALE = 9;

    int64_t units = 0;
    int32_t nano = 0;

    Rate() = default;

    Rate(int64_t u, int32_t n) : units(u), nano(n) {}

    static Rate one() {
        return Rate(1, 0);
    }

    static Rate fromNanos(int64_t totalNanos) {
        return Rate(totalNanos / NANO, static_cast<int32_t>(totalNanos % NANO));
    }

    /**
     * @brief Разобрать десятичную строку ("0.85", "3.7", "150", "2.2e-05")
     *
     * Больше 9 знаков после точки округляются half-even.
     * @throws std::invalid_argument для пустой, отрицательной или нечисловой строки
     */
    static Rate fromString(const std::string& input) {
        if (input.empty()) {
            throw std::invalid_argument("Empty rate");
        }
        const std::string text = expandExponent(input);

        int64_t whole = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool seenDot = false;
        bool seenDigit = false;
        // Первая отброшенная цифра и признак ненулевого хвоста для округления
        int firstDropped = -1;
        bool tailNonZero = false;

        for (char c : text) {
            if (c == '.') {
                if (seenDot) {
                    throw std::invalid_argument("Malformed rate: " + text);
                }
                seenDot = true;
                continue;
            }
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Malformed rate: " + text);
            }
            seenDigit = true;
            int digit = c - '0';
            if (!seenDot) {
                if (whole > (INT64_MAX / NANO) / 10) {
                    throw std::invalid_argument("Rate out of range: " + text);
                }
                whole = whole * 10 + digit;
            } else if (fractionDigits < SCALE) {
                fraction = fraction * 10 + digit;
                ++fractionDigits;
            } else if (firstDropped < 0) {
                firstDropped = digit;
            } else if (digit != 0) {
                tailNonZero = true;
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Malformed rate: " + text);
        }

        for (int i = fractionDigits; i < SCALE; ++i) {
            fraction *= 10;
        }

        int64_t total = whole * NANO + fraction;
        if (firstDropped > 5 || (firstDropped == 5 && (tailNonZero || total % 2 != 0))) {
            ++total;
        }
        return fromNanos(total);
    }

    /**
     * @brief "2.2e-05" -> "0.000022", "1.5E3" -> "1500"; строка без экспоненты не меняется
     */
    static std::string expandExponent(const std::string& text) {
        const auto marker = text.find_first_of("eE");
        if (marker == std::string::npos) {
            return text;
        }

        std::string mantissa = text.substr(0, marker);
        const std::string exponentText = text.substr(marker + 1);
        size_t pos = 0;
        if (!exponentText.empty() && (exponentText[0] == '-' || exponentText[0] == '+')) {
            pos = 1;
        }
        if (mantissa.empty() || pos >= exponentText.size() || exponentText.size() - pos > 3) {
            throw std::invalid_argument("Malformed rate: " + text);
        }
        for (size_t i = pos; i < exponentText.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(exponentText[i]))) {
                throw std::invalid_argument("Malformed rate: " + text);
            }
        }
        const int exponent = std::stoi(exponentText);

        auto dot = mantissa.find('.');
        std::string digits = mantissa;
        int intDigits = static_cast<int>(mantissa.size());
        if (dot != std::string::npos) {
            digits.erase(dot, 1);
            intDigits = static_cast<int>(dot);
        }
        if (digits.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Malformed rate: " + text);
        }

        const int point = intDigits + exponent;
        if (point <= 0) {
            return "0." + std::string(static_cast<size_t>(-point), '0') + digits;
        }
        if (point >= static_cast<int>(digits.size())) {
            return digits + std::string(static_cast<size_t>(point) - digits.size(), '0');
        }
        return digits.substr(0, static_cast<size_t>(point)) + "." + digits.substr(static_cast<size_t>(point));
    }

    int64_t totalNanos() const {
        return units * NANO + nano;
    }

    bool isPositive() const {
        return totalNanos() > 0;
    }

    bool isOne() const {
        return units == 1 && nano == 0;
    }

    /**
     * @brief Обратный курс 1/R, округлённый half-even до 10^-9
     * @throws std::domain_error для нулевого курса
     */
    Rate reciprocal() const {
        int64_t n = totalNanos();
        if (n <= 0) {
            throw std::domain_error("Cannot invert non-positive rate");
        }
        // 1/R в нано = 10^18 / n
        const int64_t numerator = NANO * NANO;
        int64_t quotient = numerator / n;
        int64_t remainder = numerator % n;
        if (remainder * 2 > n || (remainder * 2 == n && quotient % 2 != 0)) {
            ++quotient;
        }
        return fromNanos(quotient);
    }

    /**
     * @brief Каноническая запись без хвостовых нулей ("0.85", "1", "3.7")
     */
    std::string toString() const {
        std::string result = std::to_string(units);
        if (nano == 0) {
            return result;
        }
        std::string fraction = std::to_string(nano);
        fraction.insert(0, SCALE - fraction.size(), '0');
        while (!fraction.empty() && fraction.back() == '0') {
            fraction.pop_back();
        }
        return result + "." + fraction;
    }

    bool operator==(const Rate& other) const {
        return units == other.units && nano == other.nano;
    }

    bool operator!=(const Rate& other) const {
        return !(*this == other);
    }

    bool operator<(const Rate& other) const {
        return totalNanos() < other.totalNanos();
    }
};

} // namespace ledger::domain
