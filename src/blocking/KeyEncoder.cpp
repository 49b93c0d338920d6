/**
 * @file KeyEncoder.cpp
 * @brief Blocking key encoders
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/blocking/KeyEncoder.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace dedup {

namespace {

// Phonetic codes of individual tokens are cut to this many characters
constexpr size_t PHONETIC_TOKEN_LENGTH = 2;

// Integer keys are only built for magnitudes that convert exactly
constexpr double MAX_INTEGER_KEY = 1e15;

constexpr char GEOHASH_BASE32[] = "0123456789bcdefghjkmnpqrstuvwxyz";

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (month == 2 && isLeapYear(year)) ? 29 : DAYS[month - 1];
}

bool allDigits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

char soundexDigit(char upper) {
    switch (upper) {
        case 'B': case 'F': case 'P': case 'V':
            return '1';
        case 'C': case 'G': case 'J': case 'K': case 'Q': case 'S': case 'X': case 'Z':
            return '2';
        case 'D': case 'T':
            return '3';
        case 'L':
            return '4';
        case 'M': case 'N':
            return '5';
        case 'R':
            return '6';
        case 'H': case 'W':
            return '-';  // Transparent, does not separate equal codes
        default:
            return '0';  // Vowels separate equal codes
    }
}

std::string joinSorted(std::vector<std::string> parts) {
    std::sort(parts.begin(), parts.end());
    std::string out;
    for (const auto& p : parts) {
        out += p;
    }
    return out;
}

}  // anonymous namespace

std::string KeyEncoder::toLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string KeyEncoder::toUpper(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::vector<std::string> KeyEncoder::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

std::string KeyEncoder::soundex(const std::string& word) {
    std::string code;
    char prev = 0;

    for (char raw : word) {
        if (!std::isalpha(static_cast<unsigned char>(raw))) {
            continue;
        }
        char c = static_cast<char>(std::toupper(static_cast<unsigned char>(raw)));
        char digit = soundexDigit(c);

        if (code.empty()) {
            code += c;
            prev = digit;
            continue;
        }

        if (digit == '-') {
            continue;
        }
        if (digit == '0') {
            prev = '0';
            continue;
        }
        if (digit != prev) {
            code += digit;
            if (code.size() == 4) break;
        }
        prev = digit;
    }

    if (code.empty()) {
        return code;
    }
    code.resize(4, '0');
    return code;
}

std::string KeyEncoder::consonants(const std::string& word) {
    std::string upper = toUpper(word);
    if (upper.empty()) return upper;

    std::string out(1, upper[0]);
    for (size_t i = 1; i < upper.size(); ++i) {
        char c = upper[i];
        if (c != 'A' && c != 'E' && c != 'I' && c != 'O' && c != 'U') {
            out += c;
        }
    }
    return out;
}

std::string KeyEncoder::phoneDigits(const std::string& text, int width) {
    std::string digits;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    if (digits.empty()) {
        return digits;
    }
    if (static_cast<int>(digits.size()) < width) {
        digits.insert(0, static_cast<size_t>(width) - digits.size(), '0');
    }
    return digits;
}

std::optional<CalendarDate> KeyEncoder::parseDate(const std::string& raw) {
    size_t begin = raw.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    size_t end = raw.find_first_of("T ", begin);
    std::string text = raw.substr(begin, end == std::string::npos ? std::string::npos : end - begin);

    CalendarDate date;
    if (text.size() == 8 && allDigits(text)) {
        date.year = std::stoi(text.substr(0, 4));
        date.month = std::stoi(text.substr(4, 2));
        date.day = std::stoi(text.substr(6, 2));
    } else {
        char separator = 0;
        std::vector<std::string> parts(1);
        for (char c : text) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                parts.back() += c;
            } else if ((c == '-' || c == '/' || c == '.') && (separator == 0 || c == separator)) {
                separator = c;
                parts.emplace_back();
            } else {
                return std::nullopt;
            }
        }
        if (parts.size() != 3) {
            return std::nullopt;
        }
        for (const auto& part : parts) {
            if (part.empty() || part.size() > 4) {
                return std::nullopt;
            }
        }

        if (parts[0].size() == 4) {
            date.year = std::stoi(parts[0]);
            date.month = std::stoi(parts[1]);
            date.day = std::stoi(parts[2]);
        } else if (parts[2].size() == 4) {
            date.year = std::stoi(parts[2]);
            // Slashes are month first, dots and dashes day first
            int first = std::stoi(parts[0]);
            int second = std::stoi(parts[1]);
            date.month = separator == '/' ? first : second;
            date.day = separator == '/' ? second : first;
        } else {
            return std::nullopt;
        }
    }

    if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > daysInMonth(date.year, date.month)) {
        return std::nullopt;
    }
    return date;
}

std::optional<double> KeyEncoder::parseNumber(const Value& value) {
    if (value.isNumber()) {
        double number = value.getNumber();
        return std::isfinite(number) ? std::optional<double>(number) : std::nullopt;
    }
    if (!value.isString()) {
        return std::nullopt;
    }

    const std::string& text = value.getString();
    size_t begin = text.find_first_not_of(" \t\r\n");
    size_t end = text.find_last_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    std::string trimmed = text.substr(begin, end - begin + 1);

    char* parsedEnd = nullptr;
    double number = std::strtod(trimmed.c_str(), &parsedEnd);
    if (parsedEnd != trimmed.c_str() + trimmed.size() || !std::isfinite(number)) {
        return std::nullopt;
    }
    return number;
}

std::vector<std::string> KeyEncoder::integerNeighbourhood(double number) {
    long long v = static_cast<long long>(std::trunc(number)) * 2;
    std::vector<std::string> tokens = {std::to_string(v - 1), std::to_string(v), std::to_string(v + 1)};
    std::sort(tokens.begin(), tokens.end());
    return tokens;
}

std::string KeyEncoder::geohash(double latitude, double longitude, int precision) {
    if (!(latitude >= -90.0 && latitude <= 90.0) || !(longitude >= -180.0 && longitude <= 180.0)) {
        return "";
    }

    double latLow = -90.0, latHigh = 90.0;
    double lonLow = -180.0, lonHigh = 180.0;
    std::string hash;
    int bit = 0;
    int ch = 0;
    bool even = true;  // Even bits refine longitude

    while (static_cast<int>(hash.size()) < precision) {
        if (even) {
            double mid = (lonLow + lonHigh) / 2.0;
            if (longitude > mid) {
                ch |= 16 >> bit;
                lonLow = mid;
            } else {
                lonHigh = mid;
            }
        } else {
            double mid = (latLow + latHigh) / 2.0;
            if (latitude > mid) {
                ch |= 16 >> bit;
                latLow = mid;
            } else {
                latHigh = mid;
            }
        }
        even = !even;

        if (bit < 4) {
            ++bit;
        } else {
            hash += GEOHASH_BASE32[ch];
            bit = 0;
            ch = 0;
        }
    }
    return hash;
}

std::string KeyEncoder::encodeGeo(const Record& record, const std::string& attribute, int precision) {
    auto coordinate = [&record](const std::string& path) -> std::optional<double> {
        const Value* value = record.get(path);
        if (value == nullptr) {
            return std::nullopt;
        }
        return parseNumber(*value);
    };

    std::optional<double> latitude = coordinate(attribute + ".lat");
    std::optional<double> longitude = coordinate(attribute + ".lon");
    if (!latitude || !longitude) {
        longitude = coordinate(attribute + ".0");
        latitude = coordinate(attribute + ".1");
    }
    if (!latitude || !longitude) {
        return "";
    }
    return geohash(*latitude, *longitude, precision);
}

std::string KeyEncoder::encode(KeyEncoding encoding, const Value& value, int parameter) {
    std::string text = value.toString();
    size_t n = parameter > 0 ? static_cast<size_t>(parameter) : 0;

    switch (encoding) {
        case KeyEncoding::EXACT:
            return text;

        case KeyEncoding::PHONETIC: {
            std::vector<std::string> codes;
            for (const auto& token : tokenize(toLower(text))) {
                std::string code = soundex(token);
                if (!code.empty()) {
                    codes.push_back(code.substr(0, PHONETIC_TOKEN_LENGTH));
                }
            }
            std::string joined = joinSorted(std::move(codes));
            return joined.substr(0, n);
        }

        case KeyEncoding::CONSONANT:
            return consonants(text);

        case KeyEncoding::FIRST_N_CHARS: {
            std::vector<std::string> parts;
            for (const auto& token : tokenize(toLower(text))) {
                parts.push_back(token.substr(0, n));
            }
            return joinSorted(std::move(parts));
        }

        case KeyEncoding::LAST_N_CHARS: {
            std::vector<std::string> parts;
            for (const auto& token : tokenize(toLower(text))) {
                parts.push_back(token.size() > n ? token.substr(token.size() - n) : token);
            }
            return joinSorted(std::move(parts));
        }

        case KeyEncoding::FIRST_N_WORDS: {
            auto tokens = tokenize(toLower(text));
            std::string out;
            for (size_t i = 0; i < tokens.size() && i < n; ++i) {
                out += tokens[i];
            }
            return out;
        }

        case KeyEncoding::ABBREVIATION: {
            std::vector<std::string> initials;
            for (const auto& token : tokenize(toLower(text))) {
                initials.push_back(token.substr(0, 1));
            }
            std::string joined = joinSorted(std::move(initials));
            return joined.substr(0, n);
        }

        case KeyEncoding::PHONE:
            return phoneDigits(text, parameter);

        case KeyEncoding::YEAR:
        case KeyEncoding::MONTH:
        case KeyEncoding::DAY: {
            auto date = parseDate(text);
            if (!date) {
                return "";
            }
            if (encoding == KeyEncoding::YEAR) return std::to_string(date->year);
            if (encoding == KeyEncoding::MONTH) return std::to_string(date->month);
            return std::to_string(date->day);
        }

        case KeyEncoding::ROUND_INTEGER: {
            auto number = parseNumber(value);
            if (!number || std::fabs(*number) >= MAX_INTEGER_KEY) {
                return "";
            }
            // nearbyint rounds half to even under the default rounding mode
            return std::to_string(static_cast<long long>(std::nearbyint(*number)));
        }

        case KeyEncoding::SORTED_INTEGERS: {
            auto number = parseNumber(value);
            if (!number || std::fabs(*number) >= MAX_INTEGER_KEY) {
                return "";
            }
            std::vector<std::string> tokens = integerNeighbourhood(*number);
            if (n < tokens.size()) {
                tokens.resize(n);
            }
            std::string out;
            for (const auto& token : tokens) {
                if (!out.empty()) out += ' ';
                out += token;
            }
            return out;
        }

        case KeyEncoding::GEOHASH:
            // Needs both coordinates, see encodeGeo
            return "";

        default:
            return text;
    }
}

} // namespace dedup
