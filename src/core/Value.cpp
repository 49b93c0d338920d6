/**
 * @file Value.cpp
 * @brief Attribute value implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/core/Value.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace dedup {

namespace {

int typeRank(const Value& v) {
    if (v.isNull()) return 0;
    if (v.isBool()) return 1;
    if (v.isNumber()) return 2;
    return 3;
}

int compareIgnoreCase(const std::string& a, const std::string& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        int ca = std::tolower(static_cast<unsigned char>(a[i]));
        int cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) {
            return ca < cb ? -1 : 1;
        }
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

}  // anonymous namespace

std::string Value::toString() const {
    if (isNull()) return "";
    if (isBool()) return getBool() ? "true" : "false";
    if (isString()) return getString();

    double d = getNumber();
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
        std::ostringstream ss;
        ss << static_cast<long long>(d);
        return ss.str();
    }
    std::ostringstream ss;
    ss << std::setprecision(15) << d;
    return ss.str();
}

int Value::compare(const Value& a, const Value& b) {
    int ra = typeRank(a);
    int rb = typeRank(b);
    if (ra != rb) {
        return ra < rb ? -1 : 1;
    }

    switch (ra) {
        case 0:
            return 0;
        case 1:
            if (a.getBool() == b.getBool()) return 0;
            return a.getBool() ? 1 : -1;
        case 2: {
            double x = a.getNumber();
            double y = b.getNumber();
            // NaN sorts before every other number
            bool nx = std::isnan(x);
            bool ny = std::isnan(y);
            if (nx || ny) {
                if (nx && ny) return 0;
                return nx ? -1 : 1;
            }
            if (x == y) return 0;
            return x < y ? -1 : 1;
        }
        default: {
            int c = compareIgnoreCase(a.getString(), b.getString());
            if (c != 0) return c;
            int exact = a.getString().compare(b.getString());
            if (exact == 0) return 0;
            return exact < 0 ? -1 : 1;
        }
    }
}

} // namespace dedup
