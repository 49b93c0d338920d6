/**
 * @file KeyEncoder.hpp
 * @brief Value encoders used by leaf blocking rules
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_BLOCKING_KEYENCODER_HPP
#define DEDUP_BLOCKING_KEYENCODER_HPP

#include "../core/Record.hpp"
#include "../core/Types.hpp"
#include "../core/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief Calendar date read from an attribute value
 */
struct CalendarDate {
    int year = 0;
    int month = 0;
    int day = 0;
};

/**
 * @brief Turns attribute values into blocking key text
 *
 * Every encoder returns an empty string when the value yields no usable key;
 * the calling rule treats that as NO_MATCH.
 */
class KeyEncoder {
public:
    /**
     * @brief Encode a value with the given encoding
     *
     * @param encoding Encoding to apply
     * @param value Attribute value (never null here)
     * @param parameter Characters, words, letters, digits or tokens, per encoding
     *
     * GEOHASH needs two coordinates and always yields no key here; leaf
     * rules route it through encodeGeo().
     */
    static std::string encode(KeyEncoding encoding, const Value& value, int parameter);

    /**
     * @brief Geohash key of the point stored under an attribute
     *
     * The point is read from "<attribute>.lat" and "<attribute>.lon", or from
     * a GeoJSON-ordered pair "<attribute>.0" (longitude) and
     * "<attribute>.1" (latitude).
     */
    static std::string encodeGeo(const Record& record, const std::string& attribute, int precision);

    /**
     * @brief Standard base-32 geohash, e.g. (57.64911, 10.40744, 5) -> "u4pru"
     *
     * Empty for coordinates outside [-90, 90] x [-180, 180].
     */
    static std::string geohash(double latitude, double longitude, int precision);

    /**
     * @brief Parse a date at the start of the text
     *
     * Accepts YYYY-MM-DD (also with '/' or '.'), YYYYMMDD, MM/DD/YYYY and
     * DD.MM.YYYY or DD-MM-YYYY; a time after 'T' or a space is ignored.
     */
    static std::optional<CalendarDate> parseDate(const std::string& text);

    /**
     * @brief Numeric content of a value (a number or numeric text)
     */
    static std::optional<double> parseNumber(const Value& value);

    /**
     * @brief Neighbourhood tokens {2v-1, 2v, 2v+1} of the truncated number v,
     *        sorted as text
     *
     * Numbers one apart share a token, so nearby values fall into
     * overlapping keys.
     */
    static std::vector<std::string> integerNeighbourhood(double number);

    /**
     * @brief American Soundex code of a single word ("Robert" -> "R163")
     */
    static std::string soundex(const std::string& word);

    /**
     * @brief Upper-cased word with vowels removed after the first letter
     */
    static std::string consonants(const std::string& word);

    /**
     * @brief Split on whitespace, dropping empty tokens
     */
    static std::vector<std::string> tokenize(const std::string& text);

    static std::string toLower(const std::string& text);
    static std::string toUpper(const std::string& text);

    /**
     * @brief Keep digits only and left-pad with zeros to the given width
     */
    static std::string phoneDigits(const std::string& text, int width);

private:
    KeyEncoder() = delete;
};

} // namespace dedup

#endif // DEDUP_BLOCKING_KEYENCODER_HPP
