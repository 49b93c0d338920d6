/**
 * @file RecordReader.hpp
 * @brief Loading records from JSON and NDJSON
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_IO_RECORDREADER_HPP
#define DEDUP_IO_RECORDREADER_HPP

#include "../config/JsonValue.hpp"
#include "../core/Record.hpp"
#include <string>

namespace dedup {

/**
 * @brief Reads records from a JSON array or newline-delimited JSON objects
 *
 * Nested objects are flattened into dot-paths ("address.city") and array
 * elements into indexed paths ("phones.0"). JSON null becomes a null value,
 * which comparators and blocking treat as missing.
 */
class RecordReader {
public:
    /**
     * @throws std::runtime_error if the file can't be read or parsed
     */
    static RecordList readFile(const std::string& filepath);

    /**
     * @throws std::runtime_error on malformed JSON or a non-object record
     */
    static RecordList readString(const std::string& content);

    /**
     * @brief Flattened record from one JSON object
     */
    static Record toRecord(const JsonValue& object);

private:
    RecordReader() = delete;

    static void flatten(const std::string& prefix, const JsonValue& node, Record& record);
};

} // namespace dedup

#endif // DEDUP_IO_RECORDREADER_HPP
