/**
 * @file RecordReader.cpp
 * @brief Record reader implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/io/RecordReader.hpp"
#include "dedup/observability/Logging.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dedup {

namespace {

std::string join(const std::string& prefix, const std::string& key) {
    return prefix.empty() ? key : prefix + "." + key;
}

}  // anonymous namespace

void RecordReader::flatten(const std::string& prefix, const JsonValue& node, Record& record) {
    if (node.isObject()) {
        for (const auto& [key, child] : node.getObject()) {
            flatten(join(prefix, key), child, record);
        }
    } else if (node.isArray()) {
        const auto& items = node.getArray();
        for (size_t i = 0; i < items.size(); ++i) {
            flatten(join(prefix, std::to_string(i)), items[i], record);
        }
    } else if (node.isBool()) {
        record.set(prefix, Value(node.getBool()));
    } else if (node.isNumber()) {
        record.set(prefix, Value(node.getNumber()));
    } else if (node.isString()) {
        record.set(prefix, Value(node.getString()));
    } else {
        record.set(prefix, Value());
    }
}

Record RecordReader::toRecord(const JsonValue& object) {
    if (!object.isObject()) {
        throw std::runtime_error(std::string("Record must be a JSON object, got ") + object.typeName());
    }
    Record record;
    flatten("", object, record);
    return record;
}

RecordList RecordReader::readString(const std::string& content) {
    std::vector<JsonValue> documents;

    // A single array document, or a stream of objects
    size_t start = content.find_first_not_of(" \t\r\n");
    if (start != std::string::npos && content[start] == '[') {
        JsonValue root = parseJson(content);
        documents = root.getArray();
    } else {
        documents = parseJsonSequence(content);
    }

    RecordList records;
    records.reserve(documents.size());
    for (size_t i = 0; i < documents.size(); ++i) {
        if (!documents[i].isObject()) {
            throw std::runtime_error("Record " + std::to_string(i) + " is not a JSON object but " +
                                     documents[i].typeName());
        }
        Record record = toRecord(documents[i]);
        record.setId(i);
        records.push_back(std::move(record));
    }

    DEDUP_LOG_DEBUG("records loaded", {observability::intField("count", static_cast<int64_t>(records.size()))});
    return records;
}

RecordList RecordReader::readFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return readString(buffer.str());
}

} // namespace dedup
