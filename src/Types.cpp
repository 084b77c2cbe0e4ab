#include "Types.hpp"
#include <algorithm>
#include <stdexcept>

namespace graphlink {

Record::Record(std::vector<std::string> keys, std::vector<Value> values)
    : m_keys(std::move(keys))
    , m_values(std::move(values)) {
    if (!m_keys.empty() && m_keys.size() != m_values.size()) {
        throw std::invalid_argument("Record has " + std::to_string(m_keys.size()) +
                                    " keys but " + std::to_string(m_values.size()) + " values");
    }
}

const Value& Record::value(size_t index) const {
    if (index >= m_values.size()) {
        throw std::out_of_range("Record has no value at index " + std::to_string(index));
    }
    return m_values[index];
}

const Value& Record::get(const std::string& key) const {
    auto it = std::find(m_keys.begin(), m_keys.end(), key);
    if (it == m_keys.end()) {
        throw std::out_of_range("Record has no value for key '" + key + "'");
    }
    return m_values[static_cast<size_t>(it - m_keys.begin())];
}

bool Record::hasValue(const std::string& key) const {
    return std::find(m_keys.begin(), m_keys.end(), key) != m_keys.end();
}

Result::Result(std::vector<Record> records, std::optional<std::string> tag)
    : m_records(std::move(records))
    , m_tag(std::move(tag)) {
}

const Record& Result::firstRecord() const {
    if (m_records.empty()) {
        throw std::out_of_range("Result contains no records");
    }
    return m_records.front();
}

void ResultCollection::add(Result result) {
    m_results.push_back(std::move(result));
}

const Result* ResultCollection::get(const std::string& tag) const {
    for (const auto& result : m_results) {
        if (result.tag() && *result.tag() == tag) {
            return &result;
        }
    }
    return nullptr;
}

Statement::Statement(std::string text, Parameters parameters, std::optional<std::string> tag)
    : m_text(std::move(text))
    , m_parameters(std::move(parameters))
    , m_tag(std::move(tag)) {
}

StatementStack::StatementStack(std::optional<std::string> tag)
    : m_tag(std::move(tag)) {
}

void StatementStack::push(std::string text, Parameters parameters, std::optional<std::string> tag) {
    m_statements.emplace_back(std::move(text), std::move(parameters), std::move(tag));
}

}  // namespace graphlink
