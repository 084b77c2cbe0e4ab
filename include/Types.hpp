#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

namespace graphlink {

using json = nlohmann::json;

// Any value a statement can take or return: null, bool, number, string, list or map
using Value = json;

// Statement parameters, always a JSON object
using Parameters = json;

class Record {
public:
    Record() = default;
    Record(std::vector<std::string> keys, std::vector<Value> values);

    const std::vector<std::string>& keys() const { return m_keys; }
    const std::vector<Value>& values() const { return m_values; }

    // Throws std::out_of_range for a bad index or unknown key
    const Value& value(size_t index) const;
    const Value& get(const std::string& key) const;

    bool hasValue(const std::string& key) const;
    size_t size() const { return m_values.size(); }

private:
    std::vector<std::string> m_keys;
    std::vector<Value> m_values;
};

class Result {
public:
    Result() = default;
    explicit Result(std::vector<Record> records, std::optional<std::string> tag = std::nullopt);

    const std::vector<Record>& records() const { return m_records; }

    // Throws std::out_of_range when the result is empty
    const Record& firstRecord() const;

    size_t size() const { return m_records.size(); }
    bool empty() const { return m_records.empty(); }

    const std::optional<std::string>& tag() const { return m_tag; }

private:
    std::vector<Record> m_records;
    std::optional<std::string> m_tag;
};

class ResultCollection {
public:
    void add(Result result);

    const std::vector<Result>& results() const { return m_results; }
    size_t size() const { return m_results.size(); }

    // First result carrying the tag, nullptr if none
    const Result* get(const std::string& tag) const;

private:
    std::vector<Result> m_results;
};

// Base for everything runMixed() accepts in its queue
class QueueEntry {
public:
    virtual ~QueueEntry() = default;

protected:
    QueueEntry() = default;
};

class Statement : public QueueEntry {
public:
    explicit Statement(std::string text,
                       Parameters parameters = Parameters::object(),
                       std::optional<std::string> tag = std::nullopt);

    const std::string& text() const { return m_text; }
    const Parameters& parameters() const { return m_parameters; }
    const std::optional<std::string>& tag() const { return m_tag; }

private:
    std::string m_text;
    Parameters m_parameters;
    std::optional<std::string> m_tag;
};

// Ordered batch of statements pushed into one pipeline
class StatementStack : public QueueEntry {
public:
    explicit StatementStack(std::optional<std::string> tag = std::nullopt);

    void push(std::string text,
              Parameters parameters = Parameters::object(),
              std::optional<std::string> tag = std::nullopt);

    const std::vector<Statement>& statements() const { return m_statements; }
    const std::optional<std::string>& tag() const { return m_tag; }

    size_t size() const { return m_statements.size(); }
    bool isEmpty() const { return m_statements.empty(); }

private:
    std::optional<std::string> m_tag;
    std::vector<Statement> m_statements;
};

using Queue = std::vector<std::shared_ptr<const QueueEntry>>;

}  // namespace graphlink
