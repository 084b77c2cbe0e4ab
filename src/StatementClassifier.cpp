#include "StatementClassifier.hpp"
#include <regex>

namespace graphlink {

namespace {

std::regex buildWritePattern() {
    std::string alternatives;
    for (auto keyword : StatementClassifier::WRITE_KEYWORDS) {
        if (!alternatives.empty()) {
            alternatives += '|';
        }
        alternatives += keyword;
    }
    return std::regex("\\b(" + alternatives + ")\\b");
}

}  // namespace

AccessMode StatementClassifier::classify(std::string_view statement) {
    // Whole uppercase words only: OFFSET, RESET or "created" stay reads
    static const std::regex kWritePattern = buildWritePattern();

    if (std::regex_search(statement.begin(), statement.end(), kWritePattern)) {
        return AccessMode::Write;
    }
    return AccessMode::Read;
}

std::string StatementClassifier::modeToString(AccessMode mode) {
    switch (mode) {
        case AccessMode::Unset: return "UNSET";
        case AccessMode::Read: return "READ";
        case AccessMode::Write: return "WRITE";
    }
    return "UNKNOWN";
}

}  // namespace graphlink
