#pragma once

#include <string>
#include <string_view>
#include <array>

namespace graphlink {

enum class AccessMode {
    Unset,
    Read,
    Write
};

class StatementClassifier {
public:
    StatementClassifier() = default;

    // Write if any write keyword appears as a whole uppercase word, Read otherwise.
    // Never returns AccessMode::Unset.
    static AccessMode classify(std::string_view statement);

    static bool isWrite(std::string_view statement) {
        return classify(statement) == AccessMode::Write;
    }

    static std::string modeToString(AccessMode mode);

    static constexpr std::array<std::string_view, 4> WRITE_KEYWORDS = {
        "CREATE", "SET", "MERGE", "DELETE"
    };
};

}  // namespace graphlink
