// ═══════════════════════════════════════════════════════════════════
//  src/declaration.cpp — Text helpers shared by the renderers
// ═══════════════════════════════════════════════════════════════════

#include "gqlts/declaration.h"

#include <algorithm>
#include <sstream>

namespace gqlts::text {

std::string uniqueName(const std::string& base, const std::vector<std::string>& taken) {
    auto isTaken = [&](const std::string& candidate) {
        return std::find(taken.begin(), taken.end(), candidate) != taken.end();
    };

    if (!isTaken(base)) return base;
    for (std::size_t suffix = 1;; ++suffix) {
        auto candidate = base + std::to_string(suffix);
        if (!isTaken(candidate)) return candidate;
    }
}

std::string futureProofArm(const std::vector<std::string>& members) {
    return "{ __typename?: " + quote(uniqueName(FutureAddedValue, members)) + " }";
}

std::string comment(const std::string& description, int indent) {
    if (description.empty()) return "";

    std::string pad(static_cast<std::size_t>(indent), ' ');
    std::vector<std::string> lines;
    std::istringstream in(description);
    for (std::string line; std::getline(in, line);) {
        // "*/" inside a description would close the comment early
        std::size_t pos = 0;
        while ((pos = line.find("*/", pos)) != std::string::npos) {
            line.replace(pos, 2, "*\\/");
            pos += 3;
        }
        lines.push_back(line);
    }

    if (lines.size() == 1) {
        return pad + "/** " + lines[0] + " */\n";
    }

    std::string out = pad + "/**\n";
    for (auto& line : lines) {
        out += pad + " *";
        if (!line.empty()) out += " " + line;
        out += "\n";
    }
    out += pad + " */\n";
    return out;
}

std::string quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        switch (c) {
            case '\'':  out += "\\'"; break;
            case '\\':  out += "\\\\"; break;
            case '\n':  out += "\\n"; break;
            case '\r':  out += "\\r"; break;
            default:    out += c;
        }
    }
    out += "'";
    return out;
}

} // namespace gqlts::text
