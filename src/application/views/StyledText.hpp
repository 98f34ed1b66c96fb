/**
 * @file StyledText.hpp
 * @brief Front-end independent description of a rendered screen.
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace crmterm::application {

/**
 * @enum Role
 * @brief Semantic color role of a text span. The front end maps roles to colors.
 */
enum class Role {
    Plain,
    Title,
    Subtitle,
    Accent,
    Primary,
    Secondary,
    Success,
    Warning,
    Danger,
    Faint,
    Highlight,
    Border,
    HelpKey,
    HelpValue
};

struct StyledSpan {
    Role role = Role::Plain;
    std::string text;
};

/**
 * @struct StyledLine
 * @brief One output line made of colored spans. An empty line is a spacer.
 */
struct StyledLine {
    std::vector<StyledSpan> spans;

    StyledLine() = default;
    StyledLine(Role role, std::string text) {
        spans.push_back(StyledSpan{role, std::move(text)});
    }

    StyledLine& append(Role role, std::string text) {
        spans.push_back(StyledSpan{role, std::move(text)});
        return *this;
    }

    std::string plainText() const {
        std::string out;
        for (const auto& span : spans) {
            out += span.text;
        }
        return out;
    }
};

/**
 * @struct InputSpec
 * @brief Shape of the single command line shown under the screen.
 */
struct InputSpec {
    std::string prompt = "> ";
    std::string placeholder;
    std::size_t charLimit = 0;  ///< 0 = unlimited.
    std::string initialText;    ///< Buffer content after the screen changed.
};

struct RenderedView {
    std::vector<StyledLine> lines;
    InputSpec input;

    /** @brief True if any line contains @p needle (plain text). */
    bool contains(const std::string& needle) const {
        for (const auto& line : lines) {
            if (line.plainText().find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
};

} // namespace crmterm::application
