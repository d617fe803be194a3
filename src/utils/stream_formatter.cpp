/**
 * @file stream_formatter.cpp
 * @brief Implementation of stream-json rendering
 *
 * @date 2025
 */

#include "noritest/utils/stream_formatter.hpp"
#include "noritest/utils/string_utils.hpp"

#include <iomanip>
#include <sstream>

namespace noritest {
namespace utils {

namespace {

// ANSI colors
const std::string RESET = "\x1b[0m";
const std::string CYAN = "\x1b[36m";
const std::string YELLOW = "\x1b[33m";
const std::string GREEN = "\x1b[32m";
const std::string RED = "\x1b[31m";
const std::string DIM = "\x1b[2m";

std::string StringField(const nlohmann::ordered_json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// Numbers that are absent or zero are omitted from the summary
double NumberField(const nlohmann::ordered_json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

std::string Fixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

} // anonymous namespace

std::vector<std::string> StreamFormatter::ProcessChunk(const std::string& data) {
    std::vector<std::string> lines;
    if (data.empty()) {
        return lines;
    }

    buffer_ += data;

    std::size_t start = 0;
    std::size_t newline;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        std::string line = StringUtils::Trim(buffer_.substr(start, newline - start));
        start = newline + 1;
        if (line.empty()) {
            continue;
        }

        Message message = Message::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            continue;
        }

        std::string formatted = FormatMessage(message);
        if (!formatted.empty()) {
            lines.push_back(std::move(formatted));
        }
    }
    buffer_.erase(0, start);

    return lines;
}

std::string StreamFormatter::FormatMessage(const Message& message) const {
    std::string type = StringField(message, "type");
    if (type == "system") {
        return FormatSystem(message);
    }
    if (type == "assistant") {
        return FormatAssistant(message);
    }
    if (type == "user") {
        return FormatUser(message);
    }
    if (type == "result") {
        return FormatResult(message);
    }
    return "";
}

std::string StreamFormatter::FormatSystem(const Message& message) const {
    std::string session = StringField(message, "session_id");
    if (StringField(message, "subtype") != "init" || session.empty()) {
        return "";
    }

    std::size_t tools = 0;
    auto it = message.find("tools");
    if (it != message.end() && it->is_array()) {
        tools = it->size();
    }

    return DIM + "▶ Session started: " + session + " (" + std::to_string(tools) +
           " tools available)" + RESET;
}

std::string StreamFormatter::FormatAssistant(const Message& message) const {
    auto body = message.find("message");
    if (body == message.end() || !body->is_object()) {
        return "";
    }
    auto content = body->find("content");
    if (content == body->end()) {
        return "";
    }

    if (content->is_string()) {
        std::string text = content->get<std::string>();
        return text.empty() ? "" : CYAN + "Claude:" + RESET + " " + text;
    }
    if (!content->is_array()) {
        return "";
    }

    std::vector<std::string> parts;
    for (const auto& block : *content) {
        if (!block.is_object()) {
            continue;
        }
        std::string type = StringField(block, "type");
        if (type == "text") {
            std::string text = StringField(block, "text");
            if (!text.empty()) {
                parts.push_back(CYAN + "Claude:" + RESET + " " + text);
            }
        } else if (type == "tool_use") {
            std::string name = StringField(block, "name");
            if (!name.empty()) {
                parts.push_back(YELLOW + "\U0001F527 " + name + ":" + RESET + " " +
                                SummarizeToolUse(block));
            }
        }
    }

    return StringUtils::Join(parts, "\n");
}

std::string StreamFormatter::SummarizeToolUse(const Message& block) {
    static const Message EMPTY = Message::object();
    auto found = block.find("input");
    const Message& input = (found != block.end() && found->is_object()) ? *found : EMPTY;

    std::string name = StringField(block, "name");
    std::string file_path = StringField(input, "file_path");
    std::string pattern = StringField(input, "pattern");

    if ((name == "Read" || name == "Write" || name == "Edit") && !file_path.empty()) {
        return StringUtils::Truncate(file_path, TOOL_SUMMARY_LENGTH);
    }

    if (name == "Bash") {
        std::string command = StringField(input, "command");
        if (!command.empty()) {
            std::string description = StringField(input, "description");
            return StringUtils::Truncate(description.empty() ? command : description,
                                         TOOL_SUMMARY_LENGTH);
        }
    }

    if ((name == "Grep" || name == "Glob") && !pattern.empty()) {
        return StringUtils::Truncate("pattern: " + pattern, TOOL_SUMMARY_LENGTH);
    }

    // Fall back to the first argument
    if (!input.empty()) {
        const auto& value = input.begin().value();
        return StringUtils::Truncate(value.is_string() ? value.get<std::string>() : value.dump(),
                                     TOOL_SUMMARY_LENGTH);
    }

    return "(no input)";
}

std::string StreamFormatter::FormatUser(const Message& message) const {
    auto body = message.find("message");
    if (body == message.end() || !body->is_object()) {
        return "";
    }
    auto content = body->find("content");
    if (content == body->end() || !content->is_array()) {
        return "";
    }

    std::vector<std::string> parts;
    for (const auto& block : *content) {
        if (block.is_object() && StringField(block, "type") == "tool_result") {
            auto result = block.find("content");
            std::string summary = result == block.end()
                ? "(empty)"
                : SummarizeToolResult(*result);
            parts.push_back(DIM + "   ↳ Result: " + summary + RESET);
        }
    }

    return StringUtils::Join(parts, "\n");
}

std::string StreamFormatter::SummarizeToolResult(const Message& content) {
    if (content.is_string()) {
        return StringUtils::Truncate(StringUtils::CollapseWhitespace(content.get<std::string>()),
                                     TOOL_RESULT_LENGTH);
    }
    if (content.is_object() || content.is_array()) {
        return StringUtils::Truncate(content.dump(), TOOL_RESULT_LENGTH);
    }
    return "(empty)";
}

std::string StreamFormatter::FormatResult(const Message& message) const {
    auto is_error = message.find("is_error");
    bool failed = is_error != message.end() && is_error->is_boolean() && is_error->get<bool>();

    if (StringField(message, "subtype") == "success" || !failed) {
        std::vector<std::string> stats;
        double cost = NumberField(message, "total_cost_usd");
        double duration_ms = NumberField(message, "duration_ms");
        double turns = NumberField(message, "num_turns");
        if (cost != 0.0) {
            stats.push_back("$" + Fixed(cost, 4));
        }
        if (duration_ms != 0.0) {
            stats.push_back(Fixed(duration_ms / 1000.0, 1) + "s");
        }
        if (turns != 0.0) {
            stats.push_back(std::to_string(static_cast<long long>(turns)) + " turns");
        }

        std::string line = GREEN + "✓ Complete" + RESET;
        if (!stats.empty()) {
            line += " (" + StringUtils::Join(stats, ", ") + ")";
        }
        return line;
    }

    std::string result = StringField(message, "result");
    std::string detail = result.empty() ? "" : ": " + StringUtils::Truncate(result, TOOL_SUMMARY_LENGTH);
    return RED + "✗ Error" + detail + RESET;
}

} // namespace utils
} // namespace noritest
