/**
 * @file stream_formatter.hpp
 * @brief Human-readable rendering of the agent's stream-json output
 *
 * The agent writes one JSON message per line. Chunks from the container do
 * not respect line boundaries, so the formatter keeps the trailing partial
 * line until the rest arrives.
 *
 * **Rendered message types**:
 * - system/init: session start with tool count
 * - assistant: text blocks and tool calls with a short argument summary
 * - user: tool results, collapsed to one line
 * - result: completion with cost, duration and turns, or an error
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace noritest {
namespace utils {

/**
 * @class StreamFormatter
 * @brief Turns JSONL chunks into display lines
 *
 * Lines that are not valid JSON, and message types that carry nothing to
 * show, produce no output.
 */
class StreamFormatter {
public:
    static constexpr std::size_t TOOL_SUMMARY_LENGTH = 80;
    static constexpr std::size_t TOOL_RESULT_LENGTH = 100;

    /**
     * @brief Consume a chunk of output
     * @return Display lines for every complete message in the chunk
     */
    std::vector<std::string> ProcessChunk(const std::string& data);

    /// Bytes held back waiting for a newline
    const std::string& Pending() const { return buffer_; }

private:
    using Message = nlohmann::ordered_json;

    std::string FormatMessage(const Message& message) const;
    std::string FormatSystem(const Message& message) const;
    std::string FormatAssistant(const Message& message) const;
    std::string FormatUser(const Message& message) const;
    std::string FormatResult(const Message& message) const;

    static std::string SummarizeToolUse(const Message& block);
    static std::string SummarizeToolResult(const Message& content);

    std::string buffer_;
};

} // namespace utils
} // namespace noritest
