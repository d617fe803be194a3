/**
 * @file markdown.cpp
 * @brief Implementation of prompt templating
 *
 * @date 2025
 */

#include "noritest/utils/markdown.hpp"
#include "noritest/utils/string_utils.hpp"

namespace noritest {
namespace utils {

namespace {

const char* const STATUS_INSTRUCTIONS = R"(

---

## Test Completion Instructions

When you have completed the task above, you MUST write a status file to indicate success or failure.

**Status file path:** `{{STATUS_FILE_PATH}}`

**Format (JSON):**
```json
{
  "status": "success"
}
```

Or if the task failed:
```json
{
  "status": "failure",
  "error": "Description of what went wrong"
}
```

**Important:**
- The `status` field MUST be either `"success"` or `"failure"`
- The `error` field is optional but recommended when status is `"failure"`
- Write the file using: `echo '{"status": "success"}' > {{STATUS_FILE_PATH}}`
- Do NOT proceed with any other tasks after writing the status file
)";

} // anonymous namespace

std::string AppendStatusInstructions(const std::string& markdown,
                                     const std::string& status_file_path) {
    return markdown + StringUtils::ReplaceAll(STATUS_INSTRUCTIONS,
                                              STATUS_PATH_PLACEHOLDER,
                                              status_file_path);
}

} // namespace utils
} // namespace noritest
