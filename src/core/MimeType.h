#pragma once

#include <optional>
#include <string>

namespace FileToolkit
{
    /**
     * @brief Guesses the content type of an existing file or directory.
     * @param path The filesystem path to inspect.
     * @return The MIME name (e.g. "text/plain"), or std::nullopt when the
     * path is missing or no type could be determined.
     */
    std::optional<std::string> detectMimeType(const std::string& path);

} // namespace FileToolkit
