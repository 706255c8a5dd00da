#ifndef SHRINK_MIME_DETECTOR_HPP
#define SHRINK_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace shrink {

    /**
     * @brief Content-based file type detection.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file from its content.
         *
         * @param path The file to inspect.
         * @return The MIME type (e.g. "image/jpeg"), or an empty string if
         *         detection is unavailable or failed.
         *
         * @note Uses libmagic with the system database. A libmagic cookie is
         *       not thread-safe, so each call opens its own.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace shrink

#endif //SHRINK_MIME_DETECTOR_HPP
