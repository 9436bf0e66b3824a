#ifndef APGUARD_CORE_FILE_UTILS_HPP
#define APGUARD_CORE_FILE_UTILS_HPP

#include <string>
#include <optional>
#include <sys/types.h>

namespace apguard
{
    namespace core
    {
        namespace files
        {

            /**
             * Write to a sibling temp file, fsync, then rename over the target,
             * so a concurrent reader sees either the old or the new document.
             * Throws ConfigurationError on failure.
             */
            void write_file_atomically(const std::string &path, const std::string &contents, mode_t mode);

            // Whole file, or nullopt if it does not exist / cannot be read
            std::optional<std::string> read_file(const std::string &path);

            // First line of a small file with trailing whitespace removed
            std::optional<std::string> read_first_line(const std::string &path);

            // Returns true if the file was removed or did not exist
            bool remove_file(const std::string &path);

            void ensure_parent_directory(const std::string &path, mode_t mode);

            /**
             * Parent of `path` as a real directory owned by `owner` and closed
             * to everyone else (0700). Created if missing; group/other bits are
             * cleared on an existing one. Throws ConfigurationError for a
             * symlink, a non-directory or a foreign owner.
             */
            void ensure_private_parent_directory(const std::string &path, uid_t owner);

        } // namespace files
    } // namespace core
} // namespace apguard

#endif // APGUARD_CORE_FILE_UTILS_HPP
