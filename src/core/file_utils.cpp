#include "core/file_utils.hpp"
#include "core/errors.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <cctype>
#include <fstream>
#include <sstream>
#include <filesystem>

namespace apguard
{
    namespace core
    {
        namespace files
        {

            namespace
            {
                std::string errno_text()
                {
                    return std::strerror(errno);
                }
            } // namespace

            void write_file_atomically(const std::string &path, const std::string &contents, mode_t mode)
            {
                const std::string tmp_path = path + ".tmp." + std::to_string(getpid());
                const int flags = O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC;

                int fd = ::open(tmp_path.c_str(), flags, mode);
                if (fd < 0 && errno == EEXIST)
                {
                    // Left over from a crashed writer with the same pid, or planted; never write through it
                    ::unlink(tmp_path.c_str());
                    fd = ::open(tmp_path.c_str(), flags, mode);
                }
                if (fd < 0)
                {
                    throw ConfigurationError("Cannot create " + tmp_path + ": " + errno_text());
                }

                // umask may have narrowed the requested mode
                if (fchmod(fd, mode) != 0)
                {
                    std::string reason = errno_text();
                    ::close(fd);
                    ::unlink(tmp_path.c_str());
                    throw ConfigurationError("Cannot set permissions on " + tmp_path + ": " + reason);
                }

                size_t written = 0;
                while (written < contents.size())
                {
                    ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
                    if (n < 0)
                    {
                        if (errno == EINTR)
                            continue;
                        std::string reason = errno_text();
                        ::close(fd);
                        ::unlink(tmp_path.c_str());
                        throw ConfigurationError("Cannot write " + tmp_path + ": " + reason);
                    }
                    written += static_cast<size_t>(n);
                }

                if (fsync(fd) != 0 || ::close(fd) != 0)
                {
                    std::string reason = errno_text();
                    ::unlink(tmp_path.c_str());
                    throw ConfigurationError("Cannot flush " + tmp_path + ": " + reason);
                }

                if (::rename(tmp_path.c_str(), path.c_str()) != 0)
                {
                    std::string reason = errno_text();
                    ::unlink(tmp_path.c_str());
                    throw ConfigurationError("Cannot replace " + path + ": " + reason);
                }
            }

            std::optional<std::string> read_file(const std::string &path)
            {
                std::ifstream file(path);
                if (!file.is_open())
                {
                    return std::nullopt;
                }
                std::stringstream buffer;
                buffer << file.rdbuf();
                return buffer.str();
            }

            std::optional<std::string> read_first_line(const std::string &path)
            {
                std::ifstream file(path);
                if (!file.is_open())
                {
                    return std::nullopt;
                }
                std::string line;
                std::getline(file, line);
                while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back())))
                {
                    line.pop_back();
                }
                return line;
            }

            bool remove_file(const std::string &path)
            {
                if (::unlink(path.c_str()) == 0)
                {
                    return true;
                }
                return errno == ENOENT;
            }

            void ensure_parent_directory(const std::string &path, mode_t mode)
            {
                std::filesystem::path parent = std::filesystem::path(path).parent_path();
                if (parent.empty())
                {
                    return;
                }

                std::error_code ec;
                if (std::filesystem::exists(parent, ec))
                {
                    return;
                }
                std::filesystem::create_directories(parent, ec);
                if (ec)
                {
                    throw ConfigurationError("Cannot create directory " + parent.string() + ": " + ec.message());
                }
                if (::chmod(parent.c_str(), mode) != 0)
                {
                    throw ConfigurationError("Cannot set permissions on " + parent.string() + ": " + errno_text());
                }
            }

            void ensure_private_parent_directory(const std::string &path, uid_t owner)
            {
                std::filesystem::path parent = std::filesystem::path(path).parent_path();
                if (parent.empty())
                {
                    return;
                }

                struct stat st;
                if (::lstat(parent.c_str(), &st) != 0)
                {
                    if (errno != ENOENT)
                    {
                        throw ConfigurationError("Cannot inspect directory " + parent.string() + ": " + errno_text());
                    }
                    ensure_parent_directory(parent.string(), 0755);
                    if (::mkdir(parent.c_str(), 0700) != 0 && errno != EEXIST)
                    {
                        throw ConfigurationError("Cannot create directory " + parent.string() + ": " + errno_text());
                    }
                    if (::lstat(parent.c_str(), &st) != 0)
                    {
                        throw ConfigurationError("Cannot inspect directory " + parent.string() + ": " + errno_text());
                    }
                }

                if (!S_ISDIR(st.st_mode))
                {
                    throw ConfigurationError(parent.string() + " is not a directory");
                }
                if (st.st_uid != owner)
                {
                    throw ConfigurationError(parent.string() + " is owned by uid " + std::to_string(st.st_uid) +
                                             ", expected uid " + std::to_string(owner));
                }
                if ((st.st_mode & 0077) != 0 && ::chmod(parent.c_str(), 0700) != 0)
                {
                    throw ConfigurationError("Cannot set permissions on " + parent.string() + ": " + errno_text());
                }
            }

        } // namespace files
    } // namespace core
} // namespace apguard
