#include "PathEntry.h"
#include "Log.h"
#include "MimeType.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <utility>
#include <sys/stat.h>
#include <unistd.h>

namespace FileToolkit
{
    namespace
    {
        const char* const READ_FAILED = "Can't read the content.";
        const char* const APPEND_FAILED = "Can't append the given content.";
        const char* const WRITE_FAILED = "Can't write the given content.";

        // dirname(3) without touching the caller's buffer
        std::string directoryOf(const std::string& path)
        {
            if (path.empty()) return ".";

            std::size_t end = path.find_last_not_of(DIRECTORY_SEPARATOR);
            if (end == std::string::npos) return std::string(1, DIRECTORY_SEPARATOR);

            std::size_t sep = path.rfind(DIRECTORY_SEPARATOR, end);
            if (sep == std::string::npos) return ".";

            std::size_t parentEnd = path.find_last_not_of(DIRECTORY_SEPARATOR, sep);
            if (parentEnd == std::string::npos) return std::string(1, DIRECTORY_SEPARATOR);
            return path.substr(0, parentEnd + 1);
        }

        // basename(3) without touching the caller's buffer
        std::string nameOf(const std::string& path)
        {
            if (path.empty()) return "";

            std::size_t end = path.find_last_not_of(DIRECTORY_SEPARATOR);
            if (end == std::string::npos) return std::string(1, DIRECTORY_SEPARATOR);

            std::size_t sep = path.rfind(DIRECTORY_SEPARATOR, end);
            std::size_t start = (sep == std::string::npos) ? 0 : sep + 1;
            return path.substr(start, end - start + 1);
        }

        std::string joinPath(const std::string& directory, const std::string& name)
        {
            if (!directory.empty() && directory.back() == DIRECTORY_SEPARATOR) {
                return directory + name;
            }
            return directory + DIRECTORY_SEPARATOR + name;
        }

        /**
         * @brief Clears the process umask for its lifetime so that mkdir
         * applies the requested mode verbatim.
         */
        class UmaskGuard
        {
        public:
            UmaskGuard() : m_previous(::umask(0)) {}
            ~UmaskGuard() { ::umask(m_previous); }

            UmaskGuard(const UmaskGuard&) = delete;
            UmaskGuard& operator=(const UmaskGuard&) = delete;

        private:
            mode_t m_previous;
        };

        // Deletes everything below directory, children before their parent.
        // Failures are logged and skipped.
        void removeContents(const fs::path& directory)
        {
            std::error_code ec;
            std::vector<fs::directory_entry> children;
            for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
                children.push_back(*it);
            }
            if (ec) {
                Log::warning("could not list '" + directory.string() + "': " + ec.message());
            }

            for (const auto& child : children) {
                std::error_code statEc;
                if (child.is_directory(statEc) && !child.is_symlink(statEc)) {
                    removeContents(child.path());
                    if (::rmdir(child.path().c_str()) != 0) {
                        int err = errno;
                        Log::warning("could not remove directory '" + child.path().string() + "': " + std::strerror(err));
                    }
                } else {
                    std::error_code removeEc;
                    if (!fs::remove(child.path(), removeEc)) {
                        Log::warning("could not remove '" + child.path().string() + "': " + removeEc.message());
                    }
                }
            }
        }

        // Fallback for rename(2) failing with EXDEV. A partial copy is removed
        // unless it was written over an existing destination.
        bool moveAcrossDevices(const fs::path& from, const fs::path& to)
        {
            std::error_code ec;
            bool destinationExisted = fs::exists(to, ec);
            fs::copy(from, to,
                     fs::copy_options::recursive | fs::copy_options::overwrite_existing | fs::copy_options::copy_symlinks,
                     ec);
            if (ec) {
                Log::error("could not copy '" + from.string() + "' to '" + to.string() + "': " + ec.message());
                if (!destinationExisted) {
                    std::error_code cleanupEc;
                    fs::remove_all(to, cleanupEc);
                }
                return false;
            }

            fs::remove_all(from, ec);
            if (ec) {
                Log::warning("copied '" + from.string() + "' but could not remove it: " + ec.message());
            }
            return true;
        }

    } // namespace

    PathEntry::PathEntry(std::string path)
        : m_path(std::move(path))
    {
        if (!m_path.empty() && m_path.back() == DIRECTORY_SEPARATOR) {
            m_path.pop_back();
        }
    }

    // --- Path Decomposition ---

    std::string PathEntry::toString() const
    {
        return m_path;
    }

    const std::string& PathEntry::getPath() const
    {
        return m_path;
    }

    std::string PathEntry::getDirectory() const
    {
        return directoryOf(m_path);
    }

    std::string PathEntry::getName() const
    {
        return nameOf(m_path);
    }

    std::string PathEntry::getExtension() const
    {
        std::string name = getName();
        std::size_t dot = name.rfind('.');
        if (dot == std::string::npos) return "";
        return name.substr(dot + 1);
    }

    std::optional<std::string> PathEntry::getMimeType() const
    {
        if (!exists()) return std::nullopt;
        return detectMimeType(m_path);
    }

    // --- Metadata Queries ---

    bool PathEntry::exists() const
    {
        std::error_code ec;
        return fs::exists(m_path, ec);
    }

    bool PathEntry::canExecute() const
    {
        return !m_path.empty() && ::access(m_path.c_str(), X_OK) == 0;
    }

    bool PathEntry::canRead() const
    {
        return !m_path.empty() && ::access(m_path.c_str(), R_OK) == 0;
    }

    bool PathEntry::canWrite() const
    {
        return !m_path.empty() && ::access(m_path.c_str(), W_OK) == 0;
    }

    bool PathEntry::isFile() const
    {
        std::error_code ec;
        return fs::is_regular_file(m_path, ec);
    }

    bool PathEntry::isDirectory() const
    {
        std::error_code ec;
        return fs::is_directory(m_path, ec);
    }

    std::int64_t PathEntry::length() const
    {
        struct stat st;
        if (::stat(m_path.c_str(), &st) != 0) {
            return -1;
        }
        return static_cast<std::int64_t>(st.st_size);
    }

    std::int64_t PathEntry::lastModified() const
    {
        struct stat st;
        if (::stat(m_path.c_str(), &st) != 0) {
            return -1;
        }
        return static_cast<std::int64_t>(st.st_mtime);
    }

    // --- Directory Listing ---

    std::vector<std::string> PathEntry::listAll(bool recursive, bool showHidden) const
    {
        return list(EntryKind::Any, recursive, showHidden);
    }

    std::vector<std::string> PathEntry::listDirectories(bool recursive, bool showHidden) const
    {
        return list(EntryKind::Directory, recursive, showHidden);
    }

    std::vector<std::string> PathEntry::listFiles(bool recursive, bool showHidden) const
    {
        return list(EntryKind::File, recursive, showHidden);
    }

    std::vector<std::string> PathEntry::list(EntryKind kind, bool recursive, bool showHidden) const
    {
        std::vector<std::string> names;
        if (!isDirectory()) {
            return names;
        }
        collectNames(m_path, kind, recursive, showHidden, names);
        return names;
    }

    void PathEntry::collectNames(const fs::path& directory, EntryKind kind, bool recursive,
                                 bool showHidden, std::vector<std::string>& names)
    {
        // The pseudo-entries are directories and are never descended into
        if (showHidden && kind != EntryKind::File) {
            names.push_back(".");
            names.push_back("..");
        }

        std::error_code ec;
        for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
            const fs::directory_entry& entry = *it;
            std::string name = entry.path().filename().string();

            if (!showHidden && !name.empty() && name[0] == '.') {
                continue;
            }

            std::error_code statEc;
            bool isDir = entry.is_directory(statEc);
            bool isReg = !isDir && entry.is_regular_file(statEc);

            if (kind == EntryKind::Any
                || (kind == EntryKind::Directory && isDir)
                || (kind == EntryKind::File && isReg)) {
                names.push_back(name);
            }

            if (recursive && isDir && !entry.is_symlink(statEc)) {
                collectNames(entry.path(), kind, recursive, showHidden, names);
            }
        }

        if (ec) {
            Log::warning("could not list '" + directory.string() + "': " + ec.message());
        }
    }

    // --- Mutating Operations ---

    bool PathEntry::makeFile(bool overwrite)
    {
        if (exists() && !overwrite) {
            return false;
        }

        std::ofstream out(m_path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out) {
            Log::error("could not create file '" + m_path + "'.");
            return false;
        }
        return true;
    }

    bool PathEntry::makeDirectory(bool recursive, mode_t permissions)
    {
        if (exists()) {
            return false;
        }

        UmaskGuard guard;

        if (!recursive) {
            if (::mkdir(m_path.c_str(), permissions) != 0) {
                int err = errno;
                Log::error("could not create directory '" + m_path + "': " + std::strerror(err));
                return false;
            }
            return true;
        }

        // Collect the missing ancestors, deepest first
        std::vector<fs::path> missing;
        std::error_code ec;
        for (fs::path current(m_path); !current.empty() && !fs::exists(current, ec); current = current.parent_path()) {
            missing.push_back(current);
            if (current.parent_path() == current) break;
        }

        for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
            if (::mkdir(it->c_str(), permissions) != 0) {
                int err = errno;
                if (err == EEXIST) continue;
                Log::error("could not create directory '" + it->string() + "': " + std::strerror(err));
                return false;
            }
        }
        return isDirectory();
    }

    bool PathEntry::move(const std::string& destination, bool overwrite)
    {
        if (!exists()) {
            return false;
        }

        PathEntry target(destination);
        if (target.exists() && !overwrite) {
            return false;
        }

        std::error_code ec;
        fs::rename(m_path, target.getPath(), ec);
        if (ec == std::errc::cross_device_link) {
            if (!moveAcrossDevices(m_path, target.getPath())) {
                return false;
            }
        } else if (ec) {
            Log::warning("could not move '" + m_path + "' to '" + target.getPath() + "': " + ec.message());
            return false;
        }

        m_path = target.getPath();
        return true;
    }

    bool PathEntry::rename(const std::string& newName, bool overwrite)
    {
        return move(joinPath(getDirectory(), nameOf(newName)), overwrite);
    }

    bool PathEntry::removeDirectory(bool recursive)
    {
        if (recursive) {
            // A link to a directory is not traversed; its target stays intact
            std::error_code ec;
            if (!isDirectory() || fs::is_symlink(m_path, ec)) {
                return false;
            }
            removeContents(m_path);
        }

        if (::rmdir(m_path.c_str()) != 0) {
            int err = errno;
            Log::warning("could not remove directory '" + m_path + "': " + std::strerror(err));
            return recursive;
        }
        return true;
    }

    bool PathEntry::removeFile()
    {
        if (!isFile()) {
            return false;
        }

        std::error_code ec;
        if (!fs::remove(m_path, ec)) {
            Log::warning("could not remove file '" + m_path + "': " + ec.message());
            return false;
        }
        return true;
    }

    // --- Content I/O ---

    std::string PathEntry::read() const
    {
        // A directory opens fine as an ifstream on Linux but yields no data
        if (isDirectory()) {
            throw OperationError(READ_FAILED);
        }

        std::ifstream in(m_path, std::ios::in | std::ios::binary);
        if (!in) {
            throw OperationError(READ_FAILED);
        }

        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) {
            throw OperationError(READ_FAILED);
        }
        return content;
    }

    void PathEntry::append(const std::string& content)
    {
        std::ofstream out(m_path, std::ios::out | std::ios::app | std::ios::binary);
        if (!out) {
            throw OperationError(APPEND_FAILED);
        }

        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            throw OperationError(APPEND_FAILED);
        }
    }

    void PathEntry::write(const std::string& content)
    {
        std::ofstream out(m_path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out) {
            throw OperationError(WRITE_FAILED);
        }

        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            throw OperationError(WRITE_FAILED);
        }
    }

    std::ostream& operator<<(std::ostream& os, const PathEntry& entry)
    {
        return os << entry.getPath();
    }

} // namespace FileToolkit
