#pragma once
#include "Common.h"
#include <cstdint>
#include <optional>
#include <ostream>

namespace FileToolkit
{
    /**
     * @brief A file or directory designated by a path, whether or not it
     * currently exists on disk.
     *
     * Every query goes straight to the filesystem; nothing besides the path
     * is cached. Metadata, listing, creation, move and removal operations
     * report failure through their return value and never throw. Only the
     * content operations (read, append, write) throw OperationError.
     */
    class PathEntry
    {
    public:
        /**
         * @brief Constructs an entry for the given path. A single trailing
         * separator is stripped; nothing else is normalized.
         */
        explicit PathEntry(std::string path);

        // --- Path Decomposition ---

        std::string toString() const;
        const std::string& getPath() const;

        /**
         * @brief Returns the parent directory ("dirname" semantics).
         * "a/b/c" gives "a/b", a bare name gives ".", "/" gives "/".
         */
        std::string getDirectory() const;

        /**
         * @brief Returns the final path component ("basename" semantics).
         */
        std::string getName() const;

        /**
         * @brief Returns the text after the last '.' of the name, or "".
         */
        std::string getExtension() const;

        /**
         * @brief Returns a content-type guess, or std::nullopt if the entry
         * does not exist or could not be identified.
         */
        std::optional<std::string> getMimeType() const;

        // --- Metadata Queries ---

        bool exists() const;
        bool canExecute() const;
        bool canRead() const;
        bool canWrite() const;
        bool isFile() const;
        bool isDirectory() const;

        /**
         * @brief Returns the size in bytes, or -1 on failure.
         */
        std::int64_t length() const;
        std::int64_t size() const { return length(); }
        std::int64_t count() const { return length(); }

        /**
         * @brief Returns the time of the last modification as a unix
         * timestamp, or -1 on failure.
         */
        std::int64_t lastModified() const;

        // --- Directory Listing ---

        /**
         * @brief Returns the names of the files and directories inside this
         * directory. Empty if the entry is not a directory.
         * @param recursive Descend into subdirectories (pre-order).
         * @param showHidden Include dotfiles and the "." / ".." entries.
         */
        std::vector<std::string> listAll(bool recursive = false, bool showHidden = false) const;
        std::vector<std::string> listDirectories(bool recursive = false, bool showHidden = false) const;
        std::vector<std::string> listFiles(bool recursive = false, bool showHidden = false) const;

        // --- Mutating Operations ---

        /**
         * @brief Creates an empty file, truncating an existing one only when
         * overwrite is set.
         * @return true if the file has been created.
         */
        bool makeFile(bool overwrite = false);

        /**
         * @brief Creates the directory with exactly the given permission
         * bits. The process umask is ignored.
         * @param recursive Also create missing parent directories.
         * @return false if the path already exists or creation failed.
         */
        bool makeDirectory(bool recursive = false, mode_t permissions = DEFAULT_DIRECTORY_PERMISSIONS);

        /**
         * @brief Moves the entry to destination. On success this entry
         * designates the destination.
         * @return true if the entry has been moved.
         */
        bool move(const std::string& destination, bool overwrite = false);

        /**
         * @brief Moves the entry inside its current directory. Only the
         * basename of newName is used.
         */
        bool rename(const std::string& newName, bool overwrite = false);

        /**
         * @brief Removes the directory. Without recursive the directory must
         * be empty. With recursive the whole tree is deleted and the call
         * returns true once the traversal completes, even if individual
         * deletions failed.
         */
        bool removeDirectory(bool recursive = false);

        bool removeFile();

        // --- Content I/O ---

        /**
         * @brief Returns the whole content of the file.
         * @throws OperationError if the content can't be read.
         */
        std::string read() const;

        /**
         * @throws OperationError if the content can't be appended.
         */
        void append(const std::string& content);

        /**
         * @brief Replaces the whole content of the file, creating it if needed.
         * @throws OperationError if the content can't be written.
         */
        void write(const std::string& content);

    private:
        enum class EntryKind { Any, Directory, File };

        std::vector<std::string> list(EntryKind kind, bool recursive, bool showHidden) const;

        static void collectNames(const fs::path& directory, EntryKind kind, bool recursive,
                                 bool showHidden, std::vector<std::string>& names);

        std::string m_path;
    };

    std::ostream& operator<<(std::ostream& os, const PathEntry& entry);

} // namespace FileToolkit
