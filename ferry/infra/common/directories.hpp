// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

namespace ferry {

//! \brief A directory on the filesystem, created on demand
class Directory {
  public:
    //! \param directory_path the path of the directory, the current path when empty
    //! \param must_create whether the directory is created right away if missing
    explicit Directory(const std::filesystem::path& directory_path, bool must_create = false);
    virtual ~Directory() = default;

    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    bool exists() const;

    const std::filesystem::path& path() const { return path_; }

    //! \brief Creates the directory and its missing parents
    //! \throws std::invalid_argument if the path exists and is not a directory or if it cannot be created
    void create();

  protected:
    std::filesystem::path path_;
};

//! \brief Uniquely named directory under the OS temporary path (or a given base), removed with all its content on
//! destruction
class TemporaryDirectory final : public Directory {
  public:
    TemporaryDirectory() : Directory(unique_path(std::filesystem::temp_directory_path()), true) {}
    explicit TemporaryDirectory(const std::filesystem::path& base_path) : Directory(unique_path(base_path), true) {}

    ~TemporaryDirectory() final;

    //! \brief A path under base_path that does not exist yet
    //! \throws std::invalid_argument if base_path is empty or is not an existing directory
    static std::filesystem::path unique_path(const std::filesystem::path& base_path);
};

//! \brief DataDirectory wraps the directory tree ferry keeps its state in
//! <base_path>
//! ├───ledger   <-- MDBX environment holding jobs, transfer records, checkpoints and storage configurations
//! ├───storage  <-- Default root of Local storage configurations (<storage>/<category>)
//! └───logs     <-- Default location of log files
class DataDirectory final : public Directory {
  public:
    explicit DataDirectory(const std::filesystem::path& base_path, bool create = false)
        : Directory(base_path, create),
          ledger_(base_path / "ledger", create),
          storage_(base_path / "storage", create),
          logs_(base_path / "logs", create) {}

    //! \brief Default base path: $FERRY_DATADIR, else $XDG_DATA_HOME/ferry, else $HOME/.local/share/ferry
    static std::filesystem::path get_default_storage_path();

    //! \brief Creates the missing directories of the tree
    void deploy();

    const Directory& ledger() const { return ledger_; }
    const Directory& storage() const { return storage_; }
    const Directory& logs() const { return logs_; }

    //! \brief Resolves a log file name: relative paths land in the logs directory
    std::filesystem::path log_file(const std::filesystem::path& file) const;

  private:
    Directory ledger_;
    Directory storage_;
    Directory logs_;
};

}  // namespace ferry
