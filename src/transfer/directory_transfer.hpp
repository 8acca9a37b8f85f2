#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <ssh/remote.hpp>

namespace fs = std::filesystem;

using PathPredicate = std::function<bool(const fs::path&)>;

// Called once per file as it settles; `error` is empty on success.
using ProgressCallback = std::function<void(const std::string& local_path,
                                            const std::string& remote_path,
                                            const std::optional<RemoteError>& error)>;

struct PutDirectoryOptions {
    bool recursive = true;
    PathPredicate validate;          // default: skip names starting with '.'
    ProgressCallback tick;           // default: no-op
};

// The default inclusion predicate: basename does not start with '.'.
bool is_visible_path(const fs::path& path);

// Files under `root`, depth-first, each directory's entries in name order.
// `validate` is applied to directories too; rejected directories are not
// entered, and symlinked directories are never entered.
std::vector<fs::path> scan_directory(const fs::path& root, bool recursive,
                                     const PathPredicate& validate);

struct TransferPlanEntry {
    std::string local;
    std::string remote;
    std::string remote_parent;
};

// Map scanned files onto `remote_root`, always with '/' separators.
std::vector<TransferPlanEntry> build_transfer_plan(const fs::path& local_root,
                                                   const std::string& remote_root,
                                                   const std::vector<fs::path>& files);

// Step every op in `ops` concurrently until all have settled. `on_settled`
// runs as each op finishes, with the op's index.
void run_window(const std::vector<RemoteOp*>& ops, SftpHandle& io,
                const std::function<void(size_t, OpStatus)>& on_settled = nullptr);

// Argument checks run by put_directory() and put_files() before any remote
// request. Throw SessionError (InvalidArgument or LocalNotFound).
void validate_put_directory(const std::string& local_root, const std::string& remote_root,
                            size_t max_at_once);
void validate_put_files(const std::vector<LocalRemotePair>& files, size_t max_at_once);

// Mirror a local tree onto the remote side. Returns true iff every file
// transferred. Individual file failures go to `opts.tick` and never throw;
// only an unusable local root raises SessionError.
bool put_directory(SftpHandle& sftp,
                   const std::string& local_root,
                   const std::string& remote_root,
                   const PutDirectoryOptions& opts = {},
                   const TransferOptions& transfer = {},
                   size_t max_at_once = DEFAULT_MAX_AT_ONCE,
                   int dir_mode = DEFAULT_DIR_MODE);

// Upload pairs in windows of `max_at_once`. On the first failing window,
// throws TransferError listing every pair that did transfer.
void put_files(SftpHandle& sftp,
               const std::vector<LocalRemotePair>& files,
               size_t max_at_once = DEFAULT_MAX_AT_ONCE,
               const TransferOptions& transfer = {},
               int dir_mode = DEFAULT_DIR_MODE);
