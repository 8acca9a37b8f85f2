#include "directory_transfer.hpp"
#include "directory_creator.hpp"
#include "remote_fs.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <memory>

namespace fs = std::filesystem;

bool is_visible_path(const fs::path& path) {
    auto name = path.filename().string();
    return name.empty() || name[0] != '.';
}

// ── Scan ───────────────────────────────────────────────────

static void scan_into(const fs::path& dir, bool recursive, const PathPredicate& validate,
                      std::vector<fs::path>& out) {
    std::vector<fs::directory_entry> entries;
    for (const auto& entry : fs::directory_iterator(dir)) {
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& entry : entries) {
        if (!validate(entry.path())) continue;

        if (entry.is_directory()) {
            if (recursive && !entry.is_symlink()) {
                scan_into(entry.path(), recursive, validate, out);
            }
            continue;
        }
        if (entry.is_regular_file()) {
            out.push_back(entry.path());
        }
    }
}

std::vector<fs::path> scan_directory(const fs::path& root, bool recursive,
                                     const PathPredicate& validate) {
    std::vector<fs::path> files;
    scan_into(root, recursive, validate ? validate : PathPredicate(is_visible_path), files);
    return files;
}

std::vector<TransferPlanEntry> build_transfer_plan(const fs::path& local_root,
                                                   const std::string& remote_root,
                                                   const std::vector<fs::path>& files) {
    std::vector<TransferPlanEntry> plan;
    plan.reserve(files.size());
    for (const auto& file : files) {
        TransferPlanEntry entry;
        entry.local = file.string();
        entry.remote = remote_join(remote_root, file.lexically_relative(local_root).generic_string());
        entry.remote_parent = remote_dirname(entry.remote);
        plan.push_back(std::move(entry));
    }
    return plan;
}

// ── Windows ────────────────────────────────────────────────

void run_window(const std::vector<RemoteOp*>& ops, SftpHandle& io,
                const std::function<void(size_t, OpStatus)>& on_settled) {
    std::vector<bool> settled(ops.size(), false);
    size_t remaining = ops.size();

    while (remaining > 0) {
        for (size_t i = 0; i < ops.size(); ++i) {
            if (settled[i]) continue;
            auto status = ops[i]->step();
            if (status == OpStatus::Pending) continue;
            settled[i] = true;
            --remaining;
            if (on_settled) on_settled(i, status);
        }
        if (remaining > 0) io.wait(SSH_POLL_INTERVAL_MS);
    }
}

// One file of a directory transfer: wait for the shared parent creation,
// then upload.
class DirectoryFileOp : public RemoteOp {
public:
    DirectoryFileOp(SftpHandle& sftp, DirectoryCreator& creator, const TransferPlanEntry& entry,
                    const TransferOptions& transfer, int dir_mode)
        : creator_(creator), entry_(entry),
          put_(sftp, entry.local, entry.remote, transfer, &creator, dir_mode) {}

    OpStatus step() override {
        if (!parent_ready_) {
            creator_.request(entry_.remote_parent);
            auto status = creator_.status(entry_.remote_parent);
            if (status == OpStatus::Pending) return OpStatus::Pending;
            if (status == OpStatus::Failed) return fail(creator_.error(entry_.remote_parent));
            parent_ready_ = true;
        }

        auto status = put_.step();
        if (status == OpStatus::Failed) return fail(put_.error());
        return status;
    }

private:
    DirectoryCreator& creator_;
    const TransferPlanEntry& entry_;
    PutFileOp put_;
    bool parent_ready_ = false;
};

void validate_put_directory(const std::string& local_root, const std::string& remote_root,
                            size_t max_at_once) {
    if (local_root.empty()) {
        throw SessionError(ErrorKind::InvalidArgument, "localDirectory must be a non-empty string");
    }
    if (remote_root.empty()) {
        throw SessionError(ErrorKind::InvalidArgument, "remoteDirectory must be a non-empty string");
    }
    if (max_at_once == 0) {
        throw SessionError(ErrorKind::InvalidArgument, "max_at_once must be at least 1");
    }

    std::error_code ec;
    if (!fs::exists(local_root, ec)) {
        throw SessionError(ErrorKind::LocalNotFound, "localDirectory does not exist at " + local_root);
    }
    if (!fs::is_directory(local_root, ec)) {
        throw SessionError(ErrorKind::InvalidArgument, "localDirectory is not a directory at " + local_root);
    }
}

void validate_put_files(const std::vector<LocalRemotePair>& files, size_t max_at_once) {
    if (max_at_once == 0) {
        throw SessionError(ErrorKind::InvalidArgument, "max_at_once must be at least 1");
    }
    for (size_t i = 0; i < files.size(); ++i) {
        if (files[i].local.empty()) {
            throw SessionError(ErrorKind::InvalidArgument, fmt::format("files[{}].local must be a string", i));
        }
        if (files[i].remote.empty()) {
            throw SessionError(ErrorKind::InvalidArgument, fmt::format("files[{}].remote must be a string", i));
        }
    }
}

bool put_directory(SftpHandle& sftp,
                   const std::string& local_root,
                   const std::string& remote_root,
                   const PutDirectoryOptions& opts,
                   const TransferOptions& transfer,
                   size_t max_at_once,
                   int dir_mode) {
    validate_put_directory(local_root, remote_root, max_at_once);

    std::vector<fs::path> files;
    try {
        files = scan_directory(local_root, opts.recursive, opts.validate);
    } catch (const fs::filesystem_error& e) {
        throw SessionError(ErrorKind::LocalNotFound,
                           fmt::format("Cannot read {}: {}", local_root, e.what()));
    }

    auto plan = build_transfer_plan(local_root, remote_root, files);
    shuttle_log(fmt::format("put_directory {} -> {}: {} files", local_root, remote_root, plan.size()));

    DirectoryCreator creator(sftp, dir_mode);
    bool all_ok = true;

    for (size_t start = 0; start < plan.size(); start += max_at_once) {
        size_t end = std::min(plan.size(), start + max_at_once);

        std::vector<std::unique_ptr<DirectoryFileOp>> owned;
        std::vector<RemoteOp*> window;
        for (size_t i = start; i < end; ++i) {
            owned.push_back(std::make_unique<DirectoryFileOp>(sftp, creator, plan[i], transfer, dir_mode));
            window.push_back(owned.back().get());
        }

        run_window(window, sftp, [&](size_t idx, OpStatus status) {
            const auto& entry = plan[start + idx];
            if (status == OpStatus::Done) {
                if (opts.tick) opts.tick(entry.local, entry.remote, std::nullopt);
                return;
            }
            all_ok = false;
            const auto& err = owned[idx]->error();
            shuttle_log(fmt::format("put {} failed: {}", entry.remote, err.message));
            if (opts.tick) opts.tick(entry.local, entry.remote, err);
        });
    }

    return all_ok;
}

void put_files(SftpHandle& sftp,
               const std::vector<LocalRemotePair>& files,
               size_t max_at_once,
               const TransferOptions& transfer,
               int dir_mode) {
    validate_put_files(files, max_at_once);

    DirectoryCreator creator(sftp, dir_mode);
    std::vector<LocalRemotePair> transferred;

    for (size_t start = 0; start < files.size(); start += max_at_once) {
        size_t end = std::min(files.size(), start + max_at_once);

        std::vector<std::unique_ptr<PutFileOp>> owned;
        std::vector<RemoteOp*> window;
        for (size_t i = start; i < end; ++i) {
            owned.push_back(std::make_unique<PutFileOp>(sftp, files[i].local, files[i].remote,
                                                        transfer, &creator, dir_mode));
            window.push_back(owned.back().get());
        }

        std::vector<OpStatus> results(window.size(), OpStatus::Pending);
        run_window(window, sftp, [&](size_t idx, OpStatus status) {
            results[idx] = status;
        });

        const RemoteError* first_error = nullptr;
        for (size_t i = 0; i < results.size(); ++i) {
            if (results[i] == OpStatus::Done) {
                transferred.push_back(files[start + i]);
            } else if (!first_error) {
                first_error = &owned[i]->error();
            }
        }

        if (first_error) {
            shuttle_log(fmt::format("put_files stopped after {} of {} files: {}",
                                    transferred.size(), files.size(), first_error->message));
            throw TransferError(*first_error, std::move(transferred));
        }
    }
}
