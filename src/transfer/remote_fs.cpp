#include "remote_fs.hpp"
#include "directory_creator.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <filesystem>

namespace fs = std::filesystem;

// ── EnsureDirectoryOp ──────────────────────────────────────

EnsureDirectoryOp::EnsureDirectoryOp(SftpHandle& sftp, std::string path, int mode)
    : sftp_(sftp), path_(std::move(path)), mode_(mode) {}

OpStatus EnsureDirectoryOp::step() {
    while (true) {
        switch (state_) {

        case State::Stat: {
            if (!op_) op_ = sftp_.stat(path_, &attrs_);
            auto status = op_->step();
            if (status == OpStatus::Pending) return OpStatus::Pending;
            op_.reset();

            if (status == OpStatus::Done) {
                if (attrs_.is_directory) return OpStatus::Done;
                return fail({ErrorKind::RemoteNotADirectory, 0,
                             "mkdir() failed, target already exists and is not a directory: " + path_});
            }
            // Any stat failure is treated as "does not exist yet"
            state_ = State::Create;
            break;
        }

        case State::Create: {
            if (!op_) op_ = sftp_.mkdir(path_, mode_);
            auto status = op_->step();
            if (status == OpStatus::Pending) return OpStatus::Pending;

            if (status == OpStatus::Done) {
                op_.reset();
                shuttle_log("Created remote directory " + path_);
                return OpStatus::Done;
            }

            RemoteError err = op_->error();
            op_.reset();

            std::string parent = remote_dirname(path_);
            if (retry_ && is_missing_ancestor(err) && parent != path_) {
                retry_ = false;
                shuttle_log(fmt::format("mkdir {} failed ({}), creating parent {}",
                                        path_, err.message, parent));
                parent_ = std::make_unique<EnsureDirectoryOp>(sftp_, parent, mode_);
                state_ = State::CreateParent;
                break;
            }
            return fail(std::move(err));
        }

        case State::CreateParent: {
            auto status = parent_->step();
            if (status == OpStatus::Pending) return OpStatus::Pending;
            if (status == OpStatus::Failed) return fail(parent_->error());
            parent_.reset();
            state_ = State::Stat;
            break;
        }
        }
    }
}

// ── PutFileOp ──────────────────────────────────────────────

PutFileOp::PutFileOp(SftpHandle& sftp, std::string local, std::string remote,
                     TransferOptions opts, DirectoryCreator* creator, int dir_mode)
    : sftp_(sftp), local_(std::move(local)), remote_(std::move(remote)),
      opts_(opts), creator_(creator), dir_mode_(dir_mode) {}

OpStatus PutFileOp::step() {
    while (true) {
        switch (state_) {

        case State::Check: {
            std::error_code ec;
            if (!fs::exists(local_, ec) || !platform::readable(local_)) {
                return fail({ErrorKind::LocalNotFound, 0,
                             "localFile does not exist at " + local_});
            }
            state_ = State::Put;
            break;
        }

        case State::Put: {
            if (!op_) op_ = sftp_.fast_put(local_, remote_, opts_);
            auto status = op_->step();
            if (status == OpStatus::Pending) return OpStatus::Pending;

            if (status == OpStatus::Done) {
                op_.reset();
                return OpStatus::Done;
            }

            RemoteError err = op_->error();
            op_.reset();

            if (!retry_ || !is_missing_ancestor(err)) {
                return fail(std::move(err));
            }

            retry_ = false;
            parent_dir_ = remote_dirname(remote_);
            shuttle_log(fmt::format("put {} failed ({}), creating parent {}",
                                    remote_, err.message, parent_dir_));
            if (creator_) {
                creator_->request(parent_dir_);
                state_ = State::AwaitParent;
            } else {
                parent_ = std::make_unique<EnsureDirectoryOp>(sftp_, parent_dir_, dir_mode_);
                state_ = State::RecoverParent;
            }
            break;
        }

        case State::RecoverParent: {
            auto status = parent_->step();
            if (status == OpStatus::Pending) return OpStatus::Pending;
            if (status == OpStatus::Failed) return fail(parent_->error());
            parent_.reset();
            state_ = State::Put;
            break;
        }

        case State::AwaitParent: {
            auto status = creator_->status(parent_dir_);
            if (status == OpStatus::Pending) return OpStatus::Pending;
            if (status == OpStatus::Failed) return fail(creator_->error(parent_dir_));
            state_ = State::Put;
            break;
        }
        }
    }
}
