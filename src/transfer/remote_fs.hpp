#pragma once

#include <memory>
#include <string>
#include <core/constants.hpp>
#include <ssh/remote.hpp>

class DirectoryCreator;

// Idempotent remote mkdir.
//
//   stat  -> directory        : Done, nothing created
//         -> other file type  : Failed(RemoteNotADirectory)
//         -> missing / error  : create
//   create -> missing ancestor: ensure the parent (recursively, so any depth
//                               of missing ancestors is repaired), then
//                               stat/create once more
//          -> anything else   : Failed, error unchanged
//
// The retry boundary is one attempt per op; only the parent chain recurses.
class EnsureDirectoryOp : public RemoteOp {
public:
    EnsureDirectoryOp(SftpHandle& sftp, std::string path, int mode = DEFAULT_DIR_MODE);

    OpStatus step() override;

    const std::string& path() const { return path_; }

private:
    enum class State { Stat, Create, CreateParent };

    SftpHandle& sftp_;
    std::string path_;
    int mode_;
    State state_ = State::Stat;
    bool retry_ = true;
    RemoteAttributes attrs_;
    std::unique_ptr<RemoteOp> op_;
    std::unique_ptr<EnsureDirectoryOp> parent_;
};

// Single-file upload that recovers once from a missing remote parent.
//
// The local file is checked first (Failed(LocalNotFound)). A transfer that
// fails with a missing-ancestor error creates the remote parent directory and
// is retried exactly once; any other failure, or a second failure, is final.
// With a DirectoryCreator, the parent creation is shared with every other op
// using the same creator, so siblings never create the same parent twice.
class PutFileOp : public RemoteOp {
public:
    PutFileOp(SftpHandle& sftp, std::string local, std::string remote,
              TransferOptions opts = {}, DirectoryCreator* creator = nullptr,
              int dir_mode = DEFAULT_DIR_MODE);

    OpStatus step() override;

    const std::string& local() const { return local_; }
    const std::string& remote() const { return remote_; }

private:
    enum class State { Check, Put, RecoverParent, AwaitParent };

    SftpHandle& sftp_;
    std::string local_;
    std::string remote_;
    TransferOptions opts_;
    DirectoryCreator* creator_;
    int dir_mode_;
    State state_ = State::Check;
    bool retry_ = true;
    std::string parent_dir_;
    std::unique_ptr<RemoteOp> op_;
    std::unique_ptr<EnsureDirectoryOp> parent_;
};
