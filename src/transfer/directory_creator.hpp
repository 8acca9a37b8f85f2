#pragma once

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "remote_fs.hpp"

// Deduplicated, serialized remote directory creation for one transfer.
//
// Each distinct path is scheduled at most once. Scheduled creations run one
// at a time in request order; any number of ops may wait on the same path.
class DirectoryCreator {
public:
    explicit DirectoryCreator(SftpHandle& sftp, int mode = DEFAULT_DIR_MODE);

    // Schedule `path`. Returns false if it was already scheduled.
    bool request(const std::string& path);

    // Advance the chain and report where `path` stands. `path` must have been
    // requested.
    OpStatus status(const std::string& path);

    const RemoteError& error(const std::string& path) const;

    // Paths in the order they were first requested.
    const std::vector<std::string>& order() const { return order_; }

private:
    struct Entry {
        OpStatus status = OpStatus::Pending;
        RemoteError error;
    };

    SftpHandle& sftp_;
    int mode_;
    std::map<std::string, Entry> entries_;
    std::deque<std::string> queue_;
    std::vector<std::string> order_;
    std::unique_ptr<EnsureDirectoryOp> current_;

    void pump();
};
