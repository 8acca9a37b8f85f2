#include "directory_creator.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

DirectoryCreator::DirectoryCreator(SftpHandle& sftp, int mode)
    : sftp_(sftp), mode_(mode) {}

bool DirectoryCreator::request(const std::string& path) {
    if (entries_.count(path)) return false;

    entries_.emplace(path, Entry{});
    queue_.push_back(path);
    order_.push_back(path);
    return true;
}

void DirectoryCreator::pump() {
    while (!queue_.empty()) {
        const std::string& path = queue_.front();
        if (!current_) {
            current_ = std::make_unique<EnsureDirectoryOp>(sftp_, path, mode_);
        }

        auto status = current_->step();
        if (status == OpStatus::Pending) return;

        auto& entry = entries_[path];
        entry.status = status;
        if (status == OpStatus::Failed) {
            entry.error = current_->error();
            shuttle_log(fmt::format("Directory {} could not be created: {}",
                                    path, entry.error.message));
        }
        current_.reset();
        queue_.pop_front();
    }
}

OpStatus DirectoryCreator::status(const std::string& path) {
    pump();
    return entries_.at(path).status;
}

const RemoteError& DirectoryCreator::error(const std::string& path) const {
    return entries_.at(path).error;
}
