#include "remote.hpp"
#include <core/constants.hpp>

void run_op(RemoteOp& op, SftpHandle& io) {
    while (true) {
        auto status = op.step();
        if (status == OpStatus::Done) return;
        if (status == OpStatus::Failed) throw SessionError(op.error());
        io.wait(SSH_POLL_INTERVAL_MS);
    }
}
