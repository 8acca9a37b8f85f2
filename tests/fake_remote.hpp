#pragma once

// In-memory RemoteTransport for tests: a scripted stream per channel, an SFTP
// handle over a fake remote filesystem, configurable latency and injected
// failures, and a log of every call in the order it happened.

#include <ssh/remote.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <cerrno>
#include <deque>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fake {

// ── Filesystem + SFTP ──────────────────────────────────────────

struct Node {
    bool directory = false;
    std::string content;
    int mode = 0;
};

class FakeSftp;

// An op that stays Pending for `latency` steps, then runs `finish`.
class FakeOp : public RemoteOp {
public:
    FakeOp(int latency, std::function<void()> begin,
           std::function<std::optional<RemoteError>()> finish)
        : remaining_(latency), begin_(std::move(begin)), finish_(std::move(finish)) {}

    OpStatus step() override {
        if (!started_) {
            started_ = true;
            if (begin_) begin_();
        }
        if (remaining_ > 0) {
            --remaining_;
            return OpStatus::Pending;
        }
        auto err = finish_();
        if (err) return fail(*err);
        return OpStatus::Done;
    }

private:
    int remaining_;
    bool started_ = false;
    std::function<void()> begin_;
    std::function<std::optional<RemoteError>()> finish_;
};

inline RemoteError no_such_file() {
    return {ErrorKind::RemoteMissingAncestor, ENOENT, "No such file"};
}

class FakeSftp : public SftpHandle {
public:
    FakeSftp() {
        nodes["/"].directory = true;
        nodes["."].directory = true;
    }

    // ── Setup ────────────────────────────────────────────
    void add_dir(const std::string& path) { nodes[path].directory = true; }
    void add_file(const std::string& path, const std::string& content = "") {
        nodes[path].content = content;
    }

    bool is_dir(const std::string& path) const {
        auto it = nodes.find(path);
        return it != nodes.end() && it->second.directory;
    }
    bool is_file(const std::string& path) const {
        auto it = nodes.find(path);
        return it != nodes.end() && !it->second.directory;
    }
    std::string content(const std::string& path) const { return nodes.at(path).content; }

    std::vector<std::string> files() const {
        std::vector<std::string> out;
        for (const auto& [path, node] : nodes) {
            if (!node.directory) out.push_back(path);
        }
        return out;
    }

    int count(const std::string& call) const {
        int n = 0;
        for (const auto& c : calls) if (c == call) n++;
        return n;
    }

    int count_prefix(const std::string& prefix) const {
        int n = 0;
        for (const auto& c : calls) if (c.compare(0, prefix.size(), prefix) == 0) n++;
        return n;
    }

    // Index of the first call equal to `call`, or -1.
    int index_of(const std::string& call) const {
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i] == call) return static_cast<int>(i);
        }
        return -1;
    }

    // ── SftpHandle ───────────────────────────────────────
    std::unique_ptr<RemoteOp> stat(const std::string& path, RemoteAttributes* out) override {
        calls.push_back("stat " + path);
        return make_op(nullptr, [this, path, out]() -> std::optional<RemoteError> {
            if (auto err = injected(stat_failures, path)) return err;
            auto it = nodes.find(path);
            if (it == nodes.end()) return no_such_file();
            if (out) {
                out->is_directory = it->second.directory;
                out->is_regular = !it->second.directory;
                out->size = it->second.content.size();
            }
            return std::nullopt;
        });
    }

    std::unique_ptr<RemoteOp> mkdir(const std::string& path, int mode) override {
        calls.push_back("mkdir " + path);
        return make_op(nullptr, [this, path, mode]() -> std::optional<RemoteError> {
            if (auto err = injected(mkdir_failures, path)) return err;
            if (nodes.count(path)) return RemoteError{ErrorKind::ChannelFailure, 0, "Failure"};
            if (auto err = check_parent(path)) return err;
            nodes[path].directory = true;
            nodes[path].mode = mode;
            return std::nullopt;
        });
    }

    std::unique_ptr<RemoteOp> fast_get(const std::string& remote_path,
                                       const std::string& local_path,
                                       const TransferOptions&) override {
        calls.push_back("get " + remote_path);
        return make_op(nullptr, [this, remote_path, local_path]() -> std::optional<RemoteError> {
            if (auto err = injected(get_failures, remote_path)) return err;
            auto it = nodes.find(remote_path);
            if (it == nodes.end() || it->second.directory) return no_such_file();
            std::ofstream out(local_path, std::ios::binary);
            if (!out) return RemoteError{ErrorKind::LocalNotFound, 0, "Cannot write " + local_path};
            out << it->second.content;
            return std::nullopt;
        });
    }

    std::unique_ptr<RemoteOp> fast_put(const std::string& local_path,
                                       const std::string& remote_path,
                                       const TransferOptions& opts) override {
        calls.push_back("put " + remote_path);
        int file_mode = opts.file_mode;
        return make_op(
            [this, remote_path]() {
                calls.push_back("put-begin " + remote_path);
                if (++active_puts > max_active_puts) max_active_puts = active_puts;
            },
            [this, local_path, remote_path, file_mode]() -> std::optional<RemoteError> {
                calls.push_back("put-end " + remote_path);
                --active_puts;
                if (auto err = injected(put_failures, remote_path)) return err;
                std::ifstream in(local_path, std::ios::binary);
                if (!in) return RemoteError{ErrorKind::LocalNotFound, 0, "Cannot read " + local_path};
                if (auto err = check_parent(remote_path)) return err;
                if (is_dir(remote_path)) {
                    return RemoteError{ErrorKind::ChannelFailure, 0, "Failure"};
                }
                std::stringstream ss;
                ss << in.rdbuf();
                nodes[remote_path].content = ss.str();
                nodes[remote_path].mode = file_mode;
                return std::nullopt;
            });
    }

    void wait(int) override { waits++; }
    void end() override { ended++; }

    // ── State ────────────────────────────────────────────
    std::map<std::string, Node> nodes;
    std::vector<std::string> calls;
    int latency = 0;
    int waits = 0;
    int ended = 0;
    int active_puts = 0;
    int max_active_puts = 0;

    // Failures by path; `times` < 0 means always.
    struct Injection {
        RemoteError error;
        int times = -1;
    };
    std::map<std::string, Injection> stat_failures;
    std::map<std::string, Injection> mkdir_failures;
    std::map<std::string, Injection> put_failures;
    std::map<std::string, Injection> get_failures;

private:
    std::unique_ptr<RemoteOp> make_op(std::function<void()> begin,
                                      std::function<std::optional<RemoteError>()> finish) {
        return std::make_unique<FakeOp>(latency, std::move(begin), std::move(finish));
    }

    static std::optional<RemoteError> injected(std::map<std::string, Injection>& table,
                                               const std::string& path) {
        auto it = table.find(path);
        if (it == table.end() || it->second.times == 0) return std::nullopt;
        if (it->second.times > 0) it->second.times--;
        return it->second.error;
    }

    std::optional<RemoteError> check_parent(const std::string& path) const {
        std::string parent = remote_dirname(path);
        auto it = nodes.find(parent);
        if (it == nodes.end()) return no_such_file();
        if (!it->second.directory) {
            return RemoteError{ErrorKind::RemoteNotADirectory, ENOTDIR, "Not a directory"};
        }
        return std::nullopt;
    }
};

// ── Streams ────────────────────────────────────────────────────

// One scripted read result. Chunks are delivered in order, one per read();
// an empty `data` with `again` set yields ReadStatus::Again once.
struct Chunk {
    std::string data;
    bool again = false;
};

// What a stream saw, kept alive after the stream itself is destroyed.
struct Observed {
    std::vector<std::string> writes;
    bool eof_sent = false;
    bool closed = false;
};

class FakeStream : public RemoteStream {
public:
    std::shared_ptr<Observed> observed;
    std::deque<Chunk> stdout_script;
    std::deque<Chunk> stderr_script;
    std::vector<std::string> writes;
    bool eof_sent = false;
    bool closed = false;
    bool read_error = false;
    int exit_code = 0;
    std::optional<std::string> signal;

    // Chunks appended to stdout/stderr after the n-th write (0-based),
    // modelling a shell that answers each command.
    std::map<size_t, std::vector<Chunk>> replies;
    std::map<size_t, std::vector<Chunk>> stderr_replies;

    ReadStatus read(StreamKind stream, std::string& out) override {
        if (read_error) return ReadStatus::Error;
        auto& script = (stream == StreamKind::Stdout) ? stdout_script : stderr_script;
        if (script.empty()) {
            // A closed channel (or one with nothing more scripted and EOF sent
            // by the remote) reports EOF; otherwise wait for replies.
            return (closed || remote_eof) ? ReadStatus::Eof : ReadStatus::Again;
        }
        Chunk c = script.front();
        script.pop_front();
        if (c.again) return ReadStatus::Again;
        out += c.data;
        return ReadStatus::Data;
    }

    bool write(const std::string& data) override {
        if (closed) return false;
        size_t index = writes.size();
        writes.push_back(data);
        if (observed) observed->writes.push_back(data);
        if (auto it = replies.find(index); it != replies.end()) {
            for (const auto& c : it->second) stdout_script.push_back(c);
        }
        if (auto it = stderr_replies.find(index); it != stderr_replies.end()) {
            for (const auto& c : it->second) stderr_script.push_back(c);
        }
        return true;
    }

    void send_eof() override {
        eof_sent = true;
        if (observed) observed->eof_sent = true;
    }
    void close() override {
        closed = true;
        if (observed) observed->closed = true;
    }
    int exit_status() const override { return exit_code; }
    std::optional<std::string> exit_signal() const override { return signal; }
    std::string last_error() const override { return read_error ? "scripted read error" : ""; }
    void wait(int) override {}

    // The remote side has finished writing: reads past the script give EOF.
    bool remote_eof = true;
};

// ── Transport ──────────────────────────────────────────────────

class FakeTransport : public RemoteTransport {
public:
    struct State {
        int connects = 0;
        int disconnects = 0;
        bool alive = true;
        bool fail_connect = false;
        ConnectConfig last_config;
        std::vector<std::string> commands;
        std::vector<ChannelOptions> channel_options;
        // Streams handed out by open_channel(), in order. When empty a
        // default stream that closes immediately is returned.
        std::deque<std::function<std::unique_ptr<FakeStream>()>> streams;
        FakeSftp* sftp = nullptr;   // borrowed by open_sftp() wrappers
        int sftp_opened = 0;
    };

    explicit FakeTransport(std::shared_ptr<State> state) : state_(std::move(state)) {}

    void connect(const ConnectConfig& config, StatusCallback) override {
        state_->connects++;
        state_->last_config = config;
        if (state_->fail_connect) {
            throw SessionError(ErrorKind::ChannelFailure, "connection refused");
        }
    }

    void disconnect() override { state_->disconnects++; }
    bool is_alive() override { return state_->alive; }

    std::unique_ptr<RemoteStream> open_channel(const std::string& command,
                                               const ChannelOptions& opts) override {
        state_->commands.push_back(command);
        state_->channel_options.push_back(opts);
        if (state_->streams.empty()) return std::make_unique<FakeStream>();
        auto make = std::move(state_->streams.front());
        state_->streams.pop_front();
        return make();
    }

    std::unique_ptr<SftpHandle> open_sftp() override;

private:
    std::shared_ptr<State> state_;
};

// Forwards to a test-owned FakeSftp so its state survives the handle.
class SftpProxy : public SftpHandle {
public:
    explicit SftpProxy(FakeSftp& target) : target_(target) {}

    std::unique_ptr<RemoteOp> stat(const std::string& p, RemoteAttributes* out) override {
        return target_.stat(p, out);
    }
    std::unique_ptr<RemoteOp> mkdir(const std::string& p, int mode) override {
        return target_.mkdir(p, mode);
    }
    std::unique_ptr<RemoteOp> fast_get(const std::string& r, const std::string& l,
                                       const TransferOptions& o) override {
        return target_.fast_get(r, l, o);
    }
    std::unique_ptr<RemoteOp> fast_put(const std::string& l, const std::string& r,
                                       const TransferOptions& o) override {
        return target_.fast_put(l, r, o);
    }
    void wait(int ms) override { target_.wait(ms); }
    void end() override { target_.end(); }

private:
    FakeSftp& target_;
};

inline std::unique_ptr<SftpHandle> FakeTransport::open_sftp() {
    state_->sftp_opened++;
    return std::make_unique<SftpProxy>(*state_->sftp);
}

} // namespace fake
