#include <gtest/gtest.h>
#include <ssh/libssh2_transport.hpp>
#include <core/errors.hpp>

// The raw pointers handed to the handles below stand in for libssh2 objects
// that disconnect() has already released: they point into a destroyed
// transport, so any libssh2 call made through them would read freed memory.

TEST(Libssh2Transport, DisconnectedTransportOpensNothing) {
    Libssh2Transport transport;
    EXPECT_FALSE(transport.link()->open());
    EXPECT_FALSE(transport.is_alive());

    try {
        transport.open_sftp();
        FAIL() << "expected NotConnected";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotConnected);
    }
    EXPECT_THROW(transport.open_channel("true", {}), SessionError);

    // Repeated teardown is harmless
    transport.disconnect();
    transport.disconnect();
}

TEST(Libssh2Transport, SftpHandleOutlivingTransportIsInert) {
    std::unique_ptr<Libssh2Sftp> sftp;
    {
        Libssh2Transport transport;
        sftp = std::make_unique<Libssh2Sftp>(reinterpret_cast<LIBSSH2_SFTP*>(&transport),
                                             transport.link());
        transport.disconnect();
    }

    EXPECT_EQ(sftp->raw(), nullptr);

    auto op = sftp->mkdir("/srv/app", 0755);
    EXPECT_EQ(op->step(), OpStatus::Failed);
    EXPECT_EQ(op->error().kind, ErrorKind::ChannelFailure);
    EXPECT_EQ(op->error().message, "SFTP session already ended");

    auto put = sftp->fast_put("/nonexistent/local", "/srv/app/file", {});
    EXPECT_EQ(put->step(), OpStatus::Failed);
    put.reset();
    op.reset();

    sftp->end();
    sftp.reset();
}

TEST(Libssh2Transport, StreamOutlivingTransportIsInert) {
    std::unique_ptr<Libssh2Stream> stream;
    {
        Libssh2Transport transport;
        stream = std::make_unique<Libssh2Stream>(reinterpret_cast<LIBSSH2_CHANNEL*>(&transport),
                                                 transport.link());
    }

    std::string out;
    EXPECT_EQ(stream->read(StreamKind::Stdout, out), ReadStatus::Error);
    EXPECT_EQ(stream->last_error(), "SSH session closed");
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(stream->write("ls\n"));

    stream->send_eof();
    stream->close();
    EXPECT_EQ(stream->exit_status(), -1);
    stream.reset();
}
