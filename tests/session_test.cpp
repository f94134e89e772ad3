#include "session.hpp"

#include "fakes.hpp"
#include "relay.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <sstream>

using namespace anxious;
using namespace anxious::test;

namespace {

struct Harness {
    std::vector<std::string> journal;
    std::ostringstream log;
    ShutdownSignal shutdown;
    FakeSource* source = nullptr;
    FakeSink* sink = nullptr;

    std::unique_ptr<Session> make_session() {
        auto src = std::make_unique<FakeSource>(std::set<std::pair<unsigned int, unsigned int>>{{EV_REL, REL_WHEEL}});
        auto snk = std::make_unique<FakeSink>();
        src->journal = &journal;
        src->shutdown = &shutdown;
        snk->journal = &journal;
        source = src.get();
        sink = snk.get();
        return std::make_unique<Session>(std::move(src), std::move(snk), "/dev/input/fake", log);
    }
};

void expect_full_teardown(const std::vector<std::string>& journal) {
    ASSERT_EQ(journal.size(), 2u);
    EXPECT_EQ(journal[0], "virtual destroyed");
    EXPECT_EQ(journal[1], "physical released");
}

}  // namespace

TEST(SessionTest, DestructionReleasesBothHandlesOnce) {
    Harness h;
    auto session = h.make_session();
    EXPECT_TRUE(h.journal.empty());
    session.reset();
    expect_full_teardown(h.journal);
    EXPECT_NE(h.log.str().find("[session] closed"), std::string::npos);
}

TEST(SessionTest, TeardownAfterReadFailure) {
    Harness h;
    auto session = h.make_session();
    h.source->push(make_event(EV_REL, REL_WHEEL, 1));
    h.source->push_read_error();

    RelayLoop relay(Config{}, session->physical(), h.log);
    bool clean = relay.run(session->physical(), session->virtual_device(), h.shutdown);
    EXPECT_FALSE(clean);
    EXPECT_TRUE(h.journal.empty());

    session.reset();
    expect_full_teardown(h.journal);
}

TEST(SessionTest, TeardownAfterTerminationSignal) {
    Harness h;
    auto session = h.make_session();
    h.source->push(make_event(EV_REL, REL_WHEEL, 1));
    h.source->push_signal();

    RelayLoop relay(Config{}, session->physical(), h.log);
    EXPECT_TRUE(relay.run(session->physical(), session->virtual_device(), h.shutdown));
    EXPECT_EQ(h.shutdown.signal_number(), SIGTERM);

    session.reset();
    expect_full_teardown(h.journal);
}

TEST(SessionTest, TeardownAfterWriteFailure) {
    Harness h;
    auto session = h.make_session();
    h.sink->fail_after = 0;
    h.source->push(make_event(EV_REL, REL_X, 1));

    RelayLoop relay(Config{}, session->physical(), h.log);
    EXPECT_FALSE(relay.run(session->physical(), session->virtual_device(), h.shutdown));
    EXPECT_EQ(relay.failure()->kind(), DeviceError::Kind::WriteFailed);

    session.reset();
    expect_full_teardown(h.journal);
}

TEST(SessionTest, OpenMissingDeviceIsUnavailable) {
    Config c;
    c.device_path = "/nonexistent/anxious-scroll-test/event99";
    std::ostringstream log;
    try {
        Session::open(c, log);
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), DeviceError::Kind::DeviceUnavailable);
        EXPECT_EQ(e.error_code(), ENOENT);
        EXPECT_NE(std::string(e.what()).find("event99"), std::string::npos);
    }
    EXPECT_EQ(log.str().find("[session] grabbed"), std::string::npos);
}
