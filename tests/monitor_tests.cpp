#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

#include "hb/monitor.hpp"

using namespace hb;
using namespace std::chrono;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static Outcome ok_outcome(double ms)
{
    Outcome o;
    o.ms = ms;
    o.result = Success{200, 10};
    return o;
}

static MonitorSettings quiet_settings()
{
    MonitorSettings s;
    s.render = false;
    s.poll_interval = milliseconds(10);
    return s;
}

static void test_done_on_close()
{
    OutcomeChannel ch;
    Cancellation cancel;
    for (int i = 0; i < 5; ++i) ch.send(ok_outcome(i));
    std::thread producer([&]
    {
        std::this_thread::sleep_for(milliseconds(30));
        for (int i = 0; i < 5; ++i) ch.send(ok_outcome(i));
        ch.close();
    });
    Monitor m(ch, cancel, quiet_settings());
    MonitorResult r = m.run();
    producer.join();
    assert_true(r.state == MonitorState::Done, "done after close");
    assert_true(m.state() == MonitorState::Done, "state exposed");
    assert_true(r.outcomes.size() == 10, "all outcomes returned");
    assert_true(r.elapsed_s > 0.0, "elapsed measured");
}

static void test_cancel_returns_collected()
{
    OutcomeChannel ch;
    Cancellation cancel;
    for (int i = 0; i < 7; ++i) ch.send(ok_outcome(i));

    std::thread interrupter([&]
    {
        // give the monitor time to drain, then interrupt without closing
        std::this_thread::sleep_for(milliseconds(100));
        cancel.cancel();
    });
    Monitor m(ch, cancel, quiet_settings());
    const auto t0 = Clock::now();
    MonitorResult r = m.run();
    interrupter.join();

    assert_true(r.state == MonitorState::Cancelling, "cancelling on interrupt");
    assert_true(r.outcomes.size() == 7, "exactly the outcomes collected before the interrupt");
    assert_true(!ch.closed(), "returned without the channel being closed");
    assert_true(Clock::now() - t0 < seconds(2), "interrupt observed promptly");
}

static void test_cancel_before_start()
{
    OutcomeChannel ch;
    Cancellation cancel;
    cancel.cancel();
    ch.send(ok_outcome(1));
    Monitor m(ch, cancel, quiet_settings());
    MonitorResult r = m.run();
    assert_true(r.state == MonitorState::Cancelling, "pre-cancelled");
    assert_true(r.outcomes.empty(), "nothing drained after the interrupt");
}

static void test_render_frames()
{
    OutcomeChannel ch;
    Cancellation cancel;
    std::ostringstream out;
    MonitorSettings s;
    s.render = true;
    s.fps = 50;
    s.out = &out;
    s.end_line.requests = 4;
    std::thread producer([&]
    {
        for (int i = 0; i < 4; ++i)
        {
            ch.send(ok_outcome(5.0));
            std::this_thread::sleep_for(milliseconds(30));
        }
        ch.close();
    });
    Monitor m(ch, cancel, s);
    MonitorResult r = m.run();
    producer.join();
    const std::string text = out.str();
    assert_true(r.outcomes.size() == 4, "outcomes drained while rendering");
    assert_true(text.find("\x1b[2J") != std::string::npos, "frames clear the screen");
    assert_true(text.find("4 / 4") != std::string::npos, "final frame shows completion");
    size_t frames = 0;
    for (size_t pos = 0; (pos = text.find("\x1b[2J", pos)) != std::string::npos; ++pos) ++frames;
    assert_true(frames >= 3, "several frames over the run");
}

int main()
{
    test_done_on_close();
    test_cancel_returns_collected();
    test_cancel_before_start();
    test_render_frames();
    std::cout << "monitor tests: OK" << std::endl;
    return 0;
}
