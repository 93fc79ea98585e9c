
#include "dispatch.h"
#include <thread>

using namespace Dispatch;
using Device::KnobUpdate;
using Device::StateOp;

void test_first_update ()
{
  LOG("Testing that the first update goes out");

  Device::DryRunChannel channel(false);
  ManualClock clock(1000.0);
  Dispatcher dispatcher(channel, clock, 0.15);

  ASSERT(dispatcher.dispatch_throttled(KnobUpdate("0f", 2, 500)),
         "first update was dropped");
  ASSERT_EQ(channel.sent().size(), 1);
  ASSERT_EQ(channel.sent()[0], KnobUpdate("0f", 2, 500));

  ASSERT(not dispatcher.dispatch_throttled(KnobUpdate("1f", 2, 900)),
         "simultaneous update was not dropped");
  ASSERT_EQ(channel.sent().size(), 1);
}

void test_spacing ()
{
  LOG("Testing update spacing");

  Device::DryRunChannel channel(false);
  ManualClock clock;
  Dispatcher dispatcher(channel, clock, 0.15);

  // every 40 ms: sends at 0, 160, 320, ... ms
  for (int i = 0; i < 20; ++i) {
    clock.set(0.040 * i);
    bool sent = dispatcher.dispatch_throttled(KnobUpdate("0f", 2, 100 + i));
    ASSERT_EQ(sent, (i % 4 == 0));
  }
  ASSERT_EQ(channel.sent().size(), 5);
  ASSERT_EQ(channel.sent()[1].value, 104);

  Dispatcher::Stats stats = dispatcher.stats();
  ASSERT_EQ(stats.accepted, 5);
  ASSERT_EQ(stats.dropped, 15);
  ASSERT_EQ(stats.failed, 0);
}

// N updates 10 ms apart, from time zero
size_t send_burst (Dispatcher & dispatcher, ManualClock & clock, int N)
{
  size_t num_sent = 0;
  for (int i = 0; i < N; ++i) {
    clock.set(i * 10 / 1000.0);
    if (dispatcher.dispatch_throttled(KnobUpdate("2f", 3, i))) ++num_sent;
  }
  return num_sent;
}

void test_burst ()
{
  LOG("Testing a fast burst");

  const int sizes[] = {1, 2, 14, 15, 16, 17, 30, 31, 100, 1000};

  for (int n = 0; n < 10; ++n) {
    const int N = sizes[n];

    Device::DryRunChannel channel(false);
    ManualClock clock;
    Dispatcher dispatcher(channel, clock, 0.15);

    size_t num_sent = send_burst(dispatcher, clock, N);

    // at most ceil(N 10 / 150) writes, the first always among them
    const size_t max_sent = ceil(N * 10 / 150.0);
    ASSERT_LE(num_sent, max_sent);
    ASSERT_LE(1, num_sent);
    ASSERT_EQ(channel.sent()[0].value, 0);

    // after a pause the next update goes out at once
    clock.advance(10.0);
    ASSERT(dispatcher.dispatch_throttled(KnobUpdate("2f", 3, N)),
           "update after a pause was dropped");
  }
}

void test_fencepost ()
{
  LOG("Testing the throttle boundary");

  // 0 .. 140 ms: only the first write
  {
    Device::DryRunChannel channel(false);
    ManualClock clock;
    Dispatcher dispatcher(channel, clock, 0.15);
    ASSERT_EQ(send_burst(dispatcher, clock, 15), 1);
  }

  // 0 .. 150 ms: the write at exactly 150 ms also goes out
  {
    Device::DryRunChannel channel(false);
    ManualClock clock;
    Dispatcher dispatcher(channel, clock, 0.15);
    ASSERT_EQ(send_burst(dispatcher, clock, 16), 2);
    ASSERT_EQ(channel.sent()[1].value, 15);
  }
}

void test_shared_throttle ()
{
  LOG("Testing that all knobs share one throttle");

  Device::DryRunChannel channel(false);
  ManualClock clock;
  Dispatcher dispatcher(channel, clock, 0.15);

  Formant::ParameterSet params = Formant::map_to_parameters(
      Formant::Coordinate(0.2, 0.8),
      Voice::BARITONE,
      Formant::Intensities());

  // a whole parameter set at one instant lands only its first knob
  ASSERT_EQ(dispatcher.dispatch_parameters(params), 1);
  ASSERT_EQ(channel.sent().size(), 1);
  ASSERT_EQ(channel.sent()[0].page, "0f");
  ASSERT_EQ(channel.sent()[0].knob, 2);
  ASSERT_EQ(dispatcher.stats().dropped, Formant::KNOBS_PER_PARAMETER_SET - 1);

  // with no interval everything goes out, in encoding order
  Device::DryRunChannel open_channel(false);
  Dispatcher open_dispatcher(open_channel, clock, 0);
  ASSERT_EQ(open_dispatcher.dispatch_parameters(params),
            Formant::KNOBS_PER_PARAMETER_SET);

  std::vector<KnobUpdate> expected;
  Formant::encode_knobs(params, expected);
  ASSERT(open_channel.sent() == expected, "knobs sent out of order");
}

void test_immediate ()
{
  LOG("Testing immediate state commands");

  Device::DryRunChannel channel(false);
  ManualClock clock;
  Dispatcher dispatcher(channel, clock, 0.15);

  ASSERT(dispatcher.dispatch_throttled(KnobUpdate("0o", 1, 6)),
         "first update was dropped");

  for (int i = 0; i < 10; ++i) {
    ASSERT(dispatcher.dispatch_immediate(StateOp::dump_knobs("base")),
           "state command was not sent");
  }
  ASSERT_EQ(channel.invoked().size(), 10);
  ASSERT_EQ(channel.invoked()[0].type, StateOp::DUMP_KNOBS);
  ASSERT_EQ(channel.invoked()[0].file, "base");

  // immediate commands neither consume nor reset the throttle
  ASSERT(not dispatcher.dispatch_throttled(KnobUpdate("0o", 1, 7)),
         "update was not throttled");
  clock.advance(0.2);
  ASSERT(dispatcher.dispatch_throttled(KnobUpdate("0o", 1, 8)),
         "update was throttled after the interval");

  Dispatcher::Stats stats = dispatcher.stats();
  ASSERT_EQ(stats.immediate, 10);
  ASSERT_EQ(stats.accepted, 2);
  ASSERT_EQ(stats.dropped, 1);
}

void test_failures ()
{
  LOG("Testing device failures");

  Device::DryRunChannel channel(false);
  channel.set_failing(true);
  ManualClock clock;
  Dispatcher dispatcher(channel, clock, 0.15);

  // a failed send still counts as sent, and is not retried
  ASSERT(dispatcher.dispatch_throttled(KnobUpdate("0f", 2, 300)),
         "failed update should still be forwarded");
  ASSERT(not dispatcher.dispatch_throttled(KnobUpdate("0f", 2, 301)),
         "update after a failure was not throttled");
  ASSERT_EQ(channel.sent().size(), 1);

  ASSERT(not dispatcher.dispatch_immediate(StateOp::pump_knobs("base")),
         "failed state command reported success");

  channel.set_failing(false);
  clock.advance(1.0);
  ASSERT(dispatcher.dispatch_throttled(KnobUpdate("0f", 2, 302)),
         "dispatcher did not recover after failures");
  ASSERT(dispatcher.dispatch_immediate(StateOp::pump_knobs("base")),
         "state command failed after recovery");

  ASSERT_EQ(dispatcher.stats().failed, 2);
}

void hammer (Dispatcher * dispatcher, int thread, int count)
{
  for (int i = 0; i < count; ++i) {
    dispatcher->dispatch_throttled(KnobUpdate("0f", 2, 1000 * thread + i));
  }
}

void test_threads ()
{
  LOG("Testing concurrent callers");

  Device::DryRunChannel channel(false);
  ManualClock clock(3.0);
  Dispatcher dispatcher(channel, clock, 0.15);

  const int num_threads = 4;
  const int count = 1000;

  std::vector<std::thread *> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.push_back(new std::thread(hammer, & dispatcher, t, count));
  }
  for (int t = 0; t < num_threads; ++t) {
    threads[t]->join();
    delete threads[t];
  }

  // the clock never moved, so exactly one write won
  Dispatcher::Stats stats = dispatcher.stats();
  ASSERT_EQ(stats.accepted, 1);
  ASSERT_EQ(stats.dropped, num_threads * count - 1);
  ASSERT_EQ(channel.sent().size(), 1);
}

int main ()
{
  test_first_update();
  test_spacing();
  test_burst();
  test_fencepost();
  test_shared_throttle();
  test_immediate();
  test_failures();
  test_threads();

  return 0;
}
