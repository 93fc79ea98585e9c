
#ifndef VOWELPAD_DISPATCH_H
#define VOWELPAD_DISPATCH_H

/** Rate limiting between the mapping engine and the D-Lev.

  Dragging on the pad produces parameter updates far faster than the
  serial-linked D-Lev can absorb them, so knob writes share one throttle:
  a write goes out only if at least min_interval has passed since the last
  write that went out (on any knob); otherwise it is dropped.
  Dropped writes are not queued, since the next gesture event carries
  fresher state anyway.

  Whole-state commands (dump, pump, copy) are explicit user actions and
  bypass the throttle.

  Failed sends are logged and counted, never retried.
*/

#include "common.h"
#include "device.h"
#include "formant.h"
#include "threads.h"

namespace Dispatch
{

//----( time sources )--------------------------------------------------------

struct Clock
{
  virtual ~Clock () {}
  virtual double now () const = 0; // in seconds
};

struct SystemClock : public Clock
{
  virtual ~SystemClock () {}
  virtual double now () const { return get_elapsed_time(); }
};

class ManualClock : public Clock
{
  double m_time;

public:

  ManualClock (double time = 0) : m_time(time) {}
  virtual ~ManualClock () {}

  virtual double now () const { return m_time; }

  void set (double time) { m_time = time; }
  void advance (double dt) { m_time += dt; }
};

//----( dispatcher )----------------------------------------------------------

class Dispatcher
{
  Device::Channel & m_channel;
  const Clock & m_clock;
  const double m_min_interval;

  Mutex m_mutex;
  bool m_have_sent;
  double m_last_send_time;

  size_t m_num_accepted;
  size_t m_num_dropped;
  size_t m_num_failed;
  size_t m_num_immediate;

public:

  struct Stats
  {
    size_t accepted;
    size_t dropped;
    size_t failed;
    size_t immediate;
  };

  Dispatcher (
      Device::Channel & channel,
      const Clock & clock,
      double min_interval_sec = DEFAULT_UPDATE_INTERVAL_MS / 1000.0);
  ~Dispatcher ();

  double min_interval () const { return m_min_interval; }

  // returns true if the update was forwarded (whether or not it then failed)
  bool dispatch_throttled (const Device::KnobUpdate & update);

  // returns true if the device reported success
  bool dispatch_immediate (const Device::StateOp & op);

  // returns the number of knob writes forwarded
  size_t dispatch_parameters (const Formant::ParameterSet & params);

  Stats stats ();

private:

  bool accept ();
};

ostream & operator<< (ostream & o, const Dispatcher::Stats & stats);

} // namespace Dispatch

#endif // VOWELPAD_DISPATCH_H

