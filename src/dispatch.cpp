
#include "dispatch.h"

#define LOG1(mess)

namespace Dispatch
{

Dispatcher::Dispatcher (
    Device::Channel & channel,
    const Clock & clock,
    double min_interval_sec)
  : m_channel(channel),
    m_clock(clock),
    m_min_interval(min_interval_sec),
    m_have_sent(false),
    m_last_send_time(0),
    m_num_accepted(0),
    m_num_dropped(0),
    m_num_failed(0),
    m_num_immediate(0)
{
  ASSERT_NONNEG(min_interval_sec);
}

Dispatcher::~Dispatcher ()
{
  LOG(" dispatcher: " << stats());
}

bool Dispatcher::accept ()
{
  UniqueLock lock(m_mutex);

  double time = m_clock.now();
  if (m_have_sent and (time - m_last_send_time < m_min_interval)) {
    ++m_num_dropped;
    return false;
  }

  m_have_sent = true;
  m_last_send_time = time;
  ++m_num_accepted;
  return true;
}

bool Dispatcher::dispatch_throttled (const Device::KnobUpdate & update)
{
  if (not accept()) {
    LOG1("dropping knob " << update);
    return false;
  }

  // the channel may block, so it is called outside the lock
  if (not m_channel.send(update)) {
    WARN("failed to send knob " << update);
    UniqueLock lock(m_mutex);
    ++m_num_failed;
  }

  return true;
}

bool Dispatcher::dispatch_immediate (const Device::StateOp & op)
{
  LOG("device: " << op);

  {
    UniqueLock lock(m_mutex);
    ++m_num_immediate;
  }

  if (not m_channel.invoke(op)) {
    WARN("device failed to " << op);
    UniqueLock lock(m_mutex);
    ++m_num_failed;
    return false;
  }

  return true;
}

size_t Dispatcher::dispatch_parameters (const Formant::ParameterSet & params)
{
  std::vector<Device::KnobUpdate> knobs;
  Formant::encode_knobs(params, knobs);

  size_t num_sent = 0;
  for (size_t i = 0; i < knobs.size(); ++i) {
    if (dispatch_throttled(knobs[i])) ++num_sent;
  }

  return num_sent;
}

Dispatcher::Stats Dispatcher::stats ()
{
  UniqueLock lock(m_mutex);

  Stats result;
  result.accepted = m_num_accepted;
  result.dropped = m_num_dropped;
  result.failed = m_num_failed;
  result.immediate = m_num_immediate;
  return result;
}

ostream & operator<< (ostream & o, const Dispatcher::Stats & stats)
{
  return o << stats.accepted << " knob writes sent, "
           << stats.dropped << " dropped, "
           << stats.immediate << " state commands, "
           << stats.failed << " failures";
}

} // namespace Dispatch

