
#ifndef VOWELPAD_DEVICE_H
#define VOWELPAD_DEVICE_H

/** Device channels: how knob values and whole-state commands reach a D-Lev.

  The D-Lev is driven over its serial link by the external d-lin program,
  one invocation per command. Knobs are addressed as page:knob:value, e.g.
    0f:2:1234   formant 0 (F1) frequency
    0o:1:6      oscillator 0 treble
  Whole-state commands move knob sets and preset slots to and from
  named files on the host (.dlp files for slots).

  Channels report success or failure and never throw;
  deciding what to do about a failure is the caller's business.
*/

#include "common.h"
#include <vector>

namespace Device
{

//----( commands )------------------------------------------------------------

struct KnobUpdate
{
  string page;
  int knob;
  int value;

  KnobUpdate () : page(), knob(0), value(0) {}
  KnobUpdate (string p, int k, int v) : page(p), knob(k), value(v) {}

  bool operator== (const KnobUpdate & other) const
  {
    return page == other.page and knob == other.knob and value == other.value;
  }

  string str () const;
};

inline ostream & operator<< (ostream & o, const KnobUpdate & update)
{
  return o << update.page << ':' << update.knob << ':' << update.value;
}

struct StateOp
{
  enum Type
  {
    DUMP_KNOBS,   // current knobs --> file
    PUMP_KNOBS,   // file --> current knobs
    DUMP_SLOT,    // slot --> file.dlp
    PUMP_SLOT,    // file.dlp --> slot
    COPY_SLOT     // slot --> slot
  };

  Type type;
  string file;
  int slot;
  int target_slot;

  static StateOp dump_knobs (string file);
  static StateOp pump_knobs (string file);
  static StateOp dump_slot (int slot, string file);
  static StateOp pump_slot (string file, int slot);
  static StateOp copy_slot (int source, int target);

private:

  StateOp (Type t, string f, int s, int ts)
    : type(t), file(f), slot(s), target_slot(ts) {}
};

ostream & operator<< (ostream & o, const StateOp & op);

//----( channel interface )---------------------------------------------------

class Channel
{
public:

  virtual ~Channel () {}

  // these return true on success
  virtual bool send (const KnobUpdate & update) = 0;
  virtual bool invoke (const StateOp & op) = 0;
};

//----( d-lin subprocess )----------------------------------------------------

/** Runs the d-lin executable once per command and waits for it.

  Serial access usually needs root, so commands are optionally
  run through sudo. Output of d-lin goes straight to our stdout.
*/
class DlinChannel : public Channel
{
  const string m_command;
  const bool m_use_sudo;

  size_t m_num_commands;
  size_t m_num_failures;

public:

  DlinChannel (string command = "./d-lin", bool use_sudo = true);
  virtual ~DlinChannel ();

  virtual bool send (const KnobUpdate & update);
  virtual bool invoke (const StateOp & op);

  // the argument lists d-lin gets, without the program itself
  static std::vector<string> knob_args (const KnobUpdate & update);
  static std::vector<std::vector<string> > state_args (const StateOp & op);

private:

  bool run (const std::vector<string> & args);
};

//----( dry run )-------------------------------------------------------------

/** Logs and records everything, talks to nothing.

  Used for rehearsing without a D-Lev attached, and as the test double.
  Individual calls can be made to fail.
*/
class DryRunChannel : public Channel
{
  std::vector<KnobUpdate> m_sent;
  std::vector<StateOp> m_invoked;
  bool m_failing;
  bool m_verbose;

public:

  DryRunChannel (bool verbose = true)
    : m_failing(false),
      m_verbose(verbose)
  {}
  virtual ~DryRunChannel () {}

  virtual bool send (const KnobUpdate & update);
  virtual bool invoke (const StateOp & op);

  void set_failing (bool failing) { m_failing = failing; }

  const std::vector<KnobUpdate> & sent () const { return m_sent; }
  const std::vector<StateOp> & invoked () const { return m_invoked; }
  void clear () { m_sent.clear(); m_invoked.clear(); }
};

} // namespace Device

#endif // VOWELPAD_DEVICE_H

