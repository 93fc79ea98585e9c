
#ifndef VOWELPAD_SESSION_H
#define VOWELPAD_SESSION_H

/** Companion session: the state a user manipulates between D-Lev sends.

  A session holds the pad position, the voice archetype, the two intensity
  controls, and whether processing is enabled at all.
  Every change re-evaluates the formant mapping and pushes the result
  through the throttled dispatcher.

  The session also remembers a "base" knob set captured from the D-Lev,
  so that disabling processing puts the instrument back where it started,
  and the XY target of the last analyzed recording, so the pad can snap
  to it.
*/

#include "common.h"
#include "config.h"
#include "formant.h"
#include "spectral.h"
#include "dispatch.h"

//----( settings )------------------------------------------------------------

struct Settings
{
  string dlin_command;
  bool use_sudo;
  int update_interval_ms;
  string profile;
  double brightness_pct;
  double resonance_pct;
  int current_slot;
  int target_slot;
  string save_name;

  Settings ();

  // negative slots or intervals fall back to their defaults
  Settings (const ConfigParser & config);

  Formant::Intensities intensities () const
  {
    return Formant::Intensities(brightness_pct / 100, resonance_pct / 100);
  }
};

//----( session )-------------------------------------------------------------

class Session
{
  Dispatch::Dispatcher & m_dispatcher;

  Formant::Coordinate m_position;
  Voice::Archetype m_archetype;
  Formant::Intensities m_intensities;
  bool m_enabled;

  bool m_have_wav_target;
  Formant::Coordinate m_wav_target;

  string m_base_knob_file;

public:

  Session (
      Dispatch::Dispatcher & dispatcher,
      Voice::Archetype archetype = Voice::TENOR,
      const Formant::Intensities & intensities = Formant::Intensities());
  ~Session () {}

  // diagnostics
  const Formant::Coordinate & position () const { return m_position; }
  Voice::Archetype archetype () const { return m_archetype; }
  const Formant::Intensities & intensities () const { return m_intensities; }
  bool enabled () const { return m_enabled; }
  bool have_wav_target () const { return m_have_wav_target; }
  const Formant::Coordinate & wav_target () const { return m_wav_target; }
  bool base_captured () const { return not m_base_knob_file.empty(); }
  const string & base_knob_file () const { return m_base_knob_file; }

  Formant::ParameterSet parameters () const;

  // continuous controls, each followed by apply()
  void set_position (double x, double y);
  void set_archetype (string name);
  void set_intensities (double brightness, double resonance);

  // returns the number of knob writes forwarded
  size_t apply ();

  void set_enabled (bool enabled);

  // whole-state commands; these return true on device success
  bool capture_base (int slot);
  bool restore_base ();
  bool save_preset (int slot, string name);
  bool copy_slot (int source, int target);

  // adopts a base captured by an earlier session for this slot
  void assume_base (int slot) { m_base_knob_file = base_knob_file(slot); }

  // recordings
  bool load_wav (const char * filename, Spectral::Profile & profile);
  bool snap_to_wav ();

  static string base_knob_file (int slot);
};

#endif // VOWELPAD_SESSION_H

