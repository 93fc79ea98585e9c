
#include "session.h"
#include <sstream>

//----( settings )------------------------------------------------------------

Settings::Settings ()
  : dlin_command("./d-lin"),
    use_sudo(true),
    update_interval_ms(DEFAULT_UPDATE_INTERVAL_MS),
    profile("Tenor"),
    brightness_pct(70),
    resonance_pct(50),
    current_slot(200),
    target_slot(201),
    save_name("dpc_preset")
{}

namespace
{

int nonneg_setting (const ConfigParser & config, string key, int default_value)
{
  int value = config(key, default_value);
  if (value < 0) {
    WARN(key << " = " << value << " must be nonnegative; using "
         << default_value);
    return default_value;
  }
  return value;
}

} // anonymous namespace

Settings::Settings (const ConfigParser & config)
  : dlin_command(config("dlin_command", "./d-lin")),
    use_sudo(config("use_sudo", 1)),
    update_interval_ms(nonneg_setting(
        config,
        "update_interval_ms",
        DEFAULT_UPDATE_INTERVAL_MS)),
    profile(config("profile", "Tenor")),
    brightness_pct(config("brightness", 70.0)),
    resonance_pct(config("resonance", 50.0)),
    current_slot(nonneg_setting(config, "current_slot", 200)),
    target_slot(nonneg_setting(config, "target_slot", 201)),
    save_name(config("save_name", "dpc_preset"))
{}

//----( session )-------------------------------------------------------------

Session::Session (
    Dispatch::Dispatcher & dispatcher,
    Voice::Archetype archetype,
    const Formant::Intensities & intensities)
  : m_dispatcher(dispatcher),
    m_position(0.5, 0.5),
    m_archetype(archetype),
    m_intensities(intensities),
    m_enabled(true),
    m_have_wav_target(false),
    m_wav_target(),
    m_base_knob_file()
{}

string Session::base_knob_file (int slot)
{
  std::ostringstream name;
  name << "dpc_base_knobs_slot" << slot;
  return name.str();
}

Formant::ParameterSet Session::parameters () const
{
  return Formant::map_to_parameters(m_position, m_archetype, m_intensities);
}

void Session::set_position (double x, double y)
{
  m_position = Formant::Coordinate(x, y);
  apply();
}

void Session::set_archetype (string name)
{
  m_archetype = Voice::parse_archetype(name);
  LOG("Profile changed to: " << Voice::archetype_name(m_archetype));
  apply();
}

void Session::set_intensities (double brightness, double resonance)
{
  m_intensities = Formant::Intensities(brightness, resonance);
  apply();
}

size_t Session::apply ()
{
  if (not m_enabled) {
    LOG("Processing disabled: not sending changes.");
    return 0;
  }

  Formant::ParameterSet params = parameters();

  LOG("[Profile " << Voice::archetype_name(m_archetype) << "] "
      << "XY (" << m_position.x << ", " << m_position.y << ") -> Formants:\n"
      << params);

  return m_dispatcher.dispatch_parameters(params);
}

void Session::set_enabled (bool enabled)
{
  m_enabled = enabled;
  LOG("Processing enabled: " << (enabled ? "yes" : "no"));

  if (enabled) {
    apply();
  } else if (base_captured()) {
    restore_base();
  } else {
    LOG("No base knobs captured yet; nothing to restore.");
  }
}

bool Session::capture_base (int slot)
{
  ASSERT_NONNEG(slot);

  string file = base_knob_file(slot);
  LOG("Capturing base knobs from slot " << slot << " into '" << file << "'");

  if (not m_dispatcher.dispatch_immediate(Device::StateOp::dump_knobs(file))) {
    return false;
  }

  m_base_knob_file = file;
  return true;
}

bool Session::restore_base ()
{
  if (not base_captured()) {
    WARN("no base knobs captured; nothing to restore");
    return false;
  }

  LOG("Restoring base knobs from '" << m_base_knob_file << "'");
  return m_dispatcher.dispatch_immediate(
      Device::StateOp::pump_knobs(m_base_knob_file));
}

bool Session::save_preset (int slot, string name)
{
  ASSERT_NONNEG(slot);

  LOG("Saving slot " << slot << " to '" << name << ".dlp'");
  return m_dispatcher.dispatch_immediate(
      Device::StateOp::dump_slot(slot, name));
}

bool Session::copy_slot (int source, int target)
{
  ASSERT_NONNEG(source);
  ASSERT_NONNEG(target);

  LOG("Copying slot " << source << " -> slot " << target);
  return m_dispatcher.dispatch_immediate(
      Device::StateOp::copy_slot(source, target));
}

bool Session::load_wav (const char * filename, Spectral::Profile & profile)
{
  Spectral::Profile result;
  if (not Spectral::analyze_wav_file(filename, result)) {
    WARN("could not analyze " << filename);
    return false;
  }

  profile = result;
  m_wav_target = Formant::Coordinate(result.x, result.y);
  m_have_wav_target = true;

  LOG("Mapped XY target: x = " << m_wav_target.x
      << ", y = " << m_wav_target.y);

  return true;
}

bool Session::snap_to_wav ()
{
  if (not m_have_wav_target) {
    LOG("No WAV profile loaded yet.");
    return false;
  }

  m_position = m_wav_target;
  apply();
  return true;
}

