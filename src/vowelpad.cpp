
#include "common.h"
#include "args.h"
#include "config.h"
#include "archetypes.h"
#include "formant.h"
#include "spectral.h"
#include "device.h"
#include "dispatch.h"
#include "session.h"

//----( options )-------------------------------------------------------------

std::string g_config_filename = DEFAULT_CONFIG_FILENAME;
bool g_dry_run = false;
std::string g_profile = "";
double g_brightness_pct = -1;
double g_resonance_pct = -1;
int g_interval_ms = -1;

int g_status = 0;

//----( settings )------------------------------------------------------------

// options given on the command line override the config file
Settings load_settings ()
{
  Settings settings((ConfigParser(g_config_filename.c_str())));

  if (not g_profile.empty()) settings.profile = g_profile;
  if (g_brightness_pct >= 0) settings.brightness_pct = g_brightness_pct;
  if (g_resonance_pct >= 0) settings.resonance_pct = g_resonance_pct;
  if (g_interval_ms >= 0) settings.update_interval_ms = g_interval_ms;

  return settings;
}

//----( command context )-----------------------------------------------------

// everything a device command needs, wired up from config and options
class Context
{
  Settings m_settings;
  Device::Channel * m_channel;
  Dispatch::SystemClock m_clock;
  Dispatch::Dispatcher * m_dispatcher;
  Session * m_session;

public:

  Context ()
    : m_settings(load_settings()),
      m_channel(NULL),
      m_clock(),
      m_dispatcher(NULL),
      m_session(NULL)
  {
    if (g_dry_run) {
      m_channel = new Device::DryRunChannel();
    } else {
      m_channel = new Device::DlinChannel(
          m_settings.dlin_command,
          m_settings.use_sudo);
    }

    m_dispatcher = new Dispatch::Dispatcher(
        * m_channel,
        m_clock,
        m_settings.update_interval_ms / 1000.0);

    m_session = new Session(
        * m_dispatcher,
        Voice::parse_archetype(m_settings.profile),
        m_settings.intensities());

    LOG("profile " << Voice::archetype_name(m_session->archetype())
        << ", brightness " << m_settings.brightness_pct
        << "%, resonance " << m_settings.resonance_pct << "%");
  }

  ~Context ()
  {
    delete m_session;
    delete m_dispatcher;
    delete m_channel;
  }

  const Settings & settings () const { return m_settings; }
  Dispatch::Dispatcher & dispatcher () { return * m_dispatcher; }
  Session & session () { return * m_session; }
};

//----( argument helpers )----------------------------------------------------

double pop_unit (Args & args)
{
  double value = args.pop_double();
  ASSERTW((0 <= value) and (value <= 1),
          "clamping " << value << " to [0,1]");
  return value;
}

//----( commands )------------------------------------------------------------

void run_analyze (Args & args)
{
  const char * filename = args.pop();

  Spectral::Profile profile;
  if (not Spectral::analyze_wav_file(filename, profile)) {
    g_status = 1;
    return;
  }

  LOG("Mapped XY target: x = " << profile.x << ", y = " << profile.y);
}

void run_map (Args & args)
{
  double x = pop_unit(args);
  double y = pop_unit(args);

  Settings settings = load_settings();

  Voice::Archetype archetype = Voice::parse_archetype(settings.profile);
  Formant::ParameterSet params = Formant::map_to_parameters(
      Formant::Coordinate(x, y),
      archetype,
      settings.intensities());

  LOG("[Profile " << Voice::archetype_name(archetype) << "] XY -> Formants:\n"
      << params);

  std::vector<Device::KnobUpdate> knobs;
  Formant::encode_knobs(params, knobs);
  for (size_t i = 0; i < knobs.size(); ++i) {
    LOG("  knob -pkv " << knobs[i]);
  }
}

void run_apply (Args & args)
{
  double x = pop_unit(args);
  double y = pop_unit(args);

  Context context;
  context.session().set_position(x, y);
}

void run_drag (Args & args)
{
  double x0 = pop_unit(args);
  double y0 = pop_unit(args);
  double x1 = pop_unit(args);
  double y1 = pop_unit(args);
  int steps = args.pop_nonneg(50);
  int step_ms = args.pop_nonneg(10);

  if (steps < 2) {
    LOG("drag needs at least 2 steps");
    g_status = 1;
    return;
  }

  Context context;
  Session & session = context.session();

  LOG("dragging (" << x0 << ", " << y0 << ") -> (" << x1 << ", " << y1
      << ") in " << steps << " steps of " << step_ms << " ms");

  for (int i = 0; i < steps; ++i) {
    double t = double(i) / (steps - 1);
    session.set_position(affine_sum(x0, x1, t), affine_sum(y0, y1, t));
    usleep(1000 * step_ms);
  }

  LOG("drag done: " << context.dispatcher().stats());
}

void run_snap (Args & args)
{
  const char * filename = args.pop();

  Context context;
  Spectral::Profile profile;
  if (not context.session().load_wav(filename, profile)) {
    g_status = 1;
    return;
  }
  context.session().snap_to_wav();
}

void run_capture (Args & args)
{
  Context context;
  int slot = args.pop_nonneg(context.settings().current_slot);

  if (context.session().capture_base(slot)) {
    LOG("Base knobs captured. Run 'restore " << slot << "' to go back.");
  } else {
    g_status = 1;
  }
}

void run_restore (Args & args)
{
  Context context;
  int slot = args.pop_nonneg(context.settings().current_slot);

  Session & session = context.session();
  session.assume_base(slot);
  if (not session.restore_base()) g_status = 1;
}

void run_save (Args & args)
{
  Context context;
  int slot = args.pop_nonneg(context.settings().current_slot);
  string name = args.pop(context.settings().save_name.c_str());

  if (context.session().save_preset(slot, name)) {
    LOG("Save completed (check " << name << ".dlp in this directory).");
  } else {
    g_status = 1;
  }
}

void run_copy (Args & args)
{
  Context context;
  int source = args.pop_nonneg(context.settings().current_slot);
  int target = args.pop_nonneg(context.settings().target_slot);

  if (context.session().copy_slot(source, target)) {
    LOG("Copy completed. Select slot " << target << " on the D-Lev to test.");
  } else {
    g_status = 1;
  }
}

void run_profiles (Args & args)
{
  for (int i = 0; i < Voice::NUM_ARCHETYPES; ++i) {
    Voice::Archetype archetype = static_cast<Voice::Archetype>(i);
    LOG("  " << Voice::archetype_name(archetype) << ": "
        << Voice::archetype_profile(archetype));
  }
}

//----( main )----------------------------------------------------------------

const char * long_help_message =
"Usage: vowelpad [OPTIONS] COMMAND [ARGS]"
"\nOptions:"
"\n  config FILENAME     (default = " DEFAULT_CONFIG_FILENAME ")"
"\n  dry                 log device commands instead of running d-lin"
"\n  profile NAME        Bass | Baritone | Tenor | Alto | Mezzo | Soprano"
                         " | Neutral"
"\n  brightness PERCENT  (0 | ... | 100, default = 70)"
"\n  resonance PERCENT   (0 | ... | 100, default = 50)"
"\n  interval MS         min time between knob writes (default = 150)"
"\nCommands:"
"\n  analyze FILE.wav"
"\n  map X Y             print formants for a pad position, sends nothing"
"\n  apply X Y"
"\n  drag X0 Y0 X1 Y1 [STEPS = 50] [STEP_MS = 10]"
"\n  snap FILE.wav       analyze, move the pad to the result, apply"
"\n  capture [SLOT]      save current knobs as the base"
"\n  restore [SLOT]      put the base knobs back"
"\n  save [SLOT] [NAME]  dump a slot to NAME.dlp"
"\n  copy [SRC] [DST]"
"\n  profiles"
"\n  help"
"\nFiles: " DEFAULT_CONFIG_FILENAME
;

const char * short_help_message =
"Usage: vowelpad [OPTIONS] COMMAND [ARGS]"
"\n try 'vowelpad help' for detailed usage"
;

void run_long_help (Args & args) { LOG(long_help_message); }

int main (int argc, char ** argv)
{
  LOG(vowelpad_logo);
  LOG("session " << get_date());

  Args args(argc, argv, short_help_message);

  args
    .case_("config", g_config_filename)
    .case_("dry", g_dry_run)
    .case_("profile", g_profile)
    .case_("brightness", g_brightness_pct)
    .case_("resonance", g_resonance_pct)
    .case_("interval", g_interval_ms)
    .default_break_else_repeat();

  args
    .case_("analyze", run_analyze)
    .case_("map", run_map)
    .case_("apply", run_apply)
    .case_("drag", run_drag)
    .case_("snap", run_snap)
    .case_("capture", run_capture)
    .case_("restore", run_restore)
    .case_("save", run_save)
    .case_("copy", run_copy)
    .case_("profiles", run_profiles)
    .case_("help", run_long_help)
    .default_error();

  return g_status;
}

