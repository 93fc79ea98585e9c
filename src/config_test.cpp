
#include "config.h"
#include "session.h"
#include <sstream>
#include <fstream>

string temp_filename (const char * name)
{
  std::ostringstream filename;
  filename << "/tmp/vowelpad_" << name << "_" << getpid() << ".conf";
  return filename.str();
}

void test_parse ()
{
  LOG("Testing config parsing");

  string filename = temp_filename("config_test");
  {
    std::ofstream file(filename.c_str());
    file << "# vowelpad settings\n"
         << "\n"
         << "dlin_command = /opt/dlev/d-lin\n"
         << "   use_sudo = 0\n"
         << "update_interval_ms = 200\n"
         << "# profile = Bass\n"
         << "profile = Soprano\n"
         << "brightness = 35.5\n";
  }

  ConfigParser config(filename.c_str());
  unlink(filename.c_str());

  ASSERT(config.found(), "config file not found");
  ASSERT(config.has("profile"), "missing profile");
  ASSERT(not config.has("resonance"), "unexpected resonance");

  ASSERT_EQ(config("dlin_command", "./d-lin"), "/opt/dlev/d-lin");
  ASSERT_EQ(config("use_sudo", 1), 0);
  ASSERT_EQ(config("update_interval_ms", 150), 200);
  ASSERT_EQ(config("profile", "Tenor"), "Soprano");
  ASSERT_EQ(config("brightness", 70.0), 35.5);
  ASSERT_EQ(config("resonance", 50.0), 50.0);

  Settings settings(config);
  ASSERT_EQ(settings.dlin_command, "/opt/dlev/d-lin");
  ASSERT(not settings.use_sudo, "use_sudo not read");
  ASSERT_EQ(settings.update_interval_ms, 200);
  ASSERT_EQ(settings.profile, "Soprano");
  ASSERT_EQ(settings.brightness_pct, 35.5);
  ASSERT_EQ(settings.resonance_pct, 50.0);
  ASSERT_EQ(settings.current_slot, 200);
  ASSERT_EQ(settings.save_name, "dpc_preset");
}

void test_missing_file ()
{
  LOG("Testing a missing config file");

  ConfigParser config("/nonexistent/vowelpad.conf");
  ASSERT(not config.found(), "found a missing file");
  ASSERT_EQ(config("profile", "Tenor"), "Tenor");
  ASSERT_EQ(config("current_slot", 200), 200);

  Settings defaults;
  Settings settings(config);
  ASSERT_EQ(settings.dlin_command, defaults.dlin_command);
  ASSERT_EQ(settings.use_sudo, defaults.use_sudo);
  ASSERT_EQ(settings.update_interval_ms, defaults.update_interval_ms);
  ASSERT_EQ(settings.profile, defaults.profile);
  ASSERT_EQ(settings.brightness_pct, defaults.brightness_pct);
  ASSERT_EQ(settings.target_slot, defaults.target_slot);
}

void test_malformed ()
{
  LOG("Testing malformed lines");

  string filename = temp_filename("config_malformed_test");
  {
    std::ofstream file(filename.c_str());
    file << "current_slot : 17\n"
         << "target_slot = 42\n";
  }

  ConfigParser config(filename.c_str());
  unlink(filename.c_str());

  ASSERT(config.found(), "config file not found");
  ASSERT(not config.has("current_slot"), "accepted a line without '='");
  ASSERT_EQ(config("target_slot", 201), 42);
}

void test_negative_settings ()
{
  LOG("Testing negative slots and intervals");

  string filename = temp_filename("config_negative_test");
  {
    std::ofstream file(filename.c_str());
    file << "update_interval_ms = -150\n"
         << "current_slot = -1\n"
         << "target_slot = -201\n";
  }

  ConfigParser config(filename.c_str());
  unlink(filename.c_str());

  Settings settings(config);
  ASSERT_EQ(settings.update_interval_ms, DEFAULT_UPDATE_INTERVAL_MS);
  ASSERT_EQ(settings.current_slot, 200);
  ASSERT_EQ(settings.target_slot, 201);

  // these now go through without tripping precondition checks
  Device::DryRunChannel channel(false);
  Dispatch::ManualClock clock;
  Dispatch::Dispatcher dispatcher(
      channel,
      clock,
      settings.update_interval_ms / 1000.0);
  Session session(dispatcher);
  ASSERT(session.capture_base(settings.current_slot), "capture failed");
  ASSERT_EQ(channel.invoked()[0].file, "dpc_base_knobs_slot200");
}

void test_full_precision ()
{
  LOG("Testing precision of config values");

  string filename = temp_filename("config_precision_test");
  {
    std::ofstream file(filename.c_str());
    file << "brightness = 100\n"
         << "resonance = 70\n";
  }

  ConfigParser config(filename.c_str());
  unlink(filename.c_str());

  Settings settings(config);
  ASSERT_EQ(settings.intensities().brightness, 1.0);
  ASSERT_EQ(settings.intensities().resonance, 0.7);

  Formant::ParameterSet params = Formant::map_to_parameters(
      Formant::Coordinate(0.1, 0.5),
      Voice::TENOR,
      settings.intensities());
  ASSERT_EQ(params.L[2], 26);
}

int main ()
{
  test_parse();
  test_missing_file();
  test_malformed();
  test_negative_settings();
  test_full_precision();

  return 0;
}
