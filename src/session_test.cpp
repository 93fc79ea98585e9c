
#include "session.h"
#include "wav_file.h"
#include <sstream>

using Device::StateOp;

void test_apply ()
{
  LOG("Testing apply");

  Device::DryRunChannel channel(false);
  Dispatch::ManualClock clock;
  Dispatch::Dispatcher dispatcher(channel, clock, 0);
  Session session(dispatcher, Voice::MEZZO, Formant::Intensities(0.8, 0.4));

  session.set_position(0.25, 0.75);
  ASSERT_EQ(session.position().x, 0.25);
  ASSERT_EQ(session.position().y, 0.75);
  ASSERT_EQ(channel.sent().size(), Formant::KNOBS_PER_PARAMETER_SET);

  std::vector<Device::KnobUpdate> expected;
  Formant::encode_knobs(
      Formant::map_to_parameters(
          Formant::Coordinate(0.25, 0.75),
          Voice::MEZZO,
          Formant::Intensities(0.8, 0.4)),
      expected);
  ASSERT(channel.sent() == expected, "session sent unexpected knobs");

  // out of range positions are clamped
  session.set_position(-1, 5);
  ASSERT_EQ(session.position().x, 0);
  ASSERT_EQ(session.position().y, 1);

  channel.clear();
  session.set_archetype("soprano");
  ASSERT_EQ(session.archetype(), Voice::SOPRANO);
  ASSERT_EQ(channel.sent().size(), Formant::KNOBS_PER_PARAMETER_SET);

  session.set_archetype("Countertenor");
  ASSERT_EQ(session.archetype(), Voice::NEUTRAL);

  session.set_intensities(0, 2);
  ASSERT_EQ(session.intensities().brightness, 0);
  ASSERT_EQ(session.intensities().resonance, 1);
}

void test_throttled_apply ()
{
  LOG("Testing apply through the throttle");

  Device::DryRunChannel channel(false);
  Dispatch::ManualClock clock;
  Dispatch::Dispatcher dispatcher(channel, clock, 0.15);
  Session session(dispatcher);

  ASSERT_EQ(session.apply(), 1);
  ASSERT_EQ(session.apply(), 0);
  clock.advance(0.15);
  ASSERT_EQ(session.apply(), 1);
  ASSERT_EQ(channel.sent().size(), 2);
}

void test_enable ()
{
  LOG("Testing enable and disable");

  Device::DryRunChannel channel(false);
  Dispatch::ManualClock clock;
  Dispatch::Dispatcher dispatcher(channel, clock, 0);
  Session session(dispatcher);

  // without a base there is nothing to restore
  session.set_enabled(false);
  ASSERT(not session.enabled(), "session still enabled");
  ASSERT_EQ(channel.invoked().size(), 0);

  // disabled sessions send nothing
  session.set_position(0.9, 0.1);
  ASSERT_EQ(channel.sent().size(), 0);
  ASSERT_EQ(session.apply(), 0);

  session.set_enabled(true);
  ASSERT_EQ(channel.sent().size(), Formant::KNOBS_PER_PARAMETER_SET);

  ASSERT(session.capture_base(200), "capture failed");
  ASSERT(session.base_captured(), "base not remembered");
  ASSERT_EQ(session.base_knob_file(), "dpc_base_knobs_slot200");
  ASSERT_EQ(channel.invoked().size(), 1);
  ASSERT_EQ(channel.invoked()[0].type, StateOp::DUMP_KNOBS);
  ASSERT_EQ(channel.invoked()[0].file, "dpc_base_knobs_slot200");

  // disabling puts the base back
  channel.clear();
  session.set_enabled(false);
  ASSERT_EQ(channel.sent().size(), 0);
  ASSERT_EQ(channel.invoked().size(), 1);
  ASSERT_EQ(channel.invoked()[0].type, StateOp::PUMP_KNOBS);
  ASSERT_EQ(channel.invoked()[0].file, "dpc_base_knobs_slot200");
}

void test_capture_failure ()
{
  LOG("Testing a failed capture");

  Device::DryRunChannel channel(false);
  channel.set_failing(true);
  Dispatch::ManualClock clock;
  Dispatch::Dispatcher dispatcher(channel, clock, 0);
  Session session(dispatcher);

  ASSERT(not session.capture_base(3), "failed capture reported success");
  ASSERT(not session.base_captured(), "failed capture was remembered");
  ASSERT(not session.restore_base(), "restored a base never captured");

  session.assume_base(3);
  ASSERT_EQ(session.base_knob_file(), Session::base_knob_file(3));
}

void test_slots ()
{
  LOG("Testing slot commands");

  Device::DryRunChannel channel(false);
  Dispatch::ManualClock clock;
  Dispatch::Dispatcher dispatcher(channel, clock, 0.15);
  Session session(dispatcher);

  ASSERT(session.save_preset(200, "warm_tenor"), "save failed");
  ASSERT(session.copy_slot(200, 201), "copy failed");

  ASSERT_EQ(channel.invoked().size(), 2);
  ASSERT_EQ(channel.invoked()[0].type, StateOp::DUMP_SLOT);
  ASSERT_EQ(channel.invoked()[0].slot, 200);
  ASSERT_EQ(channel.invoked()[0].file, "warm_tenor");
  ASSERT_EQ(channel.invoked()[1].type, StateOp::COPY_SLOT);
  ASSERT_EQ(channel.invoked()[1].slot, 200);
  ASSERT_EQ(channel.invoked()[1].target_slot, 201);
  ASSERT_EQ(channel.sent().size(), 0);
}

void test_snap ()
{
  LOG("Testing snap to a recording");

  Device::DryRunChannel channel(false);
  Dispatch::ManualClock clock;
  Dispatch::Dispatcher dispatcher(channel, clock, 0);
  Session session(dispatcher);

  ASSERT(not session.snap_to_wav(), "snapped without a recording");
  ASSERT_EQ(channel.sent().size(), 0);

  Spectral::Profile profile;
  ASSERT(not session.load_wav("/nonexistent/vowelpad.wav", profile),
         "loaded a missing file");
  ASSERT(not session.have_wav_target(), "missing file set a target");

  // a bright recording: 3 kHz lands at x = 0.6, y = 1
  WavData wav;
  wav.num_channels = 1;
  wav.sample_rate = 16000;
  wav.bytes_per_sample = 2;
  for (size_t i = 0; i < 16000; ++i) {
    wav.samples.push_back(0.5 * sin(2 * M_PI * 3000 * i / 16000.0));
  }

  std::ostringstream filename;
  filename << "/tmp/vowelpad_session_test_" << getpid() << ".wav";
  ASSERT(write_wav_file(filename.str().c_str(), wav),
         "could not write " << filename.str());

  bool loaded = session.load_wav(filename.str().c_str(), profile);
  unlink(filename.str().c_str());
  ASSERT(loaded, "could not load " << filename.str());
  ASSERT(session.have_wav_target(), "no target after loading");
  ASSERT_NEAR(profile.x, 0.6, 0.02);
  ASSERT_EQ(profile.y, 1);

  // loading alone moves nothing
  ASSERT_EQ(channel.sent().size(), 0);
  ASSERT_EQ(session.position().x, 0.5);

  ASSERT(session.snap_to_wav(), "snap failed");
  ASSERT_EQ(session.position().x, profile.x);
  ASSERT_EQ(session.position().y, profile.y);
  ASSERT_EQ(channel.sent().size(), Formant::KNOBS_PER_PARAMETER_SET);
}

void test_settings ()
{
  LOG("Testing default settings");

  Settings settings;
  ASSERT_EQ(settings.dlin_command, "./d-lin");
  ASSERT(settings.use_sudo, "sudo should be on by default");
  ASSERT_EQ(settings.update_interval_ms, 150);
  ASSERT_EQ(settings.profile, "Tenor");
  ASSERT_EQ(settings.current_slot, 200);
  ASSERT_EQ(settings.target_slot, 201);
  ASSERT_EQ(settings.save_name, "dpc_preset");

  Formant::Intensities intensities = settings.intensities();
  ASSERT_NEAR(intensities.brightness, 0.7, 1e-6);
  ASSERT_NEAR(intensities.resonance, 0.5, 1e-6);
}

int main ()
{
  test_apply();
  test_throttled_apply();
  test_enable();
  test_capture_failure();
  test_slots();
  test_snap();
  test_settings();

  return 0;
}
