
#include "spectral.h"
#include "fft.h"
#include "window.h"
#include "wav_file.h"
#include <iomanip>

namespace Spectral
{

ostream & operator<< (ostream & o, const Profile & profile)
{
  std::ios::fmtflags flags = o.flags();
  std::streamsize precision = o.precision();

  o << std::fixed
    << "centroid ~ " << std::setprecision(1) << profile.centroid_hz
    << " Hz, low_ratio ~ " << std::setprecision(3) << profile.low_ratio
    << ", x = " << profile.x
    << ", y = " << profile.y;

  o.flags(flags);
  o.precision(precision);
  return o;
}

//----( calibration )---------------------------------------------------------

double brightness_coordinate (double centroid_hz)
{
  return clipped( (centroid_hz - CENTROID_DARK_HZ)
                / (CENTROID_BRIGHT_HZ - CENTROID_DARK_HZ));
}

double register_coordinate (double low_ratio)
{
  return clipped(1.0 - (low_ratio - LOW_RATIO_HEAD)
                     / (LOW_RATIO_CHEST - LOW_RATIO_HEAD));
}

//----( analysis )------------------------------------------------------------

void downmix (
    const Vector<float> & interleaved,
    size_t num_channels,
    Vector<float> & mono)
{
  ASSERT_LT(0, num_channels);
  ASSERT_SIZE(interleaved, mono.size * num_channels);

  const float * restrict in = interleaved.data;
  float * restrict out = mono.data;
  const float scale = 1.0f / num_channels;

  for (size_t i = 0, I = mono.size; i < I; ++i) {
    float total = 0;
    for (size_t c = 0; c < num_channels; ++c) {
      total += in[num_channels * i + c];
    }
    out[i] = scale * total;
  }
}

Profile analyze (const Vector<float> & signal, double sample_rate)
{
  const size_t size = signal.size;
  ASSERT_LT(0, size);
  ASSERT_LT(0, sample_rate);

  FFT_R2C fft(size);

  Vector<float> window(size);
  hann_window(window);

  fft.time_in = signal;
  fft.time_in *= window;
  fft.transform_fwd();

  Vector<float> mag(fft.size_out());
  value_to_magnitude(fft.freq_out, mag);

  const double hz_per_bin = sample_rate / size;

  double total = 0;
  double moment = 0;
  double low = 0;
  for (size_t k = 0; k < mag.size; ++k) {
    const double freq = k * hz_per_bin;
    const double m = mag[k];

    total += m;
    moment += freq * m;
    if (freq < LOW_CUTOFF_HZ) low += m;
  }

  Profile profile;
  if (total > 0) {
    profile.centroid_hz = moment / total;
    profile.low_ratio = low / total;
  } else {
    profile.centroid_hz = SILENT_CENTROID_HZ;
    profile.low_ratio = SILENT_LOW_RATIO;
  }

  profile.x = brightness_coordinate(profile.centroid_hz);
  profile.y = register_coordinate(profile.low_ratio);

  return profile;
}

Profile analyze (
    const Vector<float> & interleaved,
    size_t num_channels,
    double sample_rate)
{
  if (num_channels == 1) return analyze(interleaved, sample_rate);

  Vector<float> mono(interleaved.size / num_channels);
  downmix(interleaved, num_channels, mono);

  return analyze(mono, sample_rate);
}

Profile analyze (const WavData & wav)
{
  ASSERT_LT(0, wav.samples.size());

  const Vector<float> samples(
      wav.samples.size(),
      const_cast<float *>(& wav.samples[0]));

  return analyze(samples, wav.num_channels, wav.sample_rate);
}

bool analyze_wav_file (const char * filename, Profile & profile)
{
  LOG("Analyzing WAV file: " << filename);

  WavData wav;
  if (not read_wav_file(filename, wav)) return false;

  profile = analyze(wav);

  LOG("  " << profile);

  return true;
}

} // namespace Spectral

