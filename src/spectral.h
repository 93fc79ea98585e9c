
#ifndef VOWELPAD_SPECTRAL_H
#define VOWELPAD_SPECTRAL_H

/** Spectral fingerprint of a recording, as a point on the XY pad.

  The whole recording is Hann windowed and transformed at once, then
    x ~ brightness, from the spectral centroid
    y ~ chest/head, from the share of magnitude below 1 kHz
  Both are affine maps clamped to [0,1]; the calibration ranges
    centroid in [1500, 4000] Hz
    low ratio in [0.2, 0.7]  (more low energy = more chest = lower y)
  were tuned on sung vowels and existing presets depend on them.

  A spectrum with no magnitude at all (e.g. digital silence) is not an error:
  it gets centroid 0 and low ratio 0.5, which lands at (0, 0.4).
*/

#include "common.h"
#include "vectors.h"

struct WavData;

namespace Spectral
{

static const double CENTROID_DARK_HZ = 1500.0;
static const double CENTROID_BRIGHT_HZ = 4000.0;
static const double LOW_CUTOFF_HZ = 1000.0;
static const double LOW_RATIO_HEAD = 0.2;
static const double LOW_RATIO_CHEST = 0.7;

static const double SILENT_CENTROID_HZ = 0.0;
static const double SILENT_LOW_RATIO = 0.5;

struct Profile
{
  double centroid_hz;
  double low_ratio;
  double x;
  double y;

  Profile ()
    : centroid_hz(SILENT_CENTROID_HZ),
      low_ratio(SILENT_LOW_RATIO),
      x(0),
      y(0)
  {}
};

ostream & operator<< (ostream & o, const Profile & profile);

//----( calibration )---------------------------------------------------------

double brightness_coordinate (double centroid_hz);
double register_coordinate (double low_ratio);

//----( analysis )------------------------------------------------------------

// averages each frame of an interleaved signal down to one sample
void downmix (
    const Vector<float> & interleaved,
    size_t num_channels,
    Vector<float> & mono);

Profile analyze (const Vector<float> & signal, double sample_rate);

Profile analyze (
    const Vector<float> & interleaved,
    size_t num_channels,
    double sample_rate);

Profile analyze (const WavData & wav);

// returns false if the file could not be read; profile is then untouched
bool analyze_wav_file (const char * filename, Profile & profile);

} // namespace Spectral

#endif // VOWELPAD_SPECTRAL_H

