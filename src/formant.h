
#ifndef VOWELPAD_FORMANT_H
#define VOWELPAD_FORMANT_H

/** XY --> formant mapping for the D-Lev voice.

  The pad is a two dimensional timbre space
    x : dark (0) --> bright (1)
    y : chest (0) --> head (1)
  The vertical axis raises the low formants F1,F2 across the archetype's
  ranges, and the horizontal axis moves the high formants F3,F4,
  their levels, and the global bass/treble tilt.

  Two intensity controls scale the effect:
    brightness : depth of horizontal modulation; at 0 the highs sit at
                 their mid range and x only nudges the tilt
    resonance  : how far the shared formant resonance widens as the
                 point moves toward the bright/head corner

  Rounding is half-to-even throughout, which is what the companion tool
  that produced existing presets does.
*/

#include "common.h"
#include "archetypes.h"
#include "device.h"
#include <vector>

namespace Formant
{

static const int LEVEL_F1 = 55;
static const int LEVEL_F2 = 45;

static const int MIN_RESONANCE = 3;
static const int MAX_RESONANCE = 7;

static const double KNOB_MIN_HZ = 200.0;
static const double KNOB_MAX_HZ = 4000.0;
static const int KNOB_MIN_VALUE = 100;
static const int KNOB_MAX_VALUE = 3500;

static const size_t KNOBS_PER_PARAMETER_SET = 14;

//----( inputs )--------------------------------------------------------------

struct Coordinate
{
  double x;
  double y;

  Coordinate (double a_x = 0.5, double a_y = 0.5)
    : x(clipped(a_x)),
      y(clipped(a_y))
  {}
};

struct Intensities
{
  double brightness;
  double resonance;

  Intensities (double b = 0.7, double r = 0.5)
    : brightness(clipped(b)),
      resonance(clipped(r))
  {}
};

//----( outputs )-------------------------------------------------------------

struct ParameterSet
{
  double F[Voice::NUM_FORMANTS];  // Hz
  int L[Voice::NUM_FORMANTS];
  int R[Voice::NUM_FORMANTS];     // all equal
  int bass;
  int treble;

  bool operator== (const ParameterSet & other) const;
};

ostream & operator<< (ostream & o, const ParameterSet & params);

//----( mapping )-------------------------------------------------------------

ParameterSet map_to_parameters (
    const Coordinate & coord,
    Voice::Archetype archetype,
    const Intensities & intensities);

// x recentered around 0.5 and attenuated by brightness
double centered_x (double x, double brightness);

int hz_to_knob_value (double freq_hz);

/** Expands a parameter set into the 14 knob writes that realize it:
  frequencies, then levels, then resonances of formants 0..3,
  then treble and bass of oscillator 0.
*/
void encode_knobs (
    const ParameterSet & params,
    std::vector<Device::KnobUpdate> & knobs);

} // namespace Formant

#endif // VOWELPAD_FORMANT_H

