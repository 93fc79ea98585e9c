
#include "formant.h"
#include <iomanip>

namespace Formant
{

//----( outputs )-------------------------------------------------------------

bool ParameterSet::operator== (const ParameterSet & other) const
{
  for (int i = 0; i < Voice::NUM_FORMANTS; ++i) {
    if (F[i] != other.F[i]) return false;
    if (L[i] != other.L[i]) return false;
    if (R[i] != other.R[i]) return false;
  }
  return bass == other.bass and treble == other.treble;
}

ostream & operator<< (ostream & o, const ParameterSet & params)
{
  o << std::fixed << std::setprecision(1);
  for (int i = 0; i < Voice::NUM_FORMANTS; ++i) {
    o << "  F" << (1 + i) << " ~ " << params.F[i] << " Hz -> "
      << i << "f:2:" << hz_to_knob_value(params.F[i]) << "\n";
  }
  o.unsetf(std::ios::floatfield);
  o << std::setprecision(6);

  o << "  Levels: L1=" << params.L[0]
    << ", L2=" << params.L[1]
    << ", L3=" << params.L[2]
    << ", L4=" << params.L[3] << "\n";
  o << "  Resonances: R1=R2=R3=R4=" << params.R[0] << "\n";
  o << "  Tilt: bass=" << params.bass << ", treb=" << params.treble;

  return o;
}

//----( mapping )-------------------------------------------------------------

double centered_x (double x, double brightness)
{
  return clipped((x - 0.5) * brightness + 0.5);
}

ParameterSet map_to_parameters (
    const Coordinate & coord,
    Voice::Archetype archetype,
    const Intensities & intensities)
{
  const double x = coord.x;
  const double y = coord.y;
  const double b = intensities.brightness;
  const double r = intensities.resonance;

  ASSERT1((0 <= x) and (x <= 1), "x out of range: " << x);
  ASSERT1((0 <= y) and (y <= 1), "y out of range: " << y);

  const Voice::ArchetypeProfile & profile = Voice::archetype_profile(archetype);

  ParameterSet params;

  // low formants follow the vertical axis
  params.F[0] = profile.F[0].at(y);
  params.F[1] = profile.F[1].at(y);

  // high formants follow the horizontal axis, attenuated by brightness
  const double xc = centered_x(x, b);
  params.F[2] = profile.F[2].at(xc);
  params.F[3] = profile.F[3].at(xc);

  params.L[0] = LEVEL_F1;
  params.L[1] = LEVEL_F2;
  params.L[2] = roundi(25 + 15 * xc * b);
  params.L[3] = roundi(20 + 10 * xc * b);

  // more head/bright = wider resonance, up to +4
  const double energy = 0.5 * x + 0.5 * y;
  const int extra_R = roundi(4 * r * energy);
  const int R = bound_to(MIN_RESONANCE, MAX_RESONANCE, MIN_RESONANCE + extra_R);
  for (int i = 0; i < Voice::NUM_FORMANTS; ++i) params.R[i] = R;

  // tilt blends between (bass 8, treb 4) at dark and (bass 5, treb 8) at bright
  const double swing = 0.5 + 0.5 * b;
  params.bass = roundi(5 + 3 * (1.0 - x) * swing);
  params.treble = roundi(4 + 4 * x * swing);

  return params;
}

int hz_to_knob_value (double freq_hz)
{
  double f = bound_to(KNOB_MIN_HZ, KNOB_MAX_HZ, freq_hz);
  double t = (f - KNOB_MIN_HZ) / (KNOB_MAX_HZ - KNOB_MIN_HZ);
  return roundi(KNOB_MIN_VALUE + t * (KNOB_MAX_VALUE - KNOB_MIN_VALUE));
}

void encode_knobs (
    const ParameterSet & params,
    std::vector<Device::KnobUpdate> & knobs)
{
  typedef Device::KnobUpdate Knob;

  static const char * formant_pages[Voice::NUM_FORMANTS] = {
    "0f", "1f", "2f", "3f"
  };
  static const int FREQ_KNOB = 2;
  static const int LEVEL_KNOB = 3;
  static const int RESONANCE_KNOB = 6;
  static const int TREBLE_KNOB = 1;
  static const int BASS_KNOB = 3;

  knobs.clear();

  for (int i = 0; i < Voice::NUM_FORMANTS; ++i) {
    knobs.push_back(
        Knob(formant_pages[i], FREQ_KNOB, hz_to_knob_value(params.F[i])));
  }
  for (int i = 0; i < Voice::NUM_FORMANTS; ++i) {
    knobs.push_back(Knob(formant_pages[i], LEVEL_KNOB, params.L[i]));
  }
  for (int i = 0; i < Voice::NUM_FORMANTS; ++i) {
    knobs.push_back(Knob(formant_pages[i], RESONANCE_KNOB, params.R[i]));
  }

  knobs.push_back(Knob("0o", TREBLE_KNOB, params.treble));
  knobs.push_back(Knob("0o", BASS_KNOB, params.bass));

  ASSERT1_EQ(knobs.size(), KNOBS_PER_PARAMETER_SET);
}

} // namespace Formant

