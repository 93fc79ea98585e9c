
#include "archetypes.h"
#include <algorithm>
#include <cctype>

namespace Voice
{

namespace
{

// F1, F2, F3, F4 as {min, max} in Hz
const ArchetypeProfile g_profiles[NUM_ARCHETYPES] = {
  { { {300.0,  650.0}, { 700.0, 1200.0}, {1700.0, 2400.0}, {2200.0, 3200.0} } },
  { { {330.0,  700.0}, { 800.0, 1350.0}, {1800.0, 2500.0}, {2300.0, 3400.0} } },
  { { {380.0,  750.0}, { 900.0, 1500.0}, {1900.0, 2600.0}, {2400.0, 3400.0} } },
  { { {400.0,  800.0}, {1000.0, 1700.0}, {2100.0, 2900.0}, {2600.0, 3500.0} } },
  { { {420.0,  850.0}, {1100.0, 1800.0}, {2200.0, 3000.0}, {2700.0, 3600.0} } },
  { { {450.0,  900.0}, {1200.0, 2000.0}, {2400.0, 3100.0}, {2800.0, 3700.0} } },
  { { {360.0,  780.0}, { 850.0, 1500.0}, {1900.0, 2700.0}, {2400.0, 3400.0} } }
};

const char * g_names[NUM_ARCHETYPES] = {
  "Bass",
  "Baritone",
  "Tenor",
  "Alto",
  "Mezzo",
  "Soprano",
  "Neutral"
};

inline char to_lower (char c)
{
  return std::tolower(static_cast<unsigned char>(c));
}

} // anonymous namespace

const ArchetypeProfile & archetype_profile (Archetype archetype)
{
  ASSERT1_LT(archetype, NUM_ARCHETYPES);

  return g_profiles[archetype];
}

const char * archetype_name (Archetype archetype)
{
  ASSERT1_LT(archetype, NUM_ARCHETYPES);

  return g_names[archetype];
}

Archetype parse_archetype (string name)
{
  std::transform(name.begin(), name.end(), name.begin(), to_lower);

  for (int i = 0; i < NUM_ARCHETYPES; ++i) {
    string candidate = g_names[i];
    std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                   to_lower);
    if (name == candidate) return static_cast<Archetype>(i);
  }

  return NEUTRAL;
}

ostream & operator<< (ostream & o, const ArchetypeProfile & profile)
{
  for (int i = 0; i < NUM_FORMANTS; ++i) {
    const Range & F = profile.F[i];
    o << (i ? ", " : "") << "F" << (1 + i) << " " << F.min << "-" << F.max;
  }
  return o;
}

} // namespace Voice

