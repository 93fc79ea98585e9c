
#ifndef VOWELPAD_ARCHETYPES_H
#define VOWELPAD_ARCHETYPES_H

/** Voice archetypes: nominal formant ranges for vowels, by vocal range.

  These are rough typical ranges, tuned by ear on the D-Lev;
  the tenor highs are slightly tamed.
  The table is compiled in and never changes at runtime.
*/

#include "common.h"

namespace Voice
{

static const int NUM_FORMANTS = 4;

enum Archetype
{
  BASS,
  BARITONE,
  TENOR,
  ALTO,
  MEZZO,
  SOPRANO,
  NEUTRAL,
  NUM_ARCHETYPES
};

struct Range
{
  double min;
  double max;

  double at (double t) const { return affine_sum(min, max, t); }
  double mid () const { return (min + max) / 2; }
};

struct ArchetypeProfile
{
  Range F[NUM_FORMANTS];
};

const ArchetypeProfile & archetype_profile (Archetype archetype);

const char * archetype_name (Archetype archetype);

// case insensitive; anything unrecognized is NEUTRAL
Archetype parse_archetype (string name);

ostream & operator<< (ostream & o, const ArchetypeProfile & profile);

} // namespace Voice

#endif // VOWELPAD_ARCHETYPES_H

