
#include "archetypes.h"

using namespace Voice;

void test_ranges ()
{
  LOG("Testing archetype ranges");

  for (int i = 0; i < NUM_ARCHETYPES; ++i) {
    Archetype archetype = static_cast<Archetype>(i);
    const ArchetypeProfile & profile = archetype_profile(archetype);
    LOG(" " << archetype_name(archetype) << ": " << profile);

    for (int f = 0; f < NUM_FORMANTS; ++f) {
      ASSERT_LT(profile.F[f].min, profile.F[f].max);
      ASSERT_LT(0, profile.F[f].min);
    }
    for (int f = 1; f < NUM_FORMANTS; ++f) {
      ASSERT_LT(profile.F[f-1].min, profile.F[f].min);
    }
  }

  const ArchetypeProfile & tenor = archetype_profile(TENOR);
  ASSERT_EQ(tenor.F[0].min, 380);
  ASSERT_EQ(tenor.F[0].max, 750);
  ASSERT_EQ(tenor.F[3].min, 2400);
  ASSERT_EQ(tenor.F[3].max, 3400);

  const ArchetypeProfile & soprano = archetype_profile(SOPRANO);
  ASSERT_EQ(soprano.F[1].min, 1200);
  ASSERT_EQ(soprano.F[1].max, 2000);

  ASSERT_EQ(tenor.F[2].at(0), 1900);
  ASSERT_EQ(tenor.F[2].at(1), 2600);
  ASSERT_EQ(tenor.F[2].mid(), 2250);
}

void test_parse ()
{
  LOG("Testing archetype names");

  for (int i = 0; i < NUM_ARCHETYPES; ++i) {
    Archetype archetype = static_cast<Archetype>(i);
    ASSERT_EQ(parse_archetype(archetype_name(archetype)), archetype);
  }

  ASSERT_EQ(parse_archetype("tenor"), TENOR);
  ASSERT_EQ(parse_archetype("TENOR"), TENOR);
  ASSERT_EQ(parse_archetype("Mezzo"), MEZZO);
  ASSERT_EQ(parse_archetype("bAsS"), BASS);

  ASSERT_EQ(parse_archetype("Countertenor"), NEUTRAL);
  ASSERT_EQ(parse_archetype(""), NEUTRAL);
  ASSERT_EQ(parse_archetype(" Tenor"), NEUTRAL);

  // bytes above 0x7f are negative as plain chars
  ASSERT_EQ(parse_archetype("T\xe9nor"), NEUTRAL);
  ASSERT_EQ(parse_archetype("\xc3\x89\xff"), NEUTRAL);
}

int main ()
{
  test_ranges();
  test_parse();

  return 0;
}
