
#ifndef VOWELPAD_WINDOW_H
#define VOWELPAD_WINDOW_H

/** Window functions map [-1,1] --> RR

                        ^  w(t)              Satisfying:
                    __--|--__                  w(0) = "max value"
                 _-~    |    ~-_               w(-1) = w(1) = 0
               _/       |       \_             dw(-1) = dw(0) = dw(1) = 0
             _/         |         \_           w(x) = w(-x)
      ___--~~           |           ~~--___
   -+-------------------+-------------------+------> t
   -1                   0                   1
*/

#include "common.h"
#include "vectors.h"

//----------------------------------------------------------------------------
/** Hann window.

  The hann window also satisfies
    w(x) = 1 - w(1-x) for x in [0,1]
*/

inline double window_Hann (double t)
{
  ASSERT((-1 <= t) and (t <= 1), "window argument out of range: " << t);
  return (1 + cos(M_PI * t)) / 2;
}

/** Symmetric Hann window sampled at size points,
  with both endpoints landing on zeros.

  Equivalently w[n] = 0.5 - 0.5 cos(2 pi n / (size-1)).
  A single-point window is 1.
*/
inline void hann_window (Vector<float> & w)
{
  const size_t size = w.size;
  if (size == 1) { w[0] = 1; return; }

  const double scale = 2.0 / (size - 1);
  for (size_t n = 0; n < size; ++n) {
    w[n] = window_Hann(min(1.0, n * scale - 1));
  }
}

#endif // VOWELPAD_WINDOW_H

