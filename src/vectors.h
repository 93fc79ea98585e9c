
#ifndef VOWELPAD_VECTORS_H
#define VOWELPAD_VECTORS_H

#include "common.h"

//----( vector classes )------------------------------------------------------

/** Fixed-size aligned buffers.

  A Vector either owns its data or aliases someone else's,
  and copy-construction always aliases.
  Aligned storage lets fftw plan with simd.
*/

template<class T>
struct Vector
{
  typedef T value_type;

  T * const data;
  const size_t size;
  const bool alias;

  // aliasing
  explicit Vector (size_t s, T * d = NULL)
    : data(d ? d : (T*) malloc_aligned(s * sizeof(T))), size(s), alias(d) {}
  Vector (const Vector<T> & other)
    : data(other.data), size(other.size), alias(true) {}
  ~Vector () { if (not alias) free_aligned(data); }

  // copying
  void operator= (const Vector<T> & other)
  {
    ASSERT_SIZE(other, size);
    for (size_t i = 0; i < size; ++i) { data[i] = other.data[i]; }
  }

  // filling
  void zero () { zero_bytes(data, size * sizeof(T)); }

  // access
  operator const T * () const { return data; }
  operator       T * ()       { return data; }
};

//----( in-place operators )--------------------------------------------------

template<class S, class T>
void operator*= (Vector<S> & X, const Vector<T> & Y)
{
  size_t size = X.size;
  ASSERT_SIZE(Y, size);

  S * restrict x = X.data;
  const T * restrict y = Y.data;

  for (size_t i = 0; i < size; ++i) x[i] *= y[i];
}

#endif // VOWELPAD_VECTORS_H

