
#ifndef VOWELPAD_COMMON_H
#define VOWELPAD_COMMON_H

#include <cstdlib>  // for exit() & abort();
#include <iostream>
#include <string>
#include <cmath>
#include <complex>
#include <cstdint>
#include <unistd.h>  // for usleep

using std::cout;
using std::cerr;
using std::endl;
using std::ostream;
using std::string;

extern const char * vowelpad_logo;

//----( global parameters )---------------------------------------------------

#define DEFAULT_CONFIG_FILENAME         "config/default.vowelpad.conf"
#define DEFAULT_UPDATE_INTERVAL_MS      (150)

//----( compiler-specific )---------------------------------------------------

#ifdef __GNUG__
  #define restrict __restrict__
#else // __GNUG__
  #warning keyword 'restrict' ignored
  #define restrict
#endif // __GNUG__

//----( logging )-------------------------------------------------------------

#define LOG(mess) { cout << mess << endl; }

#define ERROR(mess) {\
    cerr << "ERROR "\
         << mess << "\n\t"\
         << __FILE__ << " : " << __LINE__ << "\n\t"\
         << __PRETTY_FUNCTION__ << endl; \
    abort(); }

#define WARN(mess) {\
    cerr << "WARNING "\
         << mess << "\n\t"\
         << __FILE__ << " : " << __LINE__ << "\n\t"\
         << __PRETTY_FUNCTION__ << endl; }

#define ASSERT(cond, mess) { if (!(cond)) ERROR(mess); }
#define ASSERTW(cond, mess) { if (!(cond)) WARN(mess); }

#define ASSERT_EQ(x,y) ASSERT((x) == (y), \
    "expected " #x " = " #y ",\n\tactual: " << (x) << " vs " << (y))
#define ASSERT_LT(x,y) ASSERT((x) < (y), \
    "expected " #x " < " #y ",\n\tactual: " << (x) << " vs " << (y))
#define ASSERT_LE(x,y) ASSERT((x) <= (y), \
    "expected " #x " <= " #y ",\n\tactual: " << (x) << " vs " << (y))
#define ASSERT_NEAR(x,y,tol) ASSERT(fabs((x) - (y)) <= (tol), \
    "expected " #x " ~ " #y " within " << (tol) \
    << ",\n\tactual: " << (x) << " vs " << (y))
#define ASSERT_NONNEG(x) ASSERT(0 <= x, \
    "expected " #x " nonnegative,\n\tactual: " << (x))

#define ASSERT_SIZE(vect, vect_size) { \
  ASSERT(vect.size==static_cast<size_t>(vect_size), \
      "vector '" # vect "' has wrong size " \
      << vect.size << ",\n\tshould be " << (vect_size)); }

#ifndef VOWELPAD_NDEBUG
  #define ASSERT1(cond, mess) ASSERT(cond, mess)
  #define ASSERT1_EQ(x,y) ASSERT_EQ(x,y)
  #define ASSERT1_LT(x,y) ASSERT_LT(x,y)
#else // VOWELPAD_NDEBUG
  #define ASSERT1(cond, mess)
  #define ASSERT1_EQ(x,y)
  #define ASSERT1_LT(x,y)
#endif // VOWELPAD_NDEBUG

// time
double get_elapsed_time ();
string get_date (bool hour = true);

//----( datatypes )-----------------------------------------------------------

typedef std::complex<float> complex;

// these make finiteness testing safe even after optimization

inline bool safe_isfinite (float x)
{
  return (-HUGE_VALF < x) and (x < HUGE_VALF);
}
inline bool safe_isfinite (double x)
{
  return (-HUGE_VAL < x) and (x < HUGE_VAL);
}

//----( memory tools )--------------------------------------------------------

void * malloc_aligned (size_t size, size_t alignment = 16)
  __attribute__ ((malloc));
void free_aligned (void * pointer); // just calls free

void zero_bytes (void * x, size_t size);

//----( math )----------------------------------------------------------------

template<class T> inline T min (T x, T y) { return (x < y) ? x : y; }
template<class T> inline T max (T x, T y) { return (x > y) ? x : y; }

// clipping
template<class T> inline T bound_to (T LB, T UB, T x)
{
  return max(LB, min(UB, x));
}

// NaN clips to LB
inline double clipped (double x, double LB = 0, double UB = 1)
{
  if (x >= LB) {
    if (x <= UB) {
      return x;
    } else {
      return UB;
    }
  } else {
    return LB;
  }
}

// these round half to even under the default rounding mode
inline int roundi (float x) { return lrintf(x); }
inline int roundi (double x) { return lrint(x); }

inline double affine_sum (double x0, double x1, double t)
{
  return x0 + (x1 - x0) * t;
}

#endif // VOWELPAD_COMMON_H

