
/** Real-input FFT objects wrapping FFWT3.

  FFTW3 = fastest fourier transform in the west, version 3.
        @ http://www.fftw.org

  Note on Precision:
    Single-precision (23-24 bits) is plenty for 16-bit audio data.
    This requires linking with -lfftw3f instesd of -lfftw3,
    and prepending fftwf_ instead of fftw_.
    See fftw manual ss. 4.3.2, pp. 21-22 for details.

  Note on Sizes:
    Recordings are transformed whole, so sizes are arbitrary, not 2^k.
    Plans are made with FFTW_ESTIMATE, which is cheap to plan and
    does not scribble over the input buffer while planning.

  References:
  (R1) http://www.fftw.org/fftw3_doc/
*/

#ifndef VOWELPAD_FFT_H
#define VOWELPAD_FFT_H

#include "common.h"
#include "vectors.h"
#include <fftw3.h>

//----( misc functions )------------------------------------------------------

// magnitude spectrum |value|, phase is dropped
void value_to_magnitude (const Vector<complex> & value,
                         Vector<float> & mag);

//----( fast fourier transform classes )--------------------------------------

class FFT_R2C
{
  const size_t m_size;

public:
  Vector<float> time_in;
  Vector<complex> freq_out;

private:
  fftwf_plan m_fwd_plan;

public:
  FFT_R2C (size_t size);
  ~FFT_R2C ();

  // diagnostics
  size_t size_in  () const { return m_size; }
  size_t size_out () const { return m_size/2 + 1; }

  // this can work concurrently
  void transform_fwd (void) { fftwf_execute(m_fwd_plan); }
};

#endif // VOWELPAD_FFT_H

