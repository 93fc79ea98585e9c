
#include "fft.h"
#include "threads.h"

#define LOG1(mess)

//----( misc functions )------------------------------------------------------

void value_to_magnitude (const Vector<complex> & value,
                         Vector<float> & mag)
{
  ASSERT_SIZE(mag, value.size);

  for (size_t i = 0; i < mag.size; ++i) {
    mag[i] = std::abs(value[i]);
  }
}

//----( fftw wrappers )-------------------------------------------------------

namespace
{

// the fftw planner is not thread safe; only fftwf_execute is
Mutex g_planner_mutex;

fftwf_plan make_plan (size_t size, float * input, complex * output)
{
  ASSERT_LT(0, size);

  UniqueLock lock(g_planner_mutex);

  return fftwf_plan_dft_r2c_1d(size,
                               input,
                               reinterpret_cast<fftwf_complex*>(output),
                               FFTW_ESTIMATE);
}

void destroy_plan (fftwf_plan plan)
{
  UniqueLock lock(g_planner_mutex);

  fftwf_destroy_plan(plan);
}

} // anonymous namespace

//----( fast fourier transform classes )--------------------------------------

FFT_R2C::FFT_R2C (size_t size)
  : m_size(size),
    time_in(m_size),
    freq_out(m_size/2 + 1),
    m_fwd_plan(make_plan(m_size, time_in, freq_out))
{
  ASSERT(m_fwd_plan, "fftw failed to plan a real transform of size " << size);

  LOG1("initializing fft transform of size " << size);
}

FFT_R2C::~FFT_R2C ()
{
  destroy_plan(m_fwd_plan);
}

