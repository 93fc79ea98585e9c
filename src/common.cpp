
#include "common.h"
#include <cstdio>
#include <cstring>
#include <ctime>
#include <sys/time.h>
#include <errno.h>

const char * vowelpad_logo =
" __ __  ___  __    __  ___  _     ____   ___  ____\n"
" | | | / _ \\ \\ \\/\\/ / | __|| |   |  _ \\ / _ \\|  _ \\  XY voice shaper\n"
" | V || (_) | \\    /  | _| | |__ |  _/ | (_) | |_| | for the D-Lev\n"
"  \\_/  \\___/   \\/\\/   |___||____||_|   |_| |_|____/";

//----( memory tools )--------------------------------------------------------

void * malloc_aligned (size_t size, size_t alignment)
{
  void * result = NULL;
  int info = posix_memalign(&result, alignment, size ? size : alignment);

  switch (info) {
    case 0: break;

    case ENOMEM:
      ERROR("malloc_aligned(" << size << ", " << alignment << ") failed"
          " due to lack of memory");
      break;

    case EINVAL:
      ERROR("malloc_aligned(" << size << ", " << alignment << ") failed"
          " with invalid alignment");
      break;

    default:
      ERROR("malloc_aligned(" << size << ", " << alignment << ") failed"
          " for unkown reason.\n\terror code = " << info);
  }

  return result;
}

void free_aligned (void * pointer) { free(pointer); }

void zero_bytes (void * x, size_t size)
{
  memset(x, 0, size);
}

//----( time )----------------------------------------------------------------

// time measurement
timeval g_begin_time, g_current_time;
const int g_time_is_available(gettimeofday(&g_begin_time, NULL));
inline void update_time () { gettimeofday(&g_current_time, NULL); }
double get_elapsed_time ()
{
  update_time();
  return g_current_time.tv_sec - g_begin_time.tv_sec
    + 1e-6 * (g_current_time.tv_usec - g_begin_time.tv_usec);
}

string get_date (bool hour)
{
  const size_t size = 20; // fits e.g. 2007-05-17-11-33
  char buff[size];

  time_t t = time(NULL);
  tm T;
  gmtime_r (&t,&T);
  if (hour) strftime(buff,size, "%Y-%m-%d-%H-%M", &T);
  else      strftime(buff,size, "%Y-%m-%d", &T);
  return buff;
}
