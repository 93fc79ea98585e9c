
#ifndef VOWELPAD_THREADS_H
#define VOWELPAD_THREADS_H

/** Threading wrappers.

  Everything here is the c++11 standard library;
  the aliases keep call sites independent of that choice.
*/

#include "common.h"
#include <mutex>

//----( mutexes )-------------------------------------------------------------

typedef std::mutex Mutex;
typedef std::unique_lock<std::mutex> UniqueLock;

#endif // VOWELPAD_THREADS_H

