#pragma once

#include <pthread.h>
#include <sched.h>

#include <cstdint>
#include <cstring>
#include <iostream>
#include <thread>

namespace affinity {
  /* pin the calling thread to a single core. failure is not fatal, the
   * worker just keeps running wherever the scheduler puts it */
  inline bool pin(uint32_t core) {
    const auto cores = std::thread::hardware_concurrency();
    if (cores == 0) {
      return false;
    }

    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(core % cores, &set);

    const auto err = pthread_setaffinity_np(pthread_self(), sizeof(set), &set);
    if (err != 0) {
      std::cerr << "Could not pin worker to core " << core << ": " << strerror(err) << std::endl;
      return false;
    }
    return true;
  }
}
